#ifndef VIDSET_BOUNDS_HPP
#define VIDSET_BOUNDS_HPP

#include "vidset/common.hpp"
#include "vidset/extent.hpp"

#include <boost/optional.hpp>

#include <ostream>

namespace vidset {

/// Selects a subset of the axes of a bounding box.
/// Values can be combined with `|`.
enum class axis : unsigned {
    t = 1,
    x = 2,
    y = 4,
    xy = x | y,
    all = t | x | y,
};

inline axis operator|(axis a, axis b) {
    return static_cast<axis>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

inline bool has_axis(axis set, axis a) {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(a)) != 0;
}

/// A 3-dimensional box that encompasses a spatio-temporal object:
/// a time range `[t1, t2)` and a spatial rectangle `[x1, x2) x [y1, y2)`.
///
/// Instances are immutable, every operation returns a new box.
class bounds {
public:
    /// Constructs the empty box at the origin.
    bounds() = default;

    /// Constructs a box from its six coordinates.
    /// \throws invalid_bounds_error if `t1 > t2`, `x1 > x2` or `y1 > y2`.
    bounds(time_type t1, time_type t2,
           spatial_type x1, spatial_type x2,
           spatial_type y1, spatial_type y2);

    /// Constructs a box from the extents of its axes.
    bounds(const time_extent& t, const spatial_extent& x, const spatial_extent& y)
        : m_t(t), m_x(x), m_y(y)
    {}

    const time_extent& t() const { return m_t; }
    const spatial_extent& x() const { return m_x; }
    const spatial_extent& y() const { return m_y; }

    time_type t1() const { return m_t.begin(); }
    time_type t2() const { return m_t.end(); }
    spatial_type x1() const { return m_x.begin(); }
    spatial_type x2() const { return m_x.end(); }
    spatial_type y1() const { return m_y.begin(); }
    spatial_type y2() const { return m_y.end(); }

    time_type duration() const { return m_t.length(); }

    /// Area of the spatial rectangle.
    spatial_type area() const { return m_x.length() * m_y.length(); }

    double volume() const { return double(duration()) * double(area()); }

    /// Returns true if all three axes overlap (see \ref extent::overlaps).
    bool overlaps(const bounds& other) const;

    /// Returns true if this box fully contains `other`.
    bool contains(const bounds& other) const;

    /// Returns the minimum box that contains both `*this` and `other`.
    bounds span(const bounds& other) const;

    /// Returns the intersection of `*this` and `other`, if they overlap.
    boost::optional<bounds> intersection(const bounds& other) const;

    /// Returns true if both boxes have equal extents on every
    /// axis selected by `axes`. Other axes are ignored.
    bool equal_on(const bounds& other, axis axes) const;

private:
    time_extent m_t;
    spatial_extent m_x;
    spatial_extent m_y;
};

bool operator==(const bounds& a, const bounds& b);
bool operator!=(const bounds& a, const bounds& b);

std::ostream& operator<<(std::ostream& o, const bounds& b);

} // namespace vidset

#endif // VIDSET_BOUNDS_HPP
