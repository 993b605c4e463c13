#ifndef VIDSET_EXTENT_HPP
#define VIDSET_EXTENT_HPP

#include "vidset/common.hpp"
#include "vidset/errors.hpp"

#include <boost/optional.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <ostream>

/// \file
/// Contains the one-dimensional range type used for every axis of a bounding box.

namespace vidset {

/// A half-open range `[begin, end)` on a single axis.
/// The end point is not part of the range, which means that
/// the frame `f` is represented by `[f, f + 1)`.
/// Ranges of length zero are allowed but contain no point
/// and overlap nothing.
template<typename T>
class extent {
public:
    using value_type = T;

public:
    /// Equivalent to `extent(0, 0)`.
    extent(): m_begin(0), m_end(0) {}

    /// Constructs a new extent with the given `begin` and `end`.
    /// \throws invalid_bounds_error if `begin > end` or if one of
    ///         the values is not a number.
    extent(T begin, T end): m_begin(begin), m_end(end) {
        if (!(begin <= end)) {
            throw invalid_bounds_error(fmt::format(
                "invalid extent [{}, {}): begin must not be greater than end", begin, end));
        }
    }

    /// Returns the (inclusive) begin of the extent.
    T begin() const { return m_begin; }

    /// Returns the (exclusive) end of the extent.
    T end() const { return m_end; }

    T length() const { return m_end - m_begin; }

    /// Returns true if the extent has length zero.
    bool empty() const { return m_begin == m_end; }

    /// Returns true iff `begin() <= point < end()`.
    bool contains(T point) const {
        return point >= m_begin && point < m_end;
    }

    /// Returns true if this extent contains the other extent.
    bool contains(const extent& other) const {
        return other.m_begin >= m_begin && other.m_end <= m_end;
    }

    /// Returns true if this extent and `other` share a
    /// range of positive length.
    bool overlaps(const extent& other) const {
        return m_begin < other.m_end && other.m_begin < m_end;
    }

    /// Returns the smallest extent that contains both `*this` and `other`.
    extent span(const extent& other) const {
        return { std::min(m_begin, other.m_begin), std::max(m_end, other.m_end) };
    }

    /// Returns the common part of both extents, or nothing
    /// if they do not overlap.
    boost::optional<extent> intersection(const extent& other) const {
        if (!overlaps(other)) {
            return boost::none;
        }
        return extent(std::max(m_begin, other.m_begin), std::min(m_end, other.m_end));
    }

private:
    T m_begin;
    T m_end;
};

template<typename T>
bool operator==(const extent<T>& a, const extent<T>& b) {
    return a.begin() == b.begin() && a.end() == b.end();
}

template<typename T>
bool operator!=(const extent<T>& a, const extent<T>& b) {
    return !(a == b);
}

template<typename T>
std::ostream& operator<<(std::ostream& o, const extent<T>& e) {
    return o << "[" << e.begin() << ", " << e.end() << ")";
}

using time_extent = extent<time_type>;
using spatial_extent = extent<spatial_type>;

} // namespace vidset

#endif // VIDSET_EXTENT_HPP
