#include "vidset/bounds.hpp"

namespace vidset {

bounds::bounds(time_type t1, time_type t2,
               spatial_type x1, spatial_type x2,
               spatial_type y1, spatial_type y2)
    : m_t(t1, t2)
    , m_x(x1, x2)
    , m_y(y1, y2)
{}

bool bounds::overlaps(const bounds& other) const {
    return m_t.overlaps(other.m_t)
            && m_x.overlaps(other.m_x)
            && m_y.overlaps(other.m_y);
}

bool bounds::contains(const bounds& other) const {
    return m_t.contains(other.m_t)
            && m_x.contains(other.m_x)
            && m_y.contains(other.m_y);
}

bounds bounds::span(const bounds& other) const {
    return { m_t.span(other.m_t), m_x.span(other.m_x), m_y.span(other.m_y) };
}

boost::optional<bounds> bounds::intersection(const bounds& other) const {
    auto t = m_t.intersection(other.m_t);
    auto x = m_x.intersection(other.m_x);
    auto y = m_y.intersection(other.m_y);
    if (!t || !x || !y) {
        return boost::none;
    }
    return bounds(*t, *x, *y);
}

bool bounds::equal_on(const bounds& other, axis axes) const {
    return (!has_axis(axes, axis::t) || m_t == other.m_t)
            && (!has_axis(axes, axis::x) || m_x == other.m_x)
            && (!has_axis(axes, axis::y) || m_y == other.m_y);
}

bool operator==(const bounds& a, const bounds& b) {
    return a.equal_on(b, axis::all);
}

bool operator!=(const bounds& a, const bounds& b) {
    return !(a == b);
}

std::ostream& operator<<(std::ostream& o, const bounds& b) {
    return o << "{t: " << b.t() << ", x: " << b.x() << ", y: " << b.y() << "}";
}

} // namespace vidset
