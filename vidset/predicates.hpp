#ifndef VIDSET_PREDICATES_HPP
#define VIDSET_PREDICATES_HPP

#include "vidset/bounds.hpp"
#include "vidset/common.hpp"
#include "vidset/extent.hpp"

#include <cmath>
#include <limits>
#include <utility>

/// \file
/// Binary predicates for joins and filters.
///
/// Axis predicates compare two extents. They are lifted to bounding boxes
/// (or to anything that has a `get_bounds()` member, i.e. intervals) by
/// selecting an axis:
///
///     // Intervals that cover exactly the same time range.
///     auto same_frame = on_t(equal());
///
///     // Intervals that overlap in time and in space.
///     auto pred = and_pred(on_t(overlaps()), on_xy(overlaps()));

namespace vidset {

namespace detail {

inline const bounds& bounds_of(const bounds& b) { return b; }

template<typename T>
auto bounds_of(const T& t) -> decltype(t.get_bounds()) {
    return t.get_bounds();
}

} // namespace detail

/// --------------------------------------------------------
///     Axis predicates
/// --------------------------------------------------------

/// True if both extents are equal.
inline auto equal() {
    return [](const auto& a, const auto& b) {
        return a == b;
    };
}

/// True if the extents share a range of positive length.
inline auto overlaps() {
    return [](const auto& a, const auto& b) {
        return a.overlaps(b);
    };
}

/// True if `a` ends before `b` begins and the gap
/// `b.begin() - a.end()` lies within `[min_dist, max_dist]`.
inline auto before(double min_dist = 0,
                   double max_dist = std::numeric_limits<double>::infinity()) {
    return [=](const auto& a, const auto& b) {
        const double gap = b.begin() - a.end();
        return gap >= min_dist && gap <= max_dist;
    };
}

/// Mirror image of \ref before.
inline auto after(double min_dist = 0,
                  double max_dist = std::numeric_limits<double>::infinity()) {
    return [p = before(min_dist, max_dist)](const auto& a, const auto& b) {
        return p(b, a);
    };
}

/// True if `a` lies completely within `b`.
inline auto during() {
    return [](const auto& a, const auto& b) {
        return b.contains(a);
    };
}

/// True if `a` completely contains `b`.
inline auto contains() {
    return [](const auto& a, const auto& b) {
        return a.contains(b);
    };
}

/// True if both extents begin at the same point (up to `epsilon`).
inline auto starts(double epsilon = 0) {
    return [=](const auto& a, const auto& b) {
        return std::abs(a.begin() - b.begin()) <= epsilon;
    };
}

/// True if both extents end at the same point (up to `epsilon`).
inline auto finishes(double epsilon = 0) {
    return [=](const auto& a, const auto& b) {
        return std::abs(a.end() - b.end()) <= epsilon;
    };
}

/// True if `b` begins where `a` ends (up to `epsilon`).
inline auto meets_before(double epsilon = 0) {
    return [=](const auto& a, const auto& b) {
        return std::abs(b.begin() - a.end()) <= epsilon;
    };
}

/// True if `a` begins where `b` ends (up to `epsilon`).
inline auto meets_after(double epsilon = 0) {
    return [=](const auto& a, const auto& b) {
        return std::abs(a.begin() - b.end()) <= epsilon;
    };
}

/// --------------------------------------------------------
///     Lifting to bounding boxes
/// --------------------------------------------------------

/// Applies the axis predicate to the time extents.
template<typename AxisPredicate>
auto on_t(AxisPredicate p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        return p(detail::bounds_of(a).t(), detail::bounds_of(b).t());
    };
}

/// Applies the axis predicate to the x extents.
template<typename AxisPredicate>
auto on_x(AxisPredicate p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        return p(detail::bounds_of(a).x(), detail::bounds_of(b).x());
    };
}

/// Applies the axis predicate to the y extents.
template<typename AxisPredicate>
auto on_y(AxisPredicate p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        return p(detail::bounds_of(a).y(), detail::bounds_of(b).y());
    };
}

/// True if the axis predicate holds for both spatial axes.
template<typename AxisPredicate>
auto on_xy(AxisPredicate p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        const bounds& ba = detail::bounds_of(a);
        const bounds& bb = detail::bounds_of(b);
        return p(ba.x(), bb.x()) && p(ba.y(), bb.y());
    };
}

/// Applies a predicate on whole bounding boxes.
template<typename BoundsPredicate>
auto on_bounds(BoundsPredicate p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        return p(detail::bounds_of(a), detail::bounds_of(b));
    };
}

/// True if the boxes overlap on all three axes.
inline auto bounds_overlap() {
    return on_bounds([](const bounds& a, const bounds& b) {
        return a.overlaps(b);
    });
}

/// True if the boxes are equal on the selected axes.
inline auto equal_on(axis axes) {
    return on_bounds([=](const bounds& a, const bounds& b) {
        return a.equal_on(b, axes);
    });
}

/// --------------------------------------------------------
///     Combinators
/// --------------------------------------------------------

/// Accepts every pair.
inline auto true_pred() {
    return [](const auto&, const auto&) {
        return true;
    };
}

/// Conjunction of two binary predicates (short circuiting).
template<typename P, typename Q>
auto and_pred(P p, Q q) {
    return [p = std::move(p), q = std::move(q)](const auto& a, const auto& b) {
        return p(a, b) && q(a, b);
    };
}

/// Disjunction of two binary predicates (short circuiting).
template<typename P, typename Q>
auto or_pred(P p, Q q) {
    return [p = std::move(p), q = std::move(q)](const auto& a, const auto& b) {
        return p(a, b) || q(a, b);
    };
}

/// Negation of a binary predicate.
template<typename P>
auto not_pred(P p) {
    return [p = std::move(p)](const auto& a, const auto& b) {
        return !p(a, b);
    };
}

} // namespace vidset

#endif // VIDSET_PREDICATES_HPP
