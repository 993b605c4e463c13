#ifndef VIDSET_INTERVAL_HPP
#define VIDSET_INTERVAL_HPP

#include "vidset/bounds.hpp"
#include "vidset/common.hpp"
#include "vidset/type_traits.hpp"

#include <ostream>
#include <utility>

namespace vidset {

/// A spatio-temporal interval: a bounding box together with
/// an arbitrary payload (e.g. the class and the score of a detection).
///
/// Intervals are immutable. Operations that combine or
/// transform intervals always return new instances.
template<typename Payload>
class interval {
public:
    using payload_type = Payload;

public:
    interval(const bounds& b, Payload payload)
        : m_bounds(b)
        , m_payload(std::move(payload))
    {}

    const bounds& get_bounds() const { return m_bounds; }

    const Payload& get_payload() const { return m_payload; }

    /// Combines `*this` and `other` into a new interval.
    /// The resulting bounding box is the span of both boxes,
    /// the payload is `merge_payload(get_payload(), other.get_payload())`.
    template<typename OtherPayload, typename PayloadMerge>
    auto merge(const interval<OtherPayload>& other, PayloadMerge&& merge_payload) const {
        return merge(other, std::forward<PayloadMerge>(merge_payload),
                     [](const bounds& a, const bounds& b) { return a.span(b); });
    }

    /// Like \ref merge(), but the bounding boxes are combined
    /// using `merge_bounds`.
    template<typename OtherPayload, typename PayloadMerge, typename BoundsMerge>
    auto merge(const interval<OtherPayload>& other,
               PayloadMerge&& merge_payload, BoundsMerge&& merge_bounds) const
    {
        using result_payload = invoke_result_t<PayloadMerge&, const Payload&, const OtherPayload&>;
        return interval<result_payload>(merge_bounds(m_bounds, other.get_bounds()),
                                        merge_payload(m_payload, other.get_payload()));
    }

    /// Returns an interval with the same bounds and a transformed payload.
    template<typename Func>
    auto map_payload(Func&& f) const {
        using result_payload = invoke_result_t<Func&, const Payload&>;
        return interval<result_payload>(m_bounds, f(m_payload));
    }

    /// Returns an interval with the same payload and different bounds.
    interval with_bounds(const bounds& b) const {
        return interval(b, m_payload);
    }

private:
    bounds m_bounds;
    Payload m_payload;
};

/// Deduces the payload type of the new interval.
template<typename Payload>
interval<std::decay_t<Payload>> make_interval(const bounds& b, Payload&& payload) {
    return interval<std::decay_t<Payload>>(b, std::forward<Payload>(payload));
}

template<typename Payload>
bool operator==(const interval<Payload>& a, const interval<Payload>& b) {
    return a.get_bounds() == b.get_bounds() && a.get_payload() == b.get_payload();
}

template<typename Payload>
bool operator!=(const interval<Payload>& a, const interval<Payload>& b) {
    return !(a == b);
}

template<typename Payload>
std::ostream& operator<<(std::ostream& o, const interval<Payload>& i) {
    return o << "{bounds: " << i.get_bounds() << ", payload: " << i.get_payload() << "}";
}

/// Payload of a joined interval: the payloads of both partners.
template<typename Left, typename Right>
struct pair_payload {
    Left left;
    Right right;
};

template<typename Left, typename Right>
bool operator==(const pair_payload<Left, Right>& a, const pair_payload<Left, Right>& b) {
    return a.left == b.left && a.right == b.right;
}

template<typename Left, typename Right>
bool operator!=(const pair_payload<Left, Right>& a, const pair_payload<Left, Right>& b) {
    return !(a == b);
}

template<typename Left, typename Right>
std::ostream& operator<<(std::ostream& o, const pair_payload<Left, Right>& p) {
    return o << "{left: " << p.left << ", right: " << p.right << "}";
}

/// A merge operation for joins: spans both bounding boxes and
/// keeps both payloads as a \ref pair_payload.
inline auto span_and_pair() {
    return [](const auto& a, const auto& b) {
        return a.merge(b, [](const auto& p, const auto& q) {
            using left_type = std::decay_t<decltype(p)>;
            using right_type = std::decay_t<decltype(q)>;
            return pair_payload<left_type, right_type>{p, q};
        });
    };
}

} // namespace vidset

#endif // VIDSET_INTERVAL_HPP
