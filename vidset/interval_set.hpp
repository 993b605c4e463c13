#ifndef VIDSET_INTERVAL_SET_HPP
#define VIDSET_INTERVAL_SET_HPP

#include "vidset/common.hpp"
#include "vidset/errors.hpp"
#include "vidset/interval.hpp"
#include "vidset/type_traits.hpp"

#include <fmt/format.h>
#include <tpie/progress_indicator_base.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <initializer_list>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <vector>

namespace vidset {

/// Pass this as the window of a join to disable the time locality
/// restriction. Every pair of intervals will be tested.
constexpr time_type unbounded_window = std::numeric_limits<time_type>::infinity();

namespace detail {

    /// Invokes a user supplied callback. Exceptions thrown by the callback
    /// are rethrown as an \ref evaluation_error that nests the original exception.
    template<typename Func, typename... Args>
    decltype(auto) invoke_checked(const char* what, Func& f, const Args&... args) {
        try {
            return f(args...);
        } catch (const std::exception& e) {
            std::throw_with_nested(evaluation_error(fmt::format("{} failed: {}", what, e.what())));
        } catch (...) {
            std::throw_with_nested(evaluation_error(fmt::format("{} failed", what)));
        }
    }

    inline void check_window(time_type window) {
        if (std::isnan(window) || window < 0) {
            throw std::invalid_argument(fmt::format("invalid join window: {}", window));
        }
    }

    /// An index over the start times of a sequence of intervals.
    /// Entries are sorted by (start time, position), which allows
    /// to find all intervals that start within a given time range
    /// using binary search.
    class start_index {
        struct entry {
            time_type start;
            size_t position;
        };

    public:
        template<typename IntervalRange>
        explicit start_index(const IntervalRange& intervals) {
            m_entries.reserve(intervals.size());
            size_t position = 0;
            for (const auto& i : intervals) {
                m_entries.push_back(entry{i.get_bounds().t1(), position++});
            }
            std::sort(m_entries.begin(), m_entries.end(), [](const entry& a, const entry& b) {
                return a.start < b.start || (a.start == b.start && a.position < b.position);
            });
        }

        /// Puts the positions of all intervals with `lo <= start <= hi`
        /// into `positions`, in ascending order.
        ///
        /// Runtime complexity: O(log n + k * log k) where k is the number of results.
        void query(time_type lo, time_type hi, std::vector<size_t>& positions) const {
            Expects(lo <= hi);

            positions.clear();
            const auto first = std::lower_bound(m_entries.begin(), m_entries.end(), lo,
                [](const entry& e, time_type t) { return e.start < t; });
            const auto last = std::upper_bound(first, m_entries.end(), hi,
                [](time_type t, const entry& e) { return t < e.start; });
            for (auto pos = first; pos != last; ++pos) {
                positions.push_back(pos->position);
            }
            std::sort(positions.begin(), positions.end());
        }

    private:
        std::vector<entry> m_entries;
    };

    /// Plane sweep over all candidate pairs of a join.
    ///
    /// Invokes `cb(a, b)` for every `a` in `left` (in order) and every `b`
    /// in `right` (in order) with `a.t1 - window <= b.t1 <= a.t1 + window`.
    /// When `cb` returns false, the remaining candidates of the current `a`
    /// are skipped.
    ///
    /// If the window is unbounded, all pairs are visited.
    /// Otherwise the right side is indexed by start time and only the
    /// candidates within the window are visited.
    ///
    /// Runtime complexity: O(m log m + n log m + k log k) where k
    /// is the number of visited candidates.
    template<typename LeftRange, typename RightRange, typename Callback>
    void sweep_candidates(const LeftRange& left, const RightRange& right, time_type window,
                          tpie::progress_indicator_base* progress, Callback&& cb)
    {
        check_window(window);

        if (progress) {
            progress->init(left.size());
        }

        if (std::isinf(window)) {
            for (const auto& a : left) {
                for (const auto& b : right) {
                    if (!cb(a, b)) {
                        break;
                    }
                }
                if (progress) {
                    progress->step();
                }
            }
        } else {
            start_index index(right);
            std::vector<size_t> candidates;
            for (const auto& a : left) {
                const time_type start = a.get_bounds().t1();
                index.query(start - window, start + window, candidates);
                for (size_t pos : candidates) {
                    if (!cb(a, right[pos])) {
                        break;
                    }
                }
                if (progress) {
                    progress->step();
                }
            }
        }

        if (progress) {
            progress->done();
        }
    }

    template<typename IntervalVector>
    void sort_by_start(IntervalVector& intervals) {
        std::stable_sort(intervals.begin(), intervals.end(), [](const auto& a, const auto& b) {
            return a.get_bounds().t1() < b.get_bounds().t1();
        });
    }

} // namespace detail

/// An ordered collection of intervals with the same payload type.
///
/// Interval sets are immutable values: all operations (filter, map, join, ...)
/// return new sets and never modify their input. The order of the intervals
/// is the order of construction unless stated otherwise; duplicates are allowed.
template<typename Payload>
class interval_set {
public:
    using interval_type = interval<Payload>;
    using payload_type = Payload;

private:
    using storage_type = std::vector<interval_type>;

public:
    using iterator = typename storage_type::const_iterator;
    using const_iterator = iterator;

public:
    /// Creates an empty interval set.
    interval_set() {}

    interval_set(std::initializer_list<interval_type> list)
        : m_intervals(list)
    {}

    template<typename FwdIterator>
    interval_set(FwdIterator first, FwdIterator last)
        : m_intervals(first, last)
    {}

    explicit interval_set(std::vector<interval_type> intervals)
        : m_intervals(std::move(intervals))
    {}

public:
    iterator begin() const { return m_intervals.begin(); }
    iterator end() const { return m_intervals.end(); }

    /// Returns the interval at the given index.
    /// \pre `index < size()`.
    const interval_type& operator[](size_t index) const {
        vidset_assert(index < size(), "index out of bounds");
        return m_intervals[index];
    }

    bool empty() const { return m_intervals.empty(); }

    size_t size() const { return m_intervals.size(); }

    /// Returns a new set with all intervals for which `predicate(i)` is true.
    /// The relative order of the intervals is preserved.
    template<typename Predicate>
    interval_set filter(Predicate&& predicate) const {
        storage_type result;
        for (const interval_type& i : m_intervals) {
            if (detail::invoke_checked("filter predicate", predicate, i)) {
                result.push_back(i);
            }
        }
        return interval_set(std::move(result));
    }

    /// Returns a new set that contains `f(i)` for every interval `i`.
    /// `f` must return an interval, its payload type may differ
    /// from the payload type of this set.
    template<typename Func>
    auto map(Func&& f) const {
        using result_interval = invoke_result_t<Func&, const interval_type&>;
        static_assert(is_specialization_of<result_interval, interval>::value,
                      "the function must return an interval");

        std::vector<result_interval> result;
        result.reserve(size());
        for (const interval_type& i : m_intervals) {
            result.push_back(detail::invoke_checked("map function", f, i));
        }
        return interval_set<typename result_interval::payload_type>(std::move(result));
    }

    /// Transforms the payload of every interval, keeping the bounds.
    template<typename Func>
    auto map_payload(Func&& f) const {
        using result_payload = invoke_result_t<Func&, const Payload&>;

        std::vector<interval<result_payload>> result;
        result.reserve(size());
        for (const interval_type& i : m_intervals) {
            result.emplace_back(i.get_bounds(),
                                detail::invoke_checked("payload function", f, i.get_payload()));
        }
        return interval_set<result_payload>(std::move(result));
    }

    /// Left fold over all intervals: `acc = f(acc, i)`.
    template<typename T, typename Func>
    T fold(T init, Func&& f) const {
        T acc = std::move(init);
        for (const interval_type& i : m_intervals) {
            acc = detail::invoke_checked("fold function", f, acc, i);
        }
        return acc;
    }

    /// Joins `*this` with `other`.
    ///
    /// For every pair `(a, b)` with `a` from `*this` and `b` from `other` where
    ///
    ///     a.t1 - window <= b.t1 <= a.t1 + window   and   predicate(a, b)
    ///
    /// holds, the interval `merge_op(a, b)` will be part of the result.
    /// Results are ordered by the position of `a` first and by the position of `b` second.
    ///
    /// The window restricts the search to intervals that start close to each other,
    /// which makes the join cheap for local predicates. Use \ref unbounded_window
    /// to test every pair.
    ///
    /// \param progress
    ///     An optional progress indicator. It will be stepped
    ///     once for every interval in `*this`.
    /// \throws evaluation_error if `predicate` or `merge_op` throw. The join
    ///         is aborted and no result is produced.
    /// \throws std::invalid_argument if the window is negative.
    template<typename OtherPayload, typename Predicate, typename MergeOp>
    auto join(const interval_set<OtherPayload>& other, Predicate&& predicate, MergeOp&& merge_op,
              time_type window = unbounded_window,
              tpie::progress_indicator_base* progress = nullptr) const
    {
        using other_interval = interval<OtherPayload>;
        using result_interval = invoke_result_t<MergeOp&, const interval_type&, const other_interval&>;
        static_assert(is_specialization_of<result_interval, interval>::value,
                      "merge_op must return an interval");

        std::vector<result_interval> result;
        detail::sweep_candidates(*this, other, window, progress,
            [&](const interval_type& a, const other_interval& b) {
                if (detail::invoke_checked("join predicate", predicate, a, b)) {
                    result.push_back(detail::invoke_checked("join merge operation", merge_op, a, b));
                }
                return true;
            });
        return interval_set<typename result_interval::payload_type>(std::move(result));
    }

    /// Returns all intervals of `*this` that have at least one join partner
    /// in `other`, i.e. there is an interval `b` in `other` that would be matched
    /// by \ref join() with the same predicate and window.
    /// Order is preserved and every interval is kept at most once.
    template<typename OtherPayload, typename Predicate>
    interval_set filter_against(const interval_set<OtherPayload>& other, Predicate&& predicate,
                                time_type window = unbounded_window,
                                tpie::progress_indicator_base* progress = nullptr) const
    {
        storage_type result;
        detail::sweep_candidates(*this, other, window, progress,
            [&](const interval_type& a, const interval<OtherPayload>& b) {
                if (detail::invoke_checked("filter predicate", predicate, a, b)) {
                    result.push_back(a);
                    return false;
                }
                return true;
            });
        return interval_set(std::move(result));
    }

    /// Returns the intervals of both sets, ordered by their start time.
    /// For equal start times, intervals of `*this` come first and
    /// the relative order within each set is preserved.
    interval_set union_with(const interval_set& other) const {
        storage_type result;
        result.reserve(size() + other.size());
        result.insert(result.end(), m_intervals.begin(), m_intervals.end());
        result.insert(result.end(), other.m_intervals.begin(), other.m_intervals.end());
        detail::sort_by_start(result);
        return interval_set(std::move(result));
    }

    /// Returns a copy of this set (stable) sorted by start time.
    interval_set sorted() const {
        storage_type result = m_intervals;
        detail::sort_by_start(result);
        return interval_set(std::move(result));
    }

    /// Merges intervals whose time extents overlap or are at most `epsilon` apart.
    /// Merged intervals span all of their parts and their payloads
    /// are combined from left to right using `merge_payload(acc, next)`.
    /// The result is sorted by start time.
    ///
    /// For example, coalescing the per-frame detections of an object
    /// yields one interval for every continuous appearance.
    template<typename PayloadMerge>
    interval_set coalesce(time_type epsilon, PayloadMerge&& merge_payload) const {
        if (std::isnan(epsilon) || epsilon < 0) {
            throw std::invalid_argument(fmt::format("invalid coalesce epsilon: {}", epsilon));
        }

        storage_type result;
        for (const interval_type& i : sorted()) {
            if (!result.empty()
                    && i.get_bounds().t1() <= result.back().get_bounds().t2() + epsilon) {
                const interval_type& last = result.back();
                result.back() = interval_type(
                        last.get_bounds().span(i.get_bounds()),
                        detail::invoke_checked("coalesce merge", merge_payload,
                                               last.get_payload(), i.get_payload()));
            } else {
                result.push_back(i);
            }
        }
        return interval_set(std::move(result));
    }

private:
    friend bool operator==(const interval_set& a, const interval_set& b) {
        return a.m_intervals == b.m_intervals;
    }

    friend bool operator!=(const interval_set& a, const interval_set& b) {
        return !(a == b);
    }

    friend std::ostream& operator<<(std::ostream& o, const interval_set& set) {
        o << "{";
        bool first = true;
        for (const interval_type& i : set) {
            if (!first) {
                o << ", ";
            }
            o << i;
            first = false;
        }
        o << "}";
        return o;
    }

private:
    storage_type m_intervals;
};

} // namespace vidset

#endif // VIDSET_INTERVAL_SET_HPP
