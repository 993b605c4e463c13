#ifndef VIDSET_INTERVAL_SET_MAPPING_HPP
#define VIDSET_INTERVAL_SET_MAPPING_HPP

#include "vidset/common.hpp"
#include "vidset/errors.hpp"
#include "vidset/interval_set.hpp"

#include <boost/range/adaptor/map.hpp>
#include <tpie/progress_indicator_base.h>

#include <initializer_list>
#include <map>
#include <ostream>
#include <utility>
#include <vector>

namespace vidset {

/// Maps partition keys (e.g. video ids) to interval sets.
///
/// Set level operations are applied to every partition independently.
/// Binary operations (join, ...) only combine sets stored under the same key.
/// Keys are kept in ascending order, which makes iteration
/// and all results deterministic.
template<typename Key, typename Payload>
class interval_set_mapping {
public:
    using key_type = Key;
    using payload_type = Payload;
    using set_type = interval_set<Payload>;

private:
    using storage_type = std::map<Key, set_type>;

public:
    using iterator = typename storage_type::const_iterator;
    using const_iterator = iterator;

public:
    interval_set_mapping() {}

    interval_set_mapping(std::initializer_list<typename storage_type::value_type> list)
        : m_sets(list)
    {}

    explicit interval_set_mapping(std::map<Key, set_type> sets)
        : m_sets(std::move(sets))
    {}

public:
    iterator begin() const { return m_sets.begin(); }
    iterator end() const { return m_sets.end(); }

    /// Returns the number of keys.
    size_t size() const { return m_sets.size(); }

    bool empty() const { return m_sets.empty(); }

    /// Returns the number of intervals over all keys.
    size_t total_size() const {
        size_t total = 0;
        for (const set_type& set : m_sets | boost::adaptors::map_values) {
            total += set.size();
        }
        return total;
    }

    bool contains(const Key& key) const {
        return m_sets.find(key) != m_sets.end();
    }

    /// Returns all keys in ascending order.
    std::vector<Key> keys() const {
        std::vector<Key> result;
        result.reserve(size());
        for (const Key& key : m_sets | boost::adaptors::map_keys) {
            result.push_back(key);
        }
        return result;
    }

    /// Returns the set stored under `key`.
    /// \throws key_not_found_error if there is no such key.
    const set_type& get(const Key& key) const {
        auto pos = m_sets.find(key);
        if (pos == m_sets.end()) {
            throw key_not_found_error("key not found in interval set mapping");
        }
        return pos->second;
    }

    /// Applies \ref interval_set::filter to every set.
    template<typename Predicate>
    interval_set_mapping filter(Predicate&& predicate) const {
        return transform_sets([&](const set_type& set) {
            return set.filter(predicate);
        });
    }

    /// Applies \ref interval_set::map to every set.
    template<typename Func>
    auto map(Func&& f) const {
        return transform_sets([&](const set_type& set) {
            return set.map(f);
        });
    }

    /// Applies \ref interval_set::map_payload to every set.
    template<typename Func>
    auto map_payload(Func&& f) const {
        return transform_sets([&](const set_type& set) {
            return set.map_payload(f);
        });
    }

    /// Applies \ref interval_set::coalesce to every set.
    template<typename PayloadMerge>
    interval_set_mapping coalesce(time_type epsilon, PayloadMerge&& merge_payload) const {
        return transform_sets([&](const set_type& set) {
            return set.coalesce(epsilon, merge_payload);
        });
    }

    /// Joins the sets of both mappings that share the same key.
    /// The keys of the result are the intersection of the keys
    /// of `*this` and `other`; keys that appear on only one side are dropped.
    ///
    /// See \ref interval_set::join for the meaning of the other parameters.
    /// The optional progress indicator is stepped once per joined key.
    template<typename OtherPayload, typename Predicate, typename MergeOp>
    auto join(const interval_set_mapping<Key, OtherPayload>& other,
              Predicate&& predicate, MergeOp&& merge_op,
              time_type window = unbounded_window,
              tpie::progress_indicator_base* progress = nullptr) const
    {
        return combine_shared(other, progress,
            [&](const set_type& a, const interval_set<OtherPayload>& b) {
                return a.join(b, predicate, merge_op, window);
            });
    }

    /// Applies \ref interval_set::filter_against to the sets that share the same key.
    /// Sets without a partner in `other` become empty (keys are preserved).
    template<typename OtherPayload, typename Predicate>
    interval_set_mapping filter_against(const interval_set_mapping<Key, OtherPayload>& other,
                                        Predicate&& predicate,
                                        time_type window = unbounded_window) const
    {
        return transform_entries([&](const Key& key, const set_type& set) {
            if (!other.contains(key)) {
                return set_type();
            }
            return set.filter_against(other.get(key), predicate, window);
        });
    }

    /// Returns a mapping that contains the keys of both mappings.
    /// Sets stored under a shared key are combined using \ref interval_set::union_with.
    interval_set_mapping union_with(const interval_set_mapping& other) const {
        storage_type result = m_sets;
        for (const auto& entry : other.m_sets) {
            auto pos = result.find(entry.first);
            if (pos == result.end()) {
                result.emplace(entry.first, entry.second);
            } else {
                pos->second = pos->second.union_with(entry.second);
            }
        }
        return interval_set_mapping(std::move(result));
    }

private:
    // Applies f to every set, keeping the keys.
    template<typename Func>
    auto transform_sets(Func&& f) const {
        return transform_entries([&](const Key&, const set_type& set) {
            return f(set);
        });
    }

    template<typename Func>
    auto transform_entries(Func&& f) const {
        using result_set = invoke_result_t<Func&, const Key&, const set_type&>;
        using result_mapping = interval_set_mapping<Key, typename result_set::payload_type>;

        std::map<Key, result_set> result;
        for (const auto& entry : m_sets) {
            result.emplace_hint(result.end(), entry.first, f(entry.first, entry.second));
        }
        return result_mapping(std::move(result));
    }

    // Applies f to every pair of sets with matching keys.
    template<typename OtherPayload, typename Func>
    auto combine_shared(const interval_set_mapping<Key, OtherPayload>& other,
                        tpie::progress_indicator_base* progress, Func&& f) const
    {
        using result_set = invoke_result_t<Func&, const set_type&, const interval_set<OtherPayload>&>;
        using result_mapping = interval_set_mapping<Key, typename result_set::payload_type>;

        std::vector<std::pair<const Key*, const set_type*>> shared;
        for (const auto& entry : m_sets) {
            if (other.contains(entry.first)) {
                shared.emplace_back(&entry.first, &entry.second);
            }
        }

        if (progress) {
            progress->init(shared.size());
        }

        std::map<Key, result_set> result;
        for (const auto& item : shared) {
            const Key& key = *item.first;
            result.emplace_hint(result.end(), key, f(*item.second, other.get(key)));
            if (progress) {
                progress->step();
            }
        }

        if (progress) {
            progress->done();
        }
        return result_mapping(std::move(result));
    }

private:
    friend bool operator==(const interval_set_mapping& a, const interval_set_mapping& b) {
        return a.m_sets == b.m_sets;
    }

    friend bool operator!=(const interval_set_mapping& a, const interval_set_mapping& b) {
        return !(a == b);
    }

    friend std::ostream& operator<<(std::ostream& o, const interval_set_mapping& m) {
        o << "{";
        bool first = true;
        for (const auto& entry : m) {
            if (!first) {
                o << ", ";
            }
            o << entry.first << ": " << entry.second;
            first = false;
        }
        o << "}";
        return o;
    }

private:
    storage_type m_sets;
};

} // namespace vidset

#endif // VIDSET_INTERVAL_SET_MAPPING_HPP
