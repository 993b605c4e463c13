#include <catch.hpp>

#include "vidset/interval_set.hpp"
#include "vidset/predicates.hpp"

#include <tpie/progress_indicator_base.h>

#include <cmath>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vidset;

namespace {

struct scored {
    double score;
};

bool operator==(const scored& a, const scored& b) {
    return a.score == b.score;
}

std::ostream& operator<<(std::ostream& o, const scored& s) {
    return o << "{score: " << s.score << "}";
}

struct person_bike {
    scored person;
    scored bike;
};

bool operator==(const person_bike& a, const person_bike& b) {
    return a.person == b.person && a.bike == b.bike;
}

std::ostream& operator<<(std::ostream& o, const person_bike& p) {
    return o << "{person: " << p.person << ", bike: " << p.bike << "}";
}

auto merge_person_bike = [](const interval<scored>& a, const interval<scored>& b) {
    return a.merge(b, [](const scored& person, const scored& bike) {
        return person_bike{person, bike};
    });
};

interval<int> at_frame(time_type frame, int payload) {
    return interval<int>(bounds(frame, frame + 1, 0, 1, 0, 1), payload);
}

// Reference implementation: the full cross product, filtered
// by the window condition and the predicate.
template<typename Predicate, typename MergeOp>
auto naive_join(const interval_set<int>& left, const interval_set<int>& right,
                Predicate&& predicate, MergeOp&& merge_op, time_type window)
{
    using result_interval = decltype(merge_op(left[0], right[0]));

    std::vector<result_interval> result;
    for (const auto& a : left) {
        for (const auto& b : right) {
            const time_type start = a.get_bounds().t1();
            const bool in_window = std::isinf(window)
                    || (b.get_bounds().t1() >= start - window
                        && b.get_bounds().t1() <= start + window);
            if (in_window && predicate(a, b)) {
                result.push_back(merge_op(a, b));
            }
        }
    }
    return interval_set<typename result_interval::payload_type>(std::move(result));
}

interval_set<int> random_set(std::mt19937& rng, size_t size, int id_offset) {
    std::uniform_int_distribution<int> start_dist(0, 60);
    std::uniform_int_distribution<int> length_dist(0, 6);
    std::uniform_real_distribution<double> coord_dist(0.0, 1.0);

    std::vector<interval<int>> intervals;
    for (size_t i = 0; i < size; ++i) {
        const int t1 = start_dist(rng);
        const int t2 = t1 + length_dist(rng);
        double x1 = coord_dist(rng), x2 = coord_dist(rng);
        double y1 = coord_dist(rng), y2 = coord_dist(rng);
        if (x1 > x2) std::swap(x1, x2);
        if (y1 > y2) std::swap(y1, y2);
        intervals.emplace_back(bounds(t1, t2, x1, x2, y1, y2), id_offset + int(i));
    }
    return interval_set<int>(std::move(intervals));
}

class counting_progress : public tpie::progress_indicator_base {
public:
    counting_progress(): progress_indicator_base(0) {}

    void refresh() override {}
};

} // namespace

TEST_CASE("join of two detections in the same frame", "[join]") {
    interval_set<scored> persons{make_interval(bounds(0, 1, 0, 1, 0, 1), scored{0.9})};
    interval_set<scored> bikes{make_interval(bounds(0, 1, 0, 1, 0, 1), scored{0.7})};

    auto result = persons.join(bikes, on_t(equal()), merge_person_bike, 0);
    REQUIRE(result.size() == 1);
    CHECK(result[0].get_bounds().t() == time_extent(0, 1));
    CHECK(result[0].get_payload() == person_bike{scored{0.9}, scored{0.7}});
}

TEST_CASE("join outside of the window is empty", "[join]") {
    interval_set<int> left{at_frame(0, 1), at_frame(1, 2), at_frame(2, 3)};
    interval_set<int> right{at_frame(5, 4)};

    CHECK(left.join(right, on_t(equal()), span_and_pair(), 0).empty());

    // A window is only a search restriction, the predicate must still hold.
    CHECK(left.join(right, on_t(equal()), span_and_pair(), 10).empty());
    CHECK(left.join(right, on_t(before()), span_and_pair(), 10).size() == 3);
    CHECK(left.join(right, on_t(before()), span_and_pair(), 3).size() == 1);
}

TEST_CASE("join returns all matches in order", "[join]") {
    interval_set<int> left{at_frame(3, 1), at_frame(0, 2), at_frame(3, 3)};
    interval_set<int> right{at_frame(3, 10), at_frame(0, 11), at_frame(3, 12), at_frame(7, 13)};

    auto result = left.join(right, on_t(equal()), span_and_pair(), 0);

    std::vector<std::pair<int, int>> pairs;
    for (const auto& i : result) {
        pairs.emplace_back(i.get_payload().left, i.get_payload().right);
    }

    std::vector<std::pair<int, int>> expected{
        {1, 10}, {1, 12},
        {2, 11},
        {3, 10}, {3, 12},
    };
    CHECK(pairs == expected);
}

TEST_CASE("join with an unbounded window is the cross product", "[join]") {
    std::mt19937 rng(1234);
    const interval_set<int> left = random_set(rng, 17, 0);
    const interval_set<int> right = random_set(rng, 23, 1000);

    auto result = left.join(right, true_pred(), span_and_pair(), unbounded_window);
    REQUIRE(result.size() == left.size() * right.size());

    size_t index = 0;
    for (const auto& a : left) {
        for (const auto& b : right) {
            CHECK(result[index] == span_and_pair()(a, b));
            ++index;
        }
    }
}

TEST_CASE("windowed join matches the naive join", "[join]") {
    std::mt19937 rng(42);

    auto t_overlap = on_t(overlaps());
    auto overlap_3d = bounds_overlap();
    auto t_before = on_t(before(0, 5));

    const size_t sizes[] = {0, 1, 10, 150};
    const time_type windows[] = {0, 1, 2.5, 10, 100, unbounded_window};

    for (size_t left_size : sizes) {
        for (size_t right_size : sizes) {
            const interval_set<int> left = random_set(rng, left_size, 0);
            const interval_set<int> right = random_set(rng, right_size, 10000);

            for (time_type window : windows) {
                INFO("left = " << left_size << ", right = " << right_size << ", window = " << window);

                CHECK(left.join(right, t_overlap, span_and_pair(), window)
                      == naive_join(left, right, t_overlap, span_and_pair(), window));
                CHECK(left.join(right, overlap_3d, span_and_pair(), window)
                      == naive_join(left, right, overlap_3d, span_and_pair(), window));
                CHECK(left.join(right, t_before, span_and_pair(), window)
                      == naive_join(left, right, t_before, span_and_pair(), window));
            }
        }
    }
}

TEST_CASE("narrowing the window never adds matches", "[join]") {
    std::mt19937 rng(7);
    const interval_set<int> left = random_set(rng, 80, 0);
    const interval_set<int> right = random_set(rng, 80, 1000);

    auto predicate = on_t(overlaps());
    const size_t unbounded = left.join(right, predicate, span_and_pair(), unbounded_window).size();

    size_t previous = 0;
    for (time_type window : {0.0, 1.0, 3.0, 8.0, 30.0, 100.0}) {
        const size_t size = left.join(right, predicate, span_and_pair(), window).size();
        CHECK(size <= unbounded);
        CHECK(size >= previous);
        previous = size;
    }
}

TEST_CASE("join with invalid window", "[join]") {
    interval_set<int> set{at_frame(0, 1)};

    auto negative = [&] { return set.join(set, true_pred(), span_and_pair(), -1); };
    CHECK_THROWS_AS(negative(), std::invalid_argument);

    auto nan = [&] { return set.join(set, true_pred(), span_and_pair(), std::nan("")); };
    CHECK_THROWS_AS(nan(), std::invalid_argument);
}

TEST_CASE("join aborts on callback failures", "[join]") {
    interval_set<int> left{at_frame(0, 1), at_frame(1, 2)};
    interval_set<int> right{at_frame(0, 3), at_frame(1, 4)};

    SECTION("predicate") {
        auto run = [&] {
            return left.join(right, [](const interval<int>&, const interval<int>& b) -> bool {
                if (b.get_payload() == 4) {
                    throw std::runtime_error("predicate exploded");
                }
                return true;
            }, span_and_pair(), unbounded_window);
        };

        try {
            run();
            FAIL("expected an exception");
        } catch (const evaluation_error& e) {
            CHECK(std::string(e.what()).find("predicate exploded") != std::string::npos);
            CHECK_THROWS_AS(std::rethrow_if_nested(e), std::runtime_error);
        }
    }

    SECTION("merge operation") {
        auto run = [&] {
            return left.join(right, true_pred(), [](const interval<int>&, const interval<int>&) -> interval<int> {
                throw std::logic_error("merge exploded");
            }, 0);
        };
        CHECK_THROWS_AS(run(), evaluation_error);
    }
}

TEST_CASE("join reports progress", "[join]") {
    interval_set<int> left{at_frame(0, 1), at_frame(1, 2), at_frame(2, 3)};
    interval_set<int> right{at_frame(0, 4)};

    counting_progress progress;
    auto result = left.join(right, on_t(equal()), span_and_pair(), 0, &progress);
    CHECK(result.size() == 1);
    CHECK(progress.get_range() == 3);
    CHECK(progress.get_current() == 3);
}
