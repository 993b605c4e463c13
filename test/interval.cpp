#include <catch.hpp>

#include "vidset/interval.hpp"

#include <ostream>
#include <string>

using namespace vidset;

namespace {

struct label {
    std::string name;
};

bool operator==(const label& a, const label& b) {
    return a.name == b.name;
}

std::ostream& operator<<(std::ostream& o, const label& l) {
    return o << l.name;
}

} // namespace

TEST_CASE("interval accessors", "[interval]") {
    interval<label> i(bounds(1, 2, 0, 1, 0, 1), label{"person"});

    CHECK(i.get_bounds() == bounds(1, 2, 0, 1, 0, 1));
    CHECK(i.get_payload().name == "person");
    CHECK(i == i);
    CHECK(i != i.with_bounds(bounds(1, 3, 0, 1, 0, 1)));
}

TEST_CASE("interval merge", "[interval]") {
    auto a = make_interval(bounds(0, 1, 0.0, 0.5, 0.0, 0.5), label{"person"});
    auto b = make_interval(bounds(2, 3, 0.25, 1.0, 0.25, 0.75), 7);

    SECTION("span of bounds") {
        auto m = a.merge(b, [](const label& l, int n) {
            return l.name + "/" + std::to_string(n);
        });
        CHECK(m.get_bounds() == bounds(0, 3, 0.0, 1.0, 0.0, 0.75));
        CHECK(m.get_payload() == "person/7");
    }

    SECTION("custom bounds combiner") {
        auto m = a.merge(b,
            [](const label& l, int) { return l; },
            [](const bounds& x, const bounds&) { return x; });
        CHECK(m.get_bounds() == a.get_bounds());
        CHECK(m.get_payload() == a.get_payload());
    }

    SECTION("pair payload") {
        auto m = span_and_pair()(a, b);
        CHECK(m.get_bounds() == a.get_bounds().span(b.get_bounds()));
        CHECK(m.get_payload().left == label{"person"});
        CHECK(m.get_payload().right == 7);
    }

    // Inputs are unchanged.
    CHECK(a.get_bounds() == bounds(0, 1, 0.0, 0.5, 0.0, 0.5));
    CHECK(b.get_payload() == 7);
}

TEST_CASE("interval payload mapping", "[interval]") {
    auto i = make_interval(bounds(0, 1, 0, 1, 0, 1), 21);
    auto doubled = i.map_payload([](int n) { return n * 2.0; });

    CHECK(doubled.get_bounds() == i.get_bounds());
    CHECK(doubled.get_payload() == 42.0);
}
