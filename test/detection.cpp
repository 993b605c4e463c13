#include <catch.hpp>

#include "vidset/detection.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vidset;

namespace {

object_detection object(const std::string& category, double score, bool detected) {
    object_detection o;
    o.category = category;
    o.payload.score = score;
    o.payload.detected = detected;
    return o;
}

frame_record frame(video_id video, frame_index index, std::vector<object_detection> objects) {
    frame_record r;
    r.video = video;
    r.frame = index;
    r.objects = std::move(objects);
    return r;
}

} // namespace

TEST_CASE("category mappings from frame records", "[detection]") {
    std::vector<frame_record> records{
        frame(0, 0, {object("person", 0.9, true), object("dog", 0.1, false)}),
        frame(0, 1, {object("person", 0.8, true)}),
        frame(1, 7, {object("dog", 0.6, true)}),
    };

    category_mappings m = build_category_mappings(records);
    REQUIRE(m.size() == 2);
    REQUIRE(m.count("person") == 1);
    REQUIRE(m.count("dog") == 1);

    const detection_mapping& persons = m.at("person");
    CHECK(persons.keys() == std::vector<video_id>{0});

    const detection_set& set = persons.get(0);
    REQUIRE(set.size() == 2);
    CHECK(set[0].get_bounds() == bounds(0, 1, 0, 1, 0, 1));
    CHECK(set[0].get_payload() == detection{0.9, true});
    CHECK(set[1].get_bounds() == bounds(1, 2, 0, 1, 0, 1));
    CHECK(set[1].get_payload() == detection{0.8, true});

    const detection_mapping& dogs = m.at("dog");
    CHECK(dogs.keys() == std::vector<video_id>{0, 1});
    CHECK(dogs.get(0)[0].get_payload() == detection{0.1, false});
    CHECK(dogs.get(1)[0].get_bounds().t() == time_extent(7, 8));
}

TEST_CASE("frame duration scales the time axis", "[detection]") {
    object_detection o = object("car", 0.5, true);
    o.x = spatial_extent(0.25, 0.5);
    o.y = spatial_extent(0.1, 0.2);

    category_mappings m = build_category_mappings({frame(3, 10, {o})}, 0.04);
    const auto& i = m.at("car").get(3)[0];
    CHECK(i.get_bounds().t1() == Approx(0.4));
    CHECK(i.get_bounds().t2() == Approx(0.44));
    CHECK(i.get_bounds().x() == spatial_extent(0.25, 0.5));
    CHECK(i.get_bounds().y() == spatial_extent(0.1, 0.2));
}

TEST_CASE("empty records produce no categories", "[detection]") {
    CHECK(build_category_mappings({}).empty());
    CHECK(build_category_mappings({frame(0, 0, {})}).empty());
}

TEST_CASE("invalid frame duration", "[detection]") {
    std::vector<frame_record> records{frame(0, 0, {object("person", 1, true)})};

    CHECK_THROWS_AS(build_category_mappings(records, 0), std::invalid_argument);
    CHECK_THROWS_AS(build_category_mappings(records, -1), std::invalid_argument);
    CHECK_THROWS_AS(build_category_mappings(records, std::nan("")), std::invalid_argument);
}
