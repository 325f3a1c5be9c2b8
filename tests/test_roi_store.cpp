// ROI store validation and copy semantics
#include <catch2/catch_test_macros.hpp>
#include "core/roi_store.hpp"

#include <stdexcept>

using namespace wms;

TEST_CASE("RoiStore add accepts valid regions in order") {
    RoiStore store;
    store.add({0, 0, 10, 10});
    store.add({5, 6, 7, 8});
    REQUIRE(store.size() == 2);
    auto rois = store.list();
    REQUIRE(rois[0] == Roi{0, 0, 10, 10});
    REQUIRE(rois[1] == Roi{5, 6, 7, 8});
}

TEST_CASE("RoiStore add rejects negative origin and empty size") {
    RoiStore store;
    REQUIRE_THROWS_AS(store.add({-1, 0, 10, 10}), std::invalid_argument);
    REQUIRE_THROWS_AS(store.add({0, -1, 10, 10}), std::invalid_argument);
    REQUIRE_THROWS_AS(store.add({0, 0, 0, 10}), std::invalid_argument);
    REQUIRE_THROWS_AS(store.add({0, 0, 10, 0}), std::invalid_argument);
    REQUIRE_THROWS_AS(store.add({0, 0, -5, 10}), std::invalid_argument);
    REQUIRE(store.empty());
}

TEST_CASE("RoiStore list returns an independent copy") {
    RoiStore store({{10, 10, 200, 50}});
    auto copy = store.list();
    copy[0].x = 999;
    copy.push_back({1, 1, 1, 1});
    REQUIRE(store.list().size() == 1);
    REQUIRE(store.list()[0].x == 10);
}

TEST_CASE("RoiStore remove by index") {
    RoiStore store({{0, 0, 1, 1}, {1, 1, 2, 2}, {2, 2, 3, 3}});
    store.remove(1);
    REQUIRE(store.size() == 2);
    REQUIRE(store.list()[1] == Roi{2, 2, 3, 3});
    REQUIRE_THROWS_AS(store.remove(2), std::out_of_range);
}

TEST_CASE("RoiStore constructor validates seed regions") {
    REQUIRE_THROWS_AS(RoiStore({{0, 0, 10, 10}, {0, 0, 0, 0}}), std::invalid_argument);
}

TEST_CASE("parse_roi reads x,y,width,height") {
    REQUIRE(parse_roi("10,300,200,50") == Roi{10, 300, 200, 50});
    REQUIRE(parse_roi(" 1, 2 ,3,4 ") == Roi{1, 2, 3, 4});
    REQUIRE_THROWS_AS(parse_roi("1,2,3"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_roi("1,2,3,4,5"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_roi("a,2,3,4"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_roi("1,,3,4"), std::invalid_argument);
}
