#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "placement_search.h"

using namespace panelnest;

TEST_CASE("empty sheet takes the part at the origin") {
    FreeSpaceTracker t(1000, 1000);
    auto c = findBest(t, 400, 300, 0, true);
    REQUIRE(c);
    REQUIRE(c->x == 0);
    REQUIRE(c->y == 0);
    REQUIRE_FALSE(c->rotated);
    REQUIRE(c->footprint == Box{0, 0, 400, 300});
}

TEST_CASE("only the rotated orientation fits") {
    FreeSpaceTracker t(100, 200);
    auto c = findBest(t, 150, 50, 0, true);
    REQUIRE(c);
    REQUIRE(c->rotated);
    REQUIRE(c->width == 50);
    REQUIRE(c->height == 150);
    REQUIRE_FALSE(findBest(t, 150, 50, 0, false));
}

TEST_CASE("best area fit picks the tighter region") {
    FreeSpaceTracker t(100, 100);
    t.commit(0, {0, 0, 50, 50});
    auto c = findBest(t, 40, 40, 0, true);
    REQUIRE(c);
    REQUIRE(c->x == 50);
    REQUIRE(c->y == 0);
}

TEST_CASE("gap is reserved between parts but not at the sheet edge") {
    FreeSpaceTracker t(100, 100);
    auto first = findBest(t, 40, 40, 10, true);
    REQUIRE(first);
    REQUIRE(first->footprint == Box{0, 0, 50, 50});
    t.commit(first->region_index, first->footprint);

    auto second = findBest(t, 40, 40, 10, true);
    REQUIRE(second);
    REQUIRE(second->x >= 50);

    // 100 wide part on a 100 wide sheet: no room for the gap, none needed at the edge
    FreeSpaceTracker full(100, 100);
    auto edge = findBest(full, 100, 30, 10, false);
    REQUIRE(edge);
    REQUIRE(edge->footprint == Box{0, 0, 100, 40});
}

TEST_CASE("part larger than every region") {
    FreeSpaceTracker t(100, 100);
    REQUIRE_FALSE(findBest(t, 200, 200, 0, true));
    REQUIRE_FALSE(fitsEmptySheet(100, 100, 200, 200, 0, true));
    REQUIRE(fitsEmptySheet(100, 200, 150, 50, 0, true));
}

TEST_CASE("ties prefer the unrotated orientation") {
    FreeSpaceTracker t(100, 100);
    auto c = findBest(t, 60, 20, 0, true);
    REQUIRE(c);
    REQUIRE_FALSE(c->rotated);
}

TEST_CASE("equal leftover goes to the region with the smaller perimeter") {
    // leaves above (0,80,200,20) and right (150,0,50,80), both 4000 in area
    FreeSpaceTracker t(200, 100);
    t.commit(0, {0, 0, 150, 80});
    REQUIRE(t.regions().size() == 2);
    REQUIRE(t.regions()[0] == Box{0, 80, 200, 20});
    REQUIRE(t.regions()[1] == Box{150, 0, 50, 80});

    auto c = findBest(t, 40, 10, 0, false);
    REQUIRE(c);
    REQUIRE(c->region_index == 1);
    REQUIRE(c->x == 150);
    REQUIRE(c->y == 0);
}

TEST_CASE("identical regions resolve to ledger order") {
    // a full-height strip leaves (0,0,40,100) and (60,0,40,100)
    FreeSpaceTracker t(100, 100);
    t.commit(0, {40, 0, 20, 100});
    REQUIRE(t.regions().size() == 2);
    REQUIRE(t.regions()[0] == Box{0, 0, 40, 100});
    REQUIRE(t.regions()[1] == Box{60, 0, 40, 100});

    auto c = findBest(t, 30, 30, 0, true);
    REQUIRE(c);
    REQUIRE(c->region_index == 0);
    REQUIRE(c->x == 0);
    REQUIRE_FALSE(c->rotated);
}
