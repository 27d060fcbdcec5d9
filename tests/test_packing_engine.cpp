#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "errors.h"
#include "geometry.h"
#include "packing_engine.h"
#include <random>

using namespace panelnest;

// Placed rectangles pairwise disjoint, inside the sheet, rotation consistent.
static void checkLayout(const Solution& sol, const std::vector<Part>& parts, double gap){
    for(const auto& s : sol.sheets){
        REQUIRE(validateSheet(s, gap).empty());
        for(size_t i = 0; i < s.placements.size(); ++i){
            const Placement& p = s.placements[i];
            REQUIRE(p.x >= 0);
            REQUIRE(p.y >= 0);
            REQUIRE(p.x + p.width <= s.length + 1e-9);
            REQUIRE(p.y + p.height <= s.width + 1e-9);
            const Part& part = parts[size_t(p.part_index)];
            if(p.rotated){
                REQUIRE(p.width == Approx(part.height));
                REQUIRE(p.height == Approx(part.length));
            } else {
                REQUIRE(p.width == Approx(part.length));
                REQUIRE(p.height == Approx(part.height));
            }
            for(size_t j = i + 1; j < s.placements.size(); ++j){
                const Placement& q = s.placements[j];
                bool apart = p.x + p.width <= q.x || q.x + q.width <= p.x ||
                             p.y + p.height <= q.y || q.y + q.height <= p.y;
                REQUIRE(apart);
            }
        }
    }
}

static size_t demand(const std::vector<Part>& parts){
    size_t n = 0;
    for(const auto& p : parts) n += size_t(p.quantity);
    return n;
}

TEST_CASE("four parts share one sheet") {
    std::vector<Part> parts = {{"A", 400, 300, 4}};
    std::vector<StockType> stock = {{1000, 1000, kUnlimitedStock, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.sheets.size() == 1);
    REQUIRE(sol.placedCount() == 4);
    REQUIRE(sol.unplaced.empty());
    REQUIRE(sol.utilization() == Approx(0.48));
    checkLayout(sol, parts, 0.0);
}

TEST_CASE("part that only fits rotated") {
    std::vector<Part> parts = {{"B", 150, 50, 1}};
    std::vector<StockType> stock = {{100, 200, 1, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.sheets.size() == 1);
    const Placement& p = sol.sheets[0].placements.at(0);
    REQUIRE(p.rotated);
    REQUIRE(p.x == 0);
    REQUIRE(p.y == 0);
    REQUIRE(p.width == Approx(50));
    REQUIRE(p.height == Approx(150));

    Solution fixed = pack(parts, stock, 0.0, false);
    REQUIRE(fixed.sheets.empty());
    REQUIRE(fixed.unplaced.size() == 1);
}

TEST_CASE("part larger than every stock type") {
    std::vector<Part> parts = {{"C", 200, 200, 1}};
    std::vector<StockType> stock = {{100, 100, 1, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.sheets.empty());
    REQUIRE(sol.unplaced.size() == 1);
    REQUIRE(sol.unplaced[0].part_id == "C");
    REQUIRE(sol.unplaced[0].reason == UnplacedReason::kExceedsAllStock);
    REQUIRE_FALSE(sol.stock_exhausted);
}

TEST_CASE("second stock type opens once the first is used up") {
    std::vector<Part> parts = {{"D", 80, 80, 3}};
    std::vector<StockType> stock = {{100, 100, 1, ""}, {200, 200, 1, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.sheets.size() == 2);
    REQUIRE(sol.sheets[0].length == 100);
    REQUIRE(sol.sheets[1].length == 200);
    REQUIRE(sol.sheets[1].width == 200);
    REQUIRE(sol.placedCount() == 3);
    checkLayout(sol, parts, 0.0);
}

TEST_CASE("gap pushes the neighbour over") {
    std::vector<Part> parts = {{"E", 40, 40, 2}};
    std::vector<StockType> stock = {{100, 100, 1, ""}};
    Solution sol = pack(parts, stock, 10.0, true);
    REQUIRE(sol.sheets.size() == 1);
    REQUIRE(sol.sheets[0].placements.size() == 2);
    REQUIRE(sol.sheets[0].placements[0].x == 0);
    REQUIRE(sol.sheets[0].placements[1].x >= 50);
    checkLayout(sol, parts, 10.0);
}

TEST_CASE("stock exhaustion stops the run with a partial solution") {
    std::vector<Part> parts = {{"F", 60, 60, 5}};
    std::vector<StockType> stock = {{100, 100, 2, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.stock_exhausted);
    REQUIRE(sol.sheets.size() == 2);
    REQUIRE(sol.placedCount() == 2);
    REQUIRE(sol.unplaced.size() == 3);
    for(const auto& u : sol.unplaced)
        REQUIRE(u.reason == UnplacedReason::kStockExhausted);
}

TEST_CASE("random jobs conserve parts and respect geometry") {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dim(10, 400);
    std::uniform_int_distribution<int> qty(1, 4);
    for(int round = 0; round < 20; ++round){
        std::vector<Part> parts;
        int kinds = 1 + round % 6;
        for(int k = 0; k < kinds; ++k)
            parts.push_back({"P" + std::to_string(k), double(dim(rng)), double(dim(rng)), qty(rng)});
        std::vector<StockType> stock = {{500, 350, 3, ""}, {1200, 800, kUnlimitedStock, ""}};
        double gap = (round % 3) * 2.5;
        PackOptions opt;
        opt.gap = gap;
        opt.allow_rotation = round % 2 == 0;
        opt.verify = true;
        Solution sol = pack(parts, stock, opt);
        REQUIRE(sol.placedCount() + sol.unplaced.size() == demand(parts));
        REQUIRE(sol.utilization() >= 0.0);
        REQUIRE(sol.utilization() <= 1.0);
        checkLayout(sol, parts, gap);
    }
}

TEST_CASE("identical inputs give identical solutions") {
    std::vector<Part> parts = {{"a", 300, 200, 3}, {"b", 150, 150, 4}, {"c", 90, 400, 2}};
    std::vector<StockType> stock = {{600, 600, kUnlimitedStock, ""}};
    Solution s1 = pack(parts, stock, 3.0, true);
    Solution s2 = pack(parts, stock, 3.0, true);
    REQUIRE(s1.sheets.size() == s2.sheets.size());
    for(size_t i = 0; i < s1.sheets.size(); ++i){
        const auto& a = s1.sheets[i].placements;
        const auto& b = s2.sheets[i].placements;
        REQUIRE(a.size() == b.size());
        for(size_t k = 0; k < a.size(); ++k){
            REQUIRE(a[k].part_id == b[k].part_id);
            REQUIRE(a[k].x == b[k].x);
            REQUIRE(a[k].y == b[k].y);
            REQUIRE(a[k].rotated == b[k].rotated);
        }
    }
}

TEST_CASE("invalid input is rejected before packing") {
    std::vector<StockType> stock = {{100, 100, 1, ""}};
    REQUIRE_THROWS_AS(pack({{"x", 0, 10, 1}}, stock, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, -5, 1}}, stock, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, 10, 0}}, stock, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, 10, 1}}, {}, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, 10, 1}}, {{100, 0, 1, ""}}, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, 10, 1}}, {{100, 100, -3, ""}}, 0.0, true), InvalidInputError);
    REQUIRE_THROWS_AS(pack({{"x", 10, 10, 1}}, stock, -1.0, true), InvalidInputError);
}

TEST_CASE("engine rejects an order that is not a permutation") {
    PackingEngine engine({{"x", 10, 10, 2}}, {{100, 100, 1, ""}}, PackOptions{});
    REQUIRE(engine.instances().size() == 2);
    REQUIRE_THROWS_AS(engine.run({0, 0}), std::invalid_argument);
    REQUIRE_THROWS_AS(engine.run({0}), std::invalid_argument);
    REQUIRE(engine.run({1, 0}).placedCount() == 2);
}

TEST_CASE("no parts gives an empty solution") {
    Solution sol = pack({}, {{100, 100, 1, ""}}, 0.0, true);
    REQUIRE(sol.sheets.empty());
    REQUIRE(sol.unplaced.empty());
    REQUIRE(sol.utilization() == 0.0);
}

TEST_CASE("parts of different materials never share a sheet") {
    std::vector<Part> parts = {{"oak-door", 300, 200, 3, "oak"}, {"pine-shelf", 250, 100, 4, "pine"},
                               {"oak-strip", 500, 60, 2, "oak"}};
    std::vector<StockType> stock = {{1000, 1000, kUnlimitedStock, "pine board", "pine"},
                                    {1000, 1000, kUnlimitedStock, "oak board", "oak"}};
    Solution sol = pack(parts, stock, 2.0, true);
    REQUIRE(sol.unplaced.empty());
    REQUIRE(sol.sheets.size() == 2);
    for(const auto& s : sol.sheets){
        for(const auto& p : s.placements)
            REQUIRE(parts[size_t(p.part_index)].material == s.material);
        REQUIRE(stock[size_t(s.stock_index)].material == s.material);
    }
    checkLayout(sol, parts, 2.0);
}

TEST_CASE("a material without stock is left unplaced") {
    std::vector<Part> parts = {{"walnut", 100, 100, 2, "walnut"}, {"plain", 100, 100, 1}};
    std::vector<StockType> stock = {{500, 500, 1, ""}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE(sol.placedCount() == 1);
    REQUIRE(sol.sheets[0].placements[0].part_id == "plain");
    REQUIRE(sol.unplaced.size() == 2);
    for(const auto& u : sol.unplaced){
        REQUIRE(u.part_id == "walnut");
        REQUIRE(u.reason == UnplacedReason::kExceedsAllStock);
    }
}

TEST_CASE("used up material stock does not stop other materials") {
    std::vector<Part> parts = {{"oak", 80, 80, 2, "oak"}, {"pine", 80, 80, 2, "pine"}};
    std::vector<StockType> stock = {{100, 100, 1, "", "oak"}, {100, 100, 5, "", "pine"}};
    Solution sol = pack(parts, stock, 0.0, true);
    REQUIRE_FALSE(sol.stock_exhausted);
    REQUIRE(sol.placedCount() == 3);
    REQUIRE(sol.unplaced.size() == 1);
    REQUIRE(sol.unplaced[0].part_id == "oak");
    REQUIRE(sol.unplaced[0].reason == UnplacedReason::kStockExhausted);
}
