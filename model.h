#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace panelnest {

constexpr int kUnlimitedStock = -1;

struct Part {
    std::string id;        // location label
    double length = 0;     // mm
    double height = 0;     // mm
    int quantity = 1;
    std::string material;  // empty: plain stock
};

struct StockType {
    double length = 0;     // mm
    double width = 0;      // mm
    int quantity = kUnlimitedStock;
    std::string name;
    std::string material;  // only parts of the same material go on this stock
};

// One unit of demand. Dimensions are in engine units.
struct PartInstance {
    int part_index = -1;
    int copy = 0;
    int64_t length = 0;
    int64_t height = 0;
    double area() const { return double(length) * double(height); }
};

struct Placement {
    std::string part_id;
    int part_index = -1;
    double x = 0, y = 0;           // mm, bottom-left corner
    double width = 0, height = 0;  // effective size, swapped when rotated
    bool rotated = false;
};

struct Sheet {
    int stock_index = -1;
    double length = 0, width = 0;
    std::string material;
    std::vector<Placement> placements;

    double area() const { return length * width; }
    double usedArea() const {
        double a = 0;
        for(const auto& p : placements) a += p.width * p.height;
        return a;
    }
};

enum class UnplacedReason { kExceedsAllStock, kStockExhausted };

inline const char* toString(UnplacedReason r){
    return r == UnplacedReason::kExceedsAllStock ? "exceeds_all_stock" : "stock_exhausted";
}

struct Unplaced {
    std::string part_id;
    int part_index = -1;
    UnplacedReason reason = UnplacedReason::kExceedsAllStock;
};

struct Solution {
    std::vector<Sheet> sheets;
    std::vector<Unplaced> unplaced;
    bool stock_exhausted = false;

    size_t placedCount() const {
        size_t n = 0;
        for(const auto& s : sheets) n += s.placements.size();
        return n;
    }
    double placedArea() const {
        double a = 0;
        for(const auto& s : sheets) a += s.usedArea();
        return a;
    }
    double stockArea() const {
        double a = 0;
        for(const auto& s : sheets) a += s.area();
        return a;
    }
    double utilization() const {
        double st = stockArea();
        return st > 0 ? placedArea() / st : 0.0;
    }
};

// --- optional GA refinement over part orderings ---
struct RefineConfig {
    int population_size = 5;
    int generations = 20;
    uint64_t seed = 42;
    int top_k = 3;
    double mutation_rate = 0.1;
    double jitter = 0.15;      // relative area noise for the initial orderings
    int patience = 2;          // generations without improvement before stopping
    double time_limit = 0.0;   // seconds, 0 = none
};

struct PackOptions {
    double gap = 0.0;          // mm reserved between neighbouring parts
    bool allow_rotation = true;
    bool verify = false;       // run validateSheet on every result sheet
    std::optional<RefineConfig> refine;
};

}  // namespace panelnest
