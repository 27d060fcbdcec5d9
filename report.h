#pragma once
#include "model.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace panelnest {

// Identical sheets: same stock size, same material and the same multiset of
// (nominal length, nominal height, rotated) placements.
struct SheetGroup {
    size_t first_sheet = 0;     // index into Solution::sheets
    int count = 0;
    double length = 0, width = 0;
    std::string material;
    size_t parts_per_sheet = 0;
    double utilization_pct = 0.0;
};

struct Report {
    double total_stock_area = 0.0;   // mm^2
    double total_part_area = 0.0;    // mm^2
    double utilization_pct = 0.0;
    double waste_pct = 0.0;
    size_t placed_count = 0;
    size_t unplaced_count = 0;
    std::map<std::pair<double, double>, int> sheet_size_histogram;
    std::map<std::string, int> sheets_per_material;
    std::vector<SheetGroup> groups;
    std::vector<double> sheet_utilization_pct;
};

Report summarize(const Solution& sol);

}  // namespace panelnest
