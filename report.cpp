#include "report.h"
#include <algorithm>
#include <tuple>

namespace panelnest {

using PlacementKey = std::tuple<double, double, bool>;

static std::vector<PlacementKey> signature(const Sheet& s){
    std::vector<PlacementKey> sig;
    sig.reserve(s.placements.size());
    for(const auto& p : s.placements){
        double l = p.rotated ? p.height : p.width;
        double h = p.rotated ? p.width : p.height;
        sig.emplace_back(l, h, p.rotated);
    }
    std::sort(sig.begin(), sig.end());
    return sig;
}

Report summarize(const Solution& sol){
    Report r;
    r.placed_count = sol.placedCount();
    r.unplaced_count = sol.unplaced.size();
    r.total_stock_area = sol.stockArea();
    r.total_part_area = sol.placedArea();
    if(r.total_stock_area > 0){
        r.utilization_pct = r.total_part_area / r.total_stock_area * 100.0;
        r.waste_pct = 100.0 - r.utilization_pct;
    }

    std::map<std::tuple<double, double, std::string, std::vector<PlacementKey>>, size_t> seen;
    for(size_t i = 0; i < sol.sheets.size(); ++i){
        const Sheet& s = sol.sheets[i];
        double pct = s.area() > 0 ? s.usedArea() / s.area() * 100.0 : 0.0;
        r.sheet_utilization_pct.push_back(pct);
        ++r.sheet_size_histogram[{s.length, s.width}];
        ++r.sheets_per_material[s.material];

        auto key = std::make_tuple(s.length, s.width, s.material, signature(s));
        auto it = seen.find(key);
        if(it != seen.end()){
            ++r.groups[it->second].count;
            continue;
        }
        seen.emplace(std::move(key), r.groups.size());
        SheetGroup g;
        g.first_sheet = i;
        g.count = 1;
        g.length = s.length;
        g.width = s.width;
        g.material = s.material;
        g.parts_per_sheet = s.placements.size();
        g.utilization_pct = pct;
        r.groups.push_back(g);
    }
    return r;
}

}  // namespace panelnest
