#include "packing_engine.h"
#include "errors.h"
#include "geometry.h"
#include "placement_search.h"
#include "population_refiner.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace panelnest {

// ───────── input checks ─────────
static void require(bool ok, const std::string& what){
    if(!ok) throw InvalidInputError(what);
}

static bool positiveSize(double v){
    return std::isfinite(v) && v > 0 && toUnits(v) > 0;
}

void validateInput(const std::vector<Part>& parts,
                   const std::vector<StockType>& stock,
                   const PackOptions& opt){
    require(!stock.empty(), "no stock types configured");
    for(size_t i = 0; i < parts.size(); ++i){
        const Part& p = parts[i];
        std::string tag = "part #" + std::to_string(i) + " '" + p.id + "'";
        require(positiveSize(p.length), tag + ": length must be positive");
        require(positiveSize(p.height), tag + ": height must be positive");
        require(p.quantity > 0, tag + ": quantity must be positive");
    }
    for(size_t i = 0; i < stock.size(); ++i){
        const StockType& s = stock[i];
        std::string tag = "stock #" + std::to_string(i);
        require(positiveSize(s.length), tag + ": length must be positive");
        require(positiveSize(s.width), tag + ": width must be positive");
        require(s.quantity >= 0 || s.quantity == kUnlimitedStock,
                tag + ": quantity must be non-negative");
    }
    require(std::isfinite(opt.gap) && opt.gap >= 0, "gap must be a non-negative number");
    if(opt.refine){
        const RefineConfig& r = *opt.refine;
        require(r.population_size >= 1, "population size must be at least 1");
        require(r.generations >= 0, "generations must be non-negative");
        require(r.top_k >= 1, "top-k must be at least 1");
        require(r.mutation_rate >= 0 && r.mutation_rate <= 1, "mutation rate must be within [0,1]");
        require(r.jitter >= 0 && r.jitter < 1, "jitter must be within [0,1)");
        require(r.patience >= 1, "patience must be at least 1");
        require(r.time_limit >= 0, "time limit must be non-negative");
    }
}

std::vector<PartInstance> expandParts(const std::vector<Part>& parts){
    std::vector<PartInstance> out;
    for(size_t i = 0; i < parts.size(); ++i)
        for(int c = 0; c < parts[i].quantity; ++c)
            out.push_back({int(i), c, toUnits(parts[i].length), toUnits(parts[i].height)});
    return out;
}

void orderByArea(std::vector<PartInstance>& instances){
    std::stable_sort(instances.begin(), instances.end(),
                     [](const PartInstance& a, const PartInstance& b){
        if(a.area() != b.area()) return a.area() > b.area();
        return a.height > b.height;
    });
}

// ───────── engine ─────────
PackingEngine::PackingEngine(std::vector<Part> parts, std::vector<StockType> stock, PackOptions opt)
    : parts_(std::move(parts)), stock_(std::move(stock)), opt_(std::move(opt)) {
    validateInput(parts_, stock_, opt_);
    gap_ = toUnits(opt_.gap);
    instances_ = expandParts(parts_);
    orderByArea(instances_);

    fitsSomeStock_.assign(parts_.size(), 0);
    for(size_t i = 0; i < parts_.size(); ++i){
        int64_t l = toUnits(parts_[i].length), h = toUnits(parts_[i].height);
        for(const auto& s : stock_){
            if(s.material != parts_[i].material) continue;
            if(fitsEmptySheet(toUnits(s.length), toUnits(s.width), l, h, gap_, opt_.allow_rotation)){
                fitsSomeStock_[i] = 1;
                break;
            }
        }
    }
}

Unplaced PackingEngine::unplaced(const PartInstance& inst, UnplacedReason why) const {
    return {parts_[size_t(inst.part_index)].id, inst.part_index, why};
}

bool PackingEngine::placeOn(SheetState& sheet, const PartInstance& inst) const {
    auto c = findBest(sheet.space, inst.length, inst.height, gap_, opt_.allow_rotation);
    if(!c) return false;
    sheet.space.commit(c->region_index, c->footprint);
    Placement pl;
    pl.part_id = parts_[size_t(inst.part_index)].id;
    pl.part_index = inst.part_index;
    pl.x = toMm(c->x);
    pl.y = toMm(c->y);
    pl.width = toMm(c->width);
    pl.height = toMm(c->height);
    pl.rotated = c->rotated;
    sheet.placements.push_back(std::move(pl));
    spdlog::debug("[PLACED] {} copy {} at ({}, {}) {}x{}{} on stock {}, {} free region(s)",
                  parts_[size_t(inst.part_index)].id, inst.copy, toMm(c->x), toMm(c->y),
                  toMm(c->width), toMm(c->height), c->rotated ? " rotated" : "",
                  sheet.stock_index, sheet.space.regions().size());
    return true;
}

bool PackingEngine::placeOnOpenSheets(SheetAllocator& alloc, const PartInstance& inst) const {
    const std::string& material = parts_[size_t(inst.part_index)].material;
    for(size_t t = 0; t < alloc.stockCount(); ++t){
        if(alloc.stock(t).material != material) continue;
        SheetState* s = alloc.currentSheet(t);
        if(s && placeOn(*s, inst)) return true;
    }
    return false;
}

Solution PackingEngine::run() const {
    std::vector<int> order(instances_.size());
    for(size_t i = 0; i < order.size(); ++i) order[i] = int(i);
    return run(order);
}

Solution PackingEngine::run(const std::vector<int>& order) const {
    if(order.size() != instances_.size())
        throw std::invalid_argument("order has " + std::to_string(order.size()) +
                                    " entries, expected " + std::to_string(instances_.size()));
    std::vector<char> seen(instances_.size(), 0);
    for(int k : order){
        if(k < 0 || size_t(k) >= instances_.size() || seen[size_t(k)])
            throw std::invalid_argument("order is not a permutation of the part instances");
        seen[size_t(k)] = 1;
    }

    SheetAllocator alloc(stock_, gap_);
    Solution sol;
    for(size_t k = 0; k < order.size(); ++k){
        const PartInstance& inst = instances_[size_t(order[k])];
        if(!fitsSomeStock_[size_t(inst.part_index)]){
            const Part& part = parts_[size_t(inst.part_index)];
            spdlog::warn("[PACK] part {} ({}x{}) fits no {}{}stock type", part.id,
                         toMm(inst.length), toMm(inst.height), part.material,
                         part.material.empty() ? "" : " ");
            sol.unplaced.push_back(unplaced(inst, UnplacedReason::kExceedsAllStock));
            continue;
        }
        if(placeOnOpenSheets(alloc, inst)) continue;

        SheetState* fresh = nullptr;
        try {
            fresh = alloc.tryOpenSheet(inst, opt_.allow_rotation, parts_[size_t(inst.part_index)].material);
        } catch(const StockExhaustedError& e){
            sol.stock_exhausted = true;
            spdlog::warn("[PACK] {}; {} part instance(s) left unplaced", e.what(), order.size() - k);
            for(size_t r = k; r < order.size(); ++r){
                const PartInstance& rest = instances_[size_t(order[r])];
                sol.unplaced.push_back(unplaced(rest, fitsSomeStock_[size_t(rest.part_index)]
                                                          ? UnplacedReason::kStockExhausted
                                                          : UnplacedReason::kExceedsAllStock));
            }
            break;
        }
        if(!fresh){
            spdlog::warn("[PACK] part {}: remaining stock cannot hold it", parts_[size_t(inst.part_index)].id);
            sol.unplaced.push_back(unplaced(inst, UnplacedReason::kStockExhausted));
            continue;
        }
        if(!placeOn(*fresh, inst)){
            spdlog::error("[PACK] part {} rejected by a freshly opened sheet", parts_[size_t(inst.part_index)].id);
            sol.unplaced.push_back(unplaced(inst, UnplacedReason::kExceedsAllStock));
        }
    }

    alloc.closeAll();
    for(auto& s : alloc.sheets()){
        if(s.placements.empty()) continue;
        Sheet out;
        out.stock_index = s.stock_index;
        out.length = stock_[size_t(s.stock_index)].length;
        out.width = stock_[size_t(s.stock_index)].width;
        out.material = stock_[size_t(s.stock_index)].material;
        out.placements = std::move(s.placements);
        sol.sheets.push_back(std::move(out));
    }

    if(opt_.verify){
        size_t bad = 0;
        for(size_t i = 0; i < sol.sheets.size(); ++i)
            for(const auto& msg : validateSheet(sol.sheets[i], opt_.gap)){
                spdlog::error("[VERIFY] sheet {}: {}", i + 1, msg);
                ++bad;
            }
        if(bad)
            throw PackingError("layout verification failed with " + std::to_string(bad) + " problem(s)");
    }

    spdlog::debug("[PACK] {} sheet(s), placed {}/{}, utilization {:.2f}%",
                  sol.sheets.size(), sol.placedCount(), instances_.size(), sol.utilization() * 100.0);
    return sol;
}

// ───────── entry points ─────────
Solution pack(const std::vector<Part>& parts,
              const std::vector<StockType>& stock,
              const PackOptions& opt){
    PackingEngine engine(parts, stock, opt);
    spdlog::info("Packing {} part instance(s) from {} part type(s) onto {} stock type(s), gap {} mm, rotation {}",
                 engine.instances().size(), parts.size(), stock.size(), opt.gap,
                 opt.allow_rotation ? "on" : "off");
    Solution sol;
    if(opt.refine){
        PopulationRefiner refiner(engine, *opt.refine);
        sol = refiner.refine();
    } else {
        sol = engine.run();
    }
    spdlog::info("Result: {} sheet(s), placed {}/{}, utilization {:.2f}%{}",
                 sol.sheets.size(), sol.placedCount(), engine.instances().size(),
                 sol.utilization() * 100.0, sol.stock_exhausted ? ", stock exhausted" : "");
    if(!sol.unplaced.empty())
        spdlog::warn("{} part instance(s) could not be placed", sol.unplaced.size());
    return sol;
}

Solution pack(const std::vector<Part>& parts,
              const std::vector<StockType>& stock,
              double gap, bool allow_rotation,
              const std::optional<RefineConfig>& refine){
    PackOptions opt;
    opt.gap = gap;
    opt.allow_rotation = allow_rotation;
    opt.refine = refine;
    return pack(parts, stock, opt);
}

}  // namespace panelnest
