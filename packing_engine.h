#pragma once
#include "model.h"
#include "sheet_allocator.h"
#include <optional>
#include <vector>

namespace panelnest {

// Throws InvalidInputError on non-positive or non-finite sizes, bad quantities,
// a negative gap, an empty stock list or an out-of-range refine setting.
// Parts only go on stock of their own material; a part whose material has no
// stock type is reported as exceeding all stock.
void validateInput(const std::vector<Part>& parts,
                   const std::vector<StockType>& stock,
                   const PackOptions& opt);

// One instance per unit of quantity, in input order.
std::vector<PartInstance> expandParts(const std::vector<Part>& parts);
// Descending area, then descending height; stable for equal keys.
void orderByArea(std::vector<PartInstance>& instances);

class PackingEngine {
public:
    PackingEngine(std::vector<Part> parts, std::vector<StockType> stock, PackOptions opt);

    const std::vector<Part>& parts() const { return parts_; }
    const std::vector<StockType>& stock() const { return stock_; }
    const PackOptions& options() const { return opt_; }
    // Expanded demand in canonical (area) order.
    const std::vector<PartInstance>& instances() const { return instances_; }

    Solution run() const;
    // `order` is a permutation of indices into instances().
    Solution run(const std::vector<int>& order) const;

private:
    bool placeOn(SheetState& sheet, const PartInstance& inst) const;
    bool placeOnOpenSheets(SheetAllocator& alloc, const PartInstance& inst) const;
    Unplaced unplaced(const PartInstance& inst, UnplacedReason why) const;

    std::vector<Part> parts_;
    std::vector<StockType> stock_;
    PackOptions opt_;
    int64_t gap_ = 0;
    std::vector<PartInstance> instances_;
    std::vector<char> fitsSomeStock_;   // per part index
};

Solution pack(const std::vector<Part>& parts,
              const std::vector<StockType>& stock,
              const PackOptions& opt);

Solution pack(const std::vector<Part>& parts,
              const std::vector<StockType>& stock,
              double gap, bool allow_rotation,
              const std::optional<RefineConfig>& refine = std::nullopt);

}  // namespace panelnest
