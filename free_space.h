#pragma once
#include "geometry.h"
#include <cstddef>
#include <vector>

namespace panelnest {

// Ledger of unused rectangles on one sheet, maintained by guillotine splits.
class FreeSpaceTracker {
public:
    static constexpr size_t MAX_REGIONS = 4096;

    FreeSpaceTracker(int64_t length, int64_t width);

    const std::vector<Box>& regions() const { return regions_; }
    int64_t length() const { return length_; }
    int64_t width() const { return width_; }
    double freeArea() const;

    // Subtracts `placed` from region `region_index` and from any other region it
    // touches. `placed` must lie inside that region. Returns the remainders the
    // split produced, before merging.
    std::vector<Box> commit(size_t region_index, const Box& placed);

private:
    void prune();
    bool mergeOnce();

    int64_t length_;
    int64_t width_;
    std::vector<Box> regions_;
};

// Remainders of `region` once `placed` is cut out: below, above, left, right.
std::vector<Box> splitRegion(const Box& region, const Box& placed);

}  // namespace panelnest
