#pragma once
#include "free_space.h"
#include <optional>

namespace panelnest {

struct Candidate {
    size_t region_index = 0;
    int64_t x = 0, y = 0;
    bool rotated = false;
    int64_t width = 0, height = 0;      // effective part size
    Box footprint;                      // part plus reserved kerf, clipped to the region
    double leftover = 0;                // region area minus part area
};

// Best-area-fit over the free regions of one sheet. Ties go to the unrotated
// orientation, then to the region with the smaller perimeter, then to ledger order.
std::optional<Candidate> findBest(const FreeSpaceTracker& space,
                                  int64_t part_l, int64_t part_h,
                                  int64_t gap, bool allow_rotation);

// Whether an empty length x width sheet can take the part at all.
bool fitsEmptySheet(int64_t length, int64_t width,
                    int64_t part_l, int64_t part_h,
                    int64_t gap, bool allow_rotation);

}  // namespace panelnest
