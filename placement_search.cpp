#include "placement_search.h"
#include <algorithm>

namespace panelnest {

// Extent of the part plus kerf along one axis, or -1 when it does not fit.
// No kerf is reserved against the sheet edge.
static int64_t reserve(int64_t dim, int64_t regionExtent, bool touchesSheetEdge, int64_t gap){
    if(dim > regionExtent) return -1;
    if(dim + gap <= regionExtent) return dim + gap;
    return touchesSheetEdge ? regionExtent : -1;
}

static bool better(const Candidate& a, int64_t aPerim, const Candidate& b, int64_t bPerim){
    if(a.leftover != b.leftover) return a.leftover < b.leftover;
    if(a.rotated != b.rotated) return !a.rotated;
    return aPerim < bPerim;   // equal perimeter: keep the earlier region
}

std::optional<Candidate> findBest(const FreeSpaceTracker& space,
                                  int64_t part_l, int64_t part_h,
                                  int64_t gap, bool allow_rotation){
    std::optional<Candidate> best;
    int64_t bestPerim = 0;
    const auto& regions = space.regions();
    const bool square = part_l == part_h;
    const double partArea = double(part_l) * double(part_h);

    for(size_t i = 0; i < regions.size(); ++i){
        const Box& r = regions[i];
        const bool atRight = r.right() == space.length();
        const bool atTop = r.top() == space.width();
        for(int o = 0; o < 2; ++o){
            bool rotated = o == 1;
            if(rotated && (!allow_rotation || square)) break;
            int64_t w = rotated ? part_h : part_l;
            int64_t h = rotated ? part_l : part_h;
            int64_t fw = reserve(w, r.w, atRight, gap);
            int64_t fh = reserve(h, r.h, atTop, gap);
            if(fw < 0 || fh < 0) continue;

            Candidate c;
            c.region_index = i;
            c.x = r.x;
            c.y = r.y;
            c.rotated = rotated;
            c.width = w;
            c.height = h;
            c.footprint = Box{r.x, r.y, fw, fh};
            c.leftover = r.area() - partArea;
            if(!best || better(c, r.perimeter(), *best, bestPerim)){
                best = c;
                bestPerim = r.perimeter();
            }
        }
    }
    return best;
}

bool fitsEmptySheet(int64_t length, int64_t width,
                    int64_t part_l, int64_t part_h,
                    int64_t gap, bool allow_rotation){
    FreeSpaceTracker empty(length, width);
    return findBest(empty, part_l, part_h, gap, allow_rotation).has_value();
}

}  // namespace panelnest
