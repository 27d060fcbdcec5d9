#include "free_space.h"
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace panelnest {

FreeSpaceTracker::FreeSpaceTracker(int64_t length, int64_t width)
    : length_(length), width_(width) {
    if(length > 0 && width > 0)
        regions_.push_back({0, 0, length, width});
}

double FreeSpaceTracker::freeArea() const {
    double a = 0;
    for(const auto& r : regions_) a += r.area();
    return a;
}

std::vector<Box> splitRegion(const Box& r, const Box& p){
    std::vector<Box> out;
    if(!r.intersects(p)){
        out.push_back(r);
        return out;
    }
    const int64_t lo = std::max(r.y, p.y);
    const int64_t hi = std::min(r.top(), p.top());
    Box below{r.x, r.y, r.w, p.y - r.y};
    Box above{r.x, p.top(), r.w, r.top() - p.top()};
    Box left{r.x, lo, p.x - r.x, hi - lo};
    Box right{p.right(), lo, r.right() - p.right(), hi - lo};
    for(const Box& b : {below, above, left, right})
        if(!b.empty()) out.push_back(b);
    return out;
}

std::vector<Box> FreeSpaceTracker::commit(size_t region_index, const Box& placed){
    if(region_index >= regions_.size())
        throw std::out_of_range("free region index " + std::to_string(region_index) +
                                " out of " + std::to_string(regions_.size()));
    if(placed.empty() || !regions_[region_index].contains(placed))
        throw std::invalid_argument("placed rectangle does not fit the chosen free region");

    std::vector<Box> produced;
    std::vector<Box> next;
    next.reserve(regions_.size() + 3);
    for(const auto& r : regions_){
        if(!r.intersects(placed)){
            next.push_back(r);
            continue;
        }
        auto parts = splitRegion(r, placed);
        produced.insert(produced.end(), parts.begin(), parts.end());
        next.insert(next.end(), parts.begin(), parts.end());
    }
    regions_ = std::move(next);
    prune();
    return produced;
}

// Merges one pair of regions sharing a full edge. Returns false when none is left.
bool FreeSpaceTracker::mergeOnce(){
    for(size_t i = 0; i < regions_.size(); ++i){
        for(size_t j = i + 1; j < regions_.size(); ++j){
            Box& a = regions_[i];
            const Box& b = regions_[j];
            bool stacked = a.x == b.x && a.w == b.w && (a.top() == b.y || b.top() == a.y);
            bool sideBySide = a.y == b.y && a.h == b.h && (a.right() == b.x || b.right() == a.x);
            if(!stacked && !sideBySide) continue;
            if(stacked){
                a.y = std::min(a.y, b.y);
                a.h += b.h;
            } else {
                a.x = std::min(a.x, b.x);
                a.w += b.w;
            }
            regions_.erase(regions_.begin() + j);
            return true;
        }
    }
    return false;
}

void FreeSpaceTracker::prune(){
    regions_.erase(std::remove_if(regions_.begin(), regions_.end(),
                                  [](const Box& b){ return b.empty(); }),
                   regions_.end());

    // drop regions swallowed by another one (keep the first of equal pairs)
    std::vector<char> dead(regions_.size(), 0);
    for(size_t i = 0; i < regions_.size(); ++i){
        if(dead[i]) continue;
        for(size_t j = 0; j < regions_.size(); ++j){
            if(i == j || dead[j]) continue;
            if(regions_[i].contains(regions_[j]) && (!(regions_[i] == regions_[j]) || i < j))
                dead[j] = 1;
        }
    }
    size_t k = 0;
    for(size_t i = 0; i < regions_.size(); ++i)
        if(!dead[i]) regions_[k++] = regions_[i];
    regions_.resize(k);

    while(mergeOnce()) {}

    if(regions_.size() > MAX_REGIONS){
        std::vector<size_t> idx(regions_.size());
        std::iota(idx.begin(), idx.end(), 0);
        std::stable_sort(idx.begin(), idx.end(), [&](size_t a, size_t b){
            return regions_[a].area() > regions_[b].area();
        });
        std::vector<char> keep(regions_.size(), 0);
        for(size_t i = 0; i < MAX_REGIONS; ++i) keep[idx[i]] = 1;
        std::vector<Box> kept;
        kept.reserve(MAX_REGIONS);
        for(size_t i = 0; i < regions_.size(); ++i)
            if(keep[i]) kept.push_back(regions_[i]);
        spdlog::warn("[FREE] region cap reached, dropped {} small region(s)",
                     regions_.size() - kept.size());
        regions_ = std::move(kept);
    }
}

}  // namespace panelnest
