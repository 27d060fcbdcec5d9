#include "sheet_allocator.h"
#include "errors.h"
#include "placement_search.h"
#include <algorithm>
#include <string>
#include <spdlog/spdlog.h>

namespace panelnest {

SheetAllocator::SheetAllocator(const std::vector<StockType>& stock, int64_t gap)
    : stock_(stock), gap_(gap) {
    for(const auto& s : stock_){
        length_.push_back(toUnits(s.length));
        width_.push_back(toUnits(s.width));
        remaining_.push_back(s.quantity);
        active_.push_back(-1);
    }
}

SheetState* SheetAllocator::currentSheet(size_t stock_index){
    int a = active_.at(stock_index);
    if(a < 0) return nullptr;
    SheetState& s = sheets_[size_t(a)];
    return s.closed ? nullptr : &s;
}

bool SheetAllocator::exhausted() const {
    for(int r : remaining_)
        if(r != 0) return false;
    return true;
}

SheetState* SheetAllocator::tryOpenSheet(const PartInstance& part, bool allow_rotation,
                                         const std::string& material){
    if(exhausted())
        throw StockExhaustedError("all " + std::to_string(stock_.size()) +
                                  " stock type(s) are used up");
    for(size_t i = 0; i < stock_.size(); ++i){
        if(remaining_[i] == 0 || stock_[i].material != material) continue;
        if(!fitsEmptySheet(length_[i], width_[i], part.length, part.height, gap_, allow_rotation))
            continue;
        if(remaining_[i] != kUnlimitedStock) --remaining_[i];
        if(active_[i] >= 0) sheets_[size_t(active_[i])].closed = true;
        sheets_.emplace_back(int(i), length_[i], width_[i]);
        active_[i] = int(sheets_.size()) - 1;
        spdlog::debug("[ALLOC] sheet #{} of stock {} ({}x{}{}{}), {} left", sheets_.size(), i,
                      stock_[i].length, stock_[i].width,
                      material.empty() ? "" : " ", material,
                      remaining_[i] == kUnlimitedStock ? std::string("unlimited")
                                                       : std::to_string(remaining_[i]));
        return &sheets_.back();
    }
    return nullptr;
}

SheetState& SheetAllocator::openNewSheet(const PartInstance& part, bool allow_rotation,
                                         const std::string& material){
    SheetState* s = tryOpenSheet(part, allow_rotation, material);
    if(!s)
        throw StockExhaustedError("no remaining " + (material.empty() ? std::string() : material + " ") +
                                  "stock type can hold a " +
                                  std::to_string(toMm(part.length)) + "x" +
                                  std::to_string(toMm(part.height)) + " part");
    return *s;
}

void SheetAllocator::closeAll(){
    for(auto& s : sheets_) s.closed = true;
    std::fill(active_.begin(), active_.end(), -1);
}

}  // namespace panelnest
