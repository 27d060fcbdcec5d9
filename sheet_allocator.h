#pragma once
#include "free_space.h"
#include "model.h"
#include <deque>
#include <string>
#include <vector>

namespace panelnest {

// One opened stock unit while a run is in progress.
struct SheetState {
    int stock_index = -1;
    FreeSpaceTracker space;
    std::vector<Placement> placements;
    bool closed = false;

    SheetState(int idx, int64_t length, int64_t width)
        : stock_index(idx), space(length, width) {}
};

class SheetAllocator {
public:
    SheetAllocator(const std::vector<StockType>& stock, int64_t gap);

    size_t stockCount() const { return stock_.size(); }
    const StockType& stock(size_t i) const { return stock_[i]; }

    // Active sheet of the given stock type, nullptr when none is open.
    SheetState* currentSheet(size_t stock_index);

    // Opens a sheet of the first stock type, in configured order, of the given
    // material that still has quantity left and whose empty sheet can take the
    // part. Closes the previous active sheet of that type. Throws
    // StockExhaustedError when no type has quantity left.
    SheetState& openNewSheet(const PartInstance& part, bool allow_rotation,
                             const std::string& material = std::string());
    // Same, but returns nullptr when stock remains yet none of it fits the part.
    SheetState* tryOpenSheet(const PartInstance& part, bool allow_rotation,
                             const std::string& material = std::string());

    // Remaining issuable units, kUnlimitedStock for unbounded types.
    int remaining(size_t stock_index) const { return remaining_[stock_index]; }
    bool exhausted() const;

    std::deque<SheetState>& sheets() { return sheets_; }
    const std::deque<SheetState>& sheets() const { return sheets_; }
    void closeAll();

private:
    std::vector<StockType> stock_;
    std::vector<int64_t> length_, width_;
    std::vector<int> remaining_;
    std::vector<int> active_;          // index into sheets_, -1 when none
    std::deque<SheetState> sheets_;    // open order; deque keeps references stable
    int64_t gap_;
};

}  // namespace panelnest
