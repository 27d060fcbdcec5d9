#pragma once
#include "clipper2/clipper.h"
#include <cstdint>
#include <cmath>
#include <string>
#include <vector>

namespace panelnest {

struct Sheet;

// Coordinates inside the engine are int64 units of 1e-4 mm.
constexpr double SCALE = 1e4;

inline int64_t toUnits(double mm) { return static_cast<int64_t>(std::llround(mm * SCALE)); }
inline double toMm(int64_t v) { return double(v) / SCALE; }

// Axis-aligned rectangle, anchored at its bottom-left corner.
struct Box {
    int64_t x = 0, y = 0, w = 0, h = 0;

    int64_t right() const { return x + w; }
    int64_t top() const { return y + h; }
    double area() const { return double(w) * double(h); }
    int64_t perimeter() const { return 2 * (w + h); }
    bool empty() const { return w <= 0 || h <= 0; }

    bool intersects(const Box& o) const {
        return x < o.right() && o.x < right() && y < o.top() && o.y < top();
    }
    bool contains(const Box& o) const {
        return o.x >= x && o.y >= y && o.right() <= right() && o.top() <= top();
    }
    bool operator==(const Box& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
};

Clipper2Lib::Paths64 toPaths(const Box& b);
// True when the two boxes, each grown by half the gap, share a positive area.
bool overlap(const Box& a, const Box& b, int64_t gap);

// Layout check for a finished sheet: out-of-bounds and overlapping placements.
std::vector<std::string> validateSheet(const Sheet& sheet, double gap_mm);

}  // namespace panelnest
