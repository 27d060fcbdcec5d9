#include "geometry.h"
#include "bvh.h"
#include "model.h"
#include <spdlog/spdlog.h>
#include <sstream>

using namespace Clipper2Lib;

namespace panelnest {

// ---- Rectangles as Clipper paths ----
Paths64 toPaths(const Box& b){
    // counter-clockwise, so positive deltas grow the outline
    Path64 p;
    p.reserve(4);
    p.push_back({b.x, b.y});
    p.push_back({b.right(), b.y});
    p.push_back({b.right(), b.top()});
    p.push_back({b.x, b.top()});
    return Paths64{std::move(p)};
}

bool overlap(const Box& a, const Box& b, int64_t gap) {
    // quick reject before touching Clipper
    if(a.right() + gap <= b.x || b.right() + gap <= a.x ||
       a.top() + gap <= b.y || b.top() + gap <= a.y)
        return false;
    double delta = double(gap) * 0.5;
    Paths64 ea = InflatePaths(toPaths(a), delta, JoinType::Miter, EndType::Polygon);
    Paths64 eb = InflatePaths(toPaths(b), delta, JoinType::Miter, EndType::Polygon);
    Paths64 isect = Intersect(ea, eb, FillRule::NonZero);
    return std::abs(Area(isect)) > 0;
}

static Box placedBox(const Placement& p){
    return {toUnits(p.x), toUnits(p.y), toUnits(p.width), toUnits(p.height)};
}

std::vector<std::string> validateSheet(const Sheet& sheet, double gap_mm){
    std::vector<std::string> problems;
    const int64_t L = toUnits(sheet.length);
    const int64_t W = toUnits(sheet.width);
    const int64_t gap = toUnits(gap_mm);

    std::vector<Box> boxes;
    boxes.reserve(sheet.placements.size());
    for(const auto& p : sheet.placements) boxes.push_back(placedBox(p));

    for(size_t i = 0; i < boxes.size(); ++i){
        const Box& b = boxes[i];
        if(b.empty() || b.x < 0 || b.y < 0 || b.right() > L || b.top() > W){
            std::ostringstream ss;
            ss << "part " << sheet.placements[i].part_id << " at (" << sheet.placements[i].x
               << "," << sheet.placements[i].y << ") size " << sheet.placements[i].width << "x"
               << sheet.placements[i].height << " leaves sheet " << sheet.length << "x" << sheet.width;
            problems.push_back(ss.str());
        }
    }

    BVH bvh = buildBVH(boxes);
    size_t checks = 0;
    for(auto [i, j] : candidatePairs(bvh, gap)){
        ++checks;
        if(overlap(boxes[i], boxes[j], gap)){
            std::ostringstream ss;
            ss << "parts " << sheet.placements[i].part_id << " and " << sheet.placements[j].part_id
               << " closer than gap " << gap_mm << " mm";
            problems.push_back(ss.str());
        }
    }
    spdlog::debug("[VERIFY] sheet {}x{}: {} placements, {} pair checks, {} problem(s)",
                  sheet.length, sheet.width, boxes.size(), checks, problems.size());
    return problems;
}

}  // namespace panelnest
