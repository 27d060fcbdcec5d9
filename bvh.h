#ifndef PANELNEST_BVH_H
#define PANELNEST_BVH_H
#include "geometry.h"
#include <algorithm>
#include <functional>
#include <numeric>
#include <utility>
#include <vector>

namespace panelnest {

struct BVHNode {
    Box box;
    int left{-1};
    int right{-1};
    int index{-1};
};

struct BVH {
    std::vector<BVHNode> nodes;
};

inline Box combine(const Box& a, const Box& b){
    int64_t l = std::min(a.x, b.x), bo = std::min(a.y, b.y);
    int64_t r = std::max(a.right(), b.right()), t = std::max(a.top(), b.top());
    return {l, bo, r - l, t - bo};
}

// Median split along the longer axis of the node bounds.
inline BVH buildBVH(const std::vector<Box>& boxes){
    BVH bvh;
    size_t n = boxes.size();
    if(n == 0) return bvh;
    bvh.nodes.reserve(2*n);
    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::function<int(int,int)> build = [&](int l, int r){
        int nodeIdx = (int)bvh.nodes.size();
        bvh.nodes.push_back({});
        if(l == r){
            bvh.nodes[nodeIdx].index = indices[l];
            bvh.nodes[nodeIdx].box = boxes[indices[l]];
            return nodeIdx;
        }
        Box bounds = boxes[indices[l]];
        for(int i = l+1; i <= r; ++i) bounds = combine(bounds, boxes[indices[i]]);
        bool alongX = bounds.w >= bounds.h;
        std::sort(indices.begin()+l, indices.begin()+r+1, [&](int a, int b){
            const Box& ba = boxes[a];
            const Box& bb = boxes[b];
            return alongX ? (ba.x + ba.right()) < (bb.x + bb.right())
                          : (ba.y + ba.top()) < (bb.y + bb.top());
        });
        int mid = (l+r)/2;
        int left = build(l, mid);
        int right = build(mid+1, r);
        bvh.nodes[nodeIdx].left = left;
        bvh.nodes[nodeIdx].right = right;
        bvh.nodes[nodeIdx].box = combine(bvh.nodes[left].box, bvh.nodes[right].box);
        return nodeIdx;
    };
    build(0, (int)n-1);
    return bvh;
}

// Collects index pairs (i < j) whose boxes, grown by `margin` on every side, intersect.
inline void candidatePairs(const BVH& bvh, int aIdx, int bIdx, int64_t margin,
                           std::vector<std::pair<int,int>>& out){
    const BVHNode& na = bvh.nodes[aIdx];
    const BVHNode& nb = bvh.nodes[bIdx];
    if(na.box.right() + margin <= nb.box.x || nb.box.right() + margin <= na.box.x ||
       na.box.top() + margin <= nb.box.y || nb.box.top() + margin <= na.box.y)
        return;
    if(na.index != -1 && nb.index != -1){
        if(na.index < nb.index) out.emplace_back(na.index, nb.index);
        return;
    }
    if(na.index == -1){
        candidatePairs(bvh, na.left, bIdx, margin, out);
        candidatePairs(bvh, na.right, bIdx, margin, out);
    } else {
        candidatePairs(bvh, aIdx, nb.left, margin, out);
        candidatePairs(bvh, aIdx, nb.right, margin, out);
    }
}

inline std::vector<std::pair<int,int>> candidatePairs(const BVH& bvh, int64_t margin){
    std::vector<std::pair<int,int>> out;
    if(bvh.nodes.empty()) return out;
    candidatePairs(bvh, 0, 0, margin, out);
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

}  // namespace panelnest

#endif
