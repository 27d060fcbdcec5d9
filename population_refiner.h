#pragma once
#include "model.h"
#include "packing_engine.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <vector>
#include <tbb/concurrent_unordered_map.h>

namespace panelnest {

// Ranking key of a candidate layout: placed count, then utilization, then sheet count.
struct Fitness {
    size_t placed = 0;
    double utilization = 0.0;
    size_t sheets = 0;

    bool betterThan(const Fitness& o) const {
        if(placed != o.placed) return placed > o.placed;
        if(utilization != o.utilization) return utilization > o.utilization;
        return sheets < o.sheets;
    }
};

Fitness score(const Solution& s);

// --- Genetic Algorithm Structures ---
struct Genome {
    std::vector<int> order;                  // permutation of PackingEngine::instances()
    Fitness fitness;
    std::shared_ptr<const Solution> layout;  // result of the engine run
};

struct GenerationStats {
    int generation = 0;
    Fitness best;
    double mean_utilization = 0.0;
    size_t memo_hits = 0;
};

struct OrderHash {
    size_t operator()(const std::vector<int>& v) const {
        uint64_t h = 1469598103934665603ull;   // FNV-1a
        for(int x : v){
            h ^= uint64_t(uint32_t(x));
            h *= 1099511628211ull;
        }
        return size_t(h);
    }
};

// Order crossover: a slice of `b` in place, the remaining instances in `a`'s order.
Genome crossover(const Genome& a, const Genome& b, std::mt19937_64& rng);
// Swaps two positions with probability `rate`.
void mutate(Genome& g, std::mt19937_64& rng, double rate);

// Searches over part orderings with a small GA. Each candidate is a full
// PackingEngine run, so every candidate accounts for every part instance.
class PopulationRefiner {
public:
    static constexpr size_t MEMO_MAX = 20000;

    PopulationRefiner(const PackingEngine& engine, RefineConfig cfg);

    Solution refine();
    const std::vector<GenerationStats>& history() const { return history_; }
    size_t evaluations() const { return evaluations_.load(); }

private:
    std::vector<int> jitteredOrder(std::mt19937_64& rng) const;
    bool evaluate(Genome& g);   // true on memo hit

    const PackingEngine& engine_;
    RefineConfig cfg_;
    std::mt19937_64 rng_;
    tbb::concurrent_unordered_map<std::vector<int>, std::shared_ptr<const Solution>, OrderHash> memo_;
    std::vector<GenerationStats> history_;
    std::atomic<size_t> evaluations_{0};
};

}  // namespace panelnest
