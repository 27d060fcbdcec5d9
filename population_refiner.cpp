#include "population_refiner.h"
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <exception>
#include <numeric>
#include <spdlog/spdlog.h>
#ifdef _OPENMP
#include <omp.h>
#endif

namespace panelnest {

Fitness score(const Solution& s){
    return {s.placedCount(), s.utilization(), s.sheets.size()};
}

// --- Кроссовер (order crossover) ---
// Positions [lo, hi) come from b; the other instances keep a's relative order.
Genome crossover(const Genome& a, const Genome& b, std::mt19937_64& rng) {
    const size_t n = a.order.size();
    Genome child;
    std::uniform_int_distribution<size_t> cut(0, n);
    size_t lo = cut(rng), hi = cut(rng);
    if (lo > hi) std::swap(lo, hi);
    if (n < 2 || lo == hi) {
        child.order = a.order;
        return child;
    }

    std::vector<char> fromB(n, 0);
    for (size_t i = lo; i < hi; ++i) fromB[size_t(b.order[i])] = 1;
    auto rest = a.order.begin();
    auto nextFromA = [&] {
        while (fromB[size_t(*rest)]) ++rest;
        return *rest++;
    };

    child.order.reserve(n);
    while (child.order.size() < lo) child.order.push_back(nextFromA());
    child.order.insert(child.order.end(), b.order.begin() + std::ptrdiff_t(lo), b.order.begin() + std::ptrdiff_t(hi));
    while (child.order.size() < n) child.order.push_back(nextFromA());
    return child;
}

// --- Мутация ---
void mutate(Genome& g, std::mt19937_64& rng, double rate) {
    std::uniform_real_distribution<double> prob(0.0, 1.0);
    if (g.order.size() < 2 || prob(rng) >= rate) return;
    std::uniform_int_distribution<size_t> pick(0, g.order.size()-1);
    size_t i = pick(rng), j = pick(rng);
    std::swap(g.order[i], g.order[j]);
}

PopulationRefiner::PopulationRefiner(const PackingEngine& engine, RefineConfig cfg)
    : engine_(engine), cfg_(cfg), rng_(cfg.seed) {}

std::vector<int> PopulationRefiner::jitteredOrder(std::mt19937_64& rng) const {
    const auto& inst = engine_.instances();
    std::uniform_real_distribution<double> noise(-cfg_.jitter, cfg_.jitter);
    std::vector<double> key(inst.size());
    for (size_t i = 0; i < inst.size(); ++i)
        key[i] = inst[i].area() * (1.0 + noise(rng));
    std::vector<int> order(inst.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](int a, int b){
        return key[size_t(a)] > key[size_t(b)];
    });
    return order;
}

bool PopulationRefiner::evaluate(Genome& g) {
    auto it = memo_.find(g.order);
    bool hit = it != memo_.end();
    if (hit) {
        g.layout = it->second;
    } else {
        g.layout = std::make_shared<const Solution>(engine_.run(g.order));
        ++evaluations_;
        if (memo_.size() < MEMO_MAX)
            memo_.insert({g.order, g.layout});
    }
    g.fitness = score(*g.layout);
    return hit;
}

static void sortPopulation(std::vector<Genome>& pop) {
    std::stable_sort(pop.begin(), pop.end(), [](const Genome& a, const Genome& b) {
        return a.fitness.betterThan(b.fitness);
    });
}

// Evaluates genomes in parallel. Exceptions are carried out of the parallel region.
static size_t evaluateAll(std::vector<Genome*>& todo, const std::function<bool(Genome&)>& eval) {
    std::vector<std::exception_ptr> errors(todo.size());
    std::vector<char> hits(todo.size(), 0);
#pragma omp parallel for schedule(dynamic)
    for (int k = 0; k < int(todo.size()); ++k) {
        try {
            hits[size_t(k)] = eval(*todo[size_t(k)]) ? 1 : 0;
        } catch (...) {
            errors[size_t(k)] = std::current_exception();
        }
    }
    for (auto& e : errors)
        if (e) std::rethrow_exception(e);
    return size_t(std::count(hits.begin(), hits.end(), 1));
}

Solution PopulationRefiner::refine() {
    auto t0 = std::chrono::steady_clock::now();
    auto elapsed = [&]{
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    };
    const size_t n = engine_.instances().size();
    const size_t popSize = size_t(cfg_.population_size);
    auto evalFn = [this](Genome& g){ return evaluate(g); };

#ifdef _OPENMP
    spdlog::info("GA: population {}, generations {}, seed {}, OpenMP threads {}",
                 popSize, cfg_.generations, cfg_.seed, omp_get_max_threads());
#else
    spdlog::info("GA: population {}, generations {}, seed {}, single thread",
                 popSize, cfg_.generations, cfg_.seed);
#endif

    // Инициализация популяции: canonical greedy order first, then jittered ones
    std::vector<Genome> pop(popSize);
    pop[0].order.resize(n);
    std::iota(pop[0].order.begin(), pop[0].order.end(), 0);
    for (size_t i = 1; i < popSize; ++i)
        pop[i].order = jitteredOrder(rng_);

    std::vector<Genome*> todo;
    for (auto& g : pop) todo.push_back(&g);
    size_t hits = evaluateAll(todo, evalFn);
    sortPopulation(pop);

    auto record = [&](int gen, size_t memoHits) {
        GenerationStats st;
        st.generation = gen;
        st.best = pop[0].fitness;
        double sum = 0;
        for (const auto& g : pop) sum += g.fitness.utilization;
        st.mean_utilization = sum / double(pop.size());
        st.memo_hits = memoHits;
        history_.push_back(st);
        spdlog::info("GA generation {} best utilization {:.2f}% placed {}/{} on {} sheet(s), mean {:.2f}%",
                     gen, st.best.utilization * 100.0, st.best.placed, n, st.best.sheets,
                     st.mean_utilization * 100.0);
    };
    record(0, hits);

    Genome best = pop[0];
    int stall = 0;
    const size_t topK = std::min(size_t(cfg_.top_k), pop.size());
    for (int gen = 1; gen <= cfg_.generations; ++gen) {
        if (cfg_.time_limit > 0 && elapsed() > cfg_.time_limit) {
            spdlog::info("GA time limit {:.1f}s reached after {} generation(s)", cfg_.time_limit, gen - 1);
            break;
        }
        // Элитизм: the best candidate survives unchanged
        std::vector<Genome> next;
        next.reserve(popSize);
        next.push_back(pop[0]);

        // parents and seeds are drawn up front so the result does not depend on threads
        std::vector<Genome> children(popSize - 1);
        std::vector<std::pair<size_t, size_t>> parents(children.size());
        std::vector<uint64_t> seeds(children.size());
        std::uniform_int_distribution<size_t> pickTop(0, topK - 1);
        for (size_t k = 0; k < children.size(); ++k) {
            size_t i1 = pickTop(rng_), i2 = pickTop(rng_);
            if (topK > 1)
                while (i2 == i1) i2 = pickTop(rng_);
            parents[k] = {i1, i2};
            seeds[k] = rng_();
        }
        for (size_t k = 0; k < children.size(); ++k) {
            std::mt19937_64 trng(seeds[k]);
            children[k] = crossover(pop[parents[k].first], pop[parents[k].second], trng);
            mutate(children[k], trng, cfg_.mutation_rate);
        }
        todo.clear();
        for (auto& c : children) todo.push_back(&c);
        hits = evaluateAll(todo, evalFn);

        for (auto& c : children) next.push_back(std::move(c));
        pop = std::move(next);
        sortPopulation(pop);
        record(gen, hits);

        if (pop[0].fitness.betterThan(best.fitness)) {
            best = pop[0];
            stall = 0;
        } else if (++stall >= cfg_.patience) {
            spdlog::info("GA: no improvement for {} generation(s), stopping", stall);
            break;
        }
    }
    spdlog::info("GA done: {} engine run(s) in {:.2f}s, best utilization {:.2f}%",
                 evaluations_.load(), elapsed(), best.fitness.utilization * 100.0);
    return *best.layout;
}

}  // namespace panelnest
