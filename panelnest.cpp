// panelnest: guillotine cutting of rectangular parts from stock sheets
//   panelnest --job job.json -o solution.json [--csv placements.csv] [--refine --pop 8 --gen 30]
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "job_io.h"
#include "packing_engine.h"
#include "report.h"

using namespace panelnest;

// ───────── CLI ─────────
struct CLI {
    std::string job;
    std::string out;
    std::string csv;
    bool strict = false;
    bool verbose = false;
};

// Command line values override the job file.
static CLI parse(int ac, char** av, Job& job){
    CLI c;
    cxxopts::Options options(av[0], "Rectangle cutting-stock packer");
    options.add_options()
        ("j,job", "job file (JSON)", cxxopts::value<std::string>())
        ("o,out", "solution JSON", cxxopts::value<std::string>())
        ("csv", "placement list CSV", cxxopts::value<std::string>())
        ("gap", "gap between parts, mm", cxxopts::value<double>())
        ("no-rotate", "disable 90 degree rotation")
        ("refine", "run the GA over part orderings")
        ("pop", "population size", cxxopts::value<int>())
        ("gen", "generations", cxxopts::value<int>())
        ("seed", "random seed", cxxopts::value<uint64_t>())
        ("top-k", "parent pool size", cxxopts::value<int>())
        ("mutation", "mutation rate", cxxopts::value<double>())
        ("patience", "generations without improvement before stopping", cxxopts::value<int>())
        ("time", "GA time limit, s", cxxopts::value<double>())
        ("verify", "check every sheet for overlaps and bounds")
        ("strict", "exit with 2 if any part is left unplaced")
        ("v,verbose", "verbose")
        ("h,help", "print help");
    options.parse_positional({"job"});

    auto result = options.parse(ac, av);
    if(result.count("help") || ac == 1){
        std::cout << options.help() << "\n";
        std::exit(0);
    }
    if(!result.count("job"))
        throw std::runtime_error("no job file, use --help for usage");

    c.job     = result["job"].as<std::string>();
    c.out     = result.count("out") ? result["out"].as<std::string>() : "";
    c.csv     = result.count("csv") ? result["csv"].as<std::string>() : "";
    c.strict  = result.count("strict") > 0;
    c.verbose = result.count("verbose") > 0;

    spdlog::set_pattern("[%H:%M:%S] %^%l%$ %v");
    spdlog::set_level(c.verbose ? spdlog::level::debug : spdlog::level::warn);

    job = loadJob(c.job);
    PackOptions& opt = job.options;
    if(result.count("gap"))       opt.gap = result["gap"].as<double>();
    if(result.count("no-rotate")) opt.allow_rotation = false;
    if(result.count("verify"))    opt.verify = true;

    bool ga = result.count("refine") || result.count("pop") || result.count("gen") ||
              result.count("seed") || result.count("top-k") || result.count("mutation") ||
              result.count("patience") || result.count("time");
    if(ga && !opt.refine) opt.refine = RefineConfig{};
    if(opt.refine){
        RefineConfig& r = *opt.refine;
        if(result.count("pop"))      r.population_size = result["pop"].as<int>();
        if(result.count("gen"))      r.generations = result["gen"].as<int>();
        if(result.count("seed"))     r.seed = result["seed"].as<uint64_t>();
        if(result.count("top-k"))    r.top_k = result["top-k"].as<int>();
        if(result.count("mutation")) r.mutation_rate = result["mutation"].as<double>();
        if(result.count("patience")) r.patience = result["patience"].as<int>();
        if(result.count("time"))     r.time_limit = result["time"].as<double>();
    }
    return c;
}

static void printSummary(const Solution& sol, const Report& rep, const Job& job){
    std::cout << "sheets " << sol.sheets.size() << ", placed " << rep.placed_count << '/'
              << rep.placed_count + rep.unplaced_count
              << ", utilization " << rep.utilization_pct << "%, waste " << rep.waste_pct << "%\n";
    for(const auto& kv : rep.sheet_size_histogram)
        std::cout << "  " << kv.first.first << 'x' << kv.first.second << ": " << kv.second << " sheet(s)\n";
    if(rep.sheets_per_material.size() > 1)
        for(const auto& kv : rep.sheets_per_material)
            std::cout << "  " << (kv.first.empty() ? "(no material)" : kv.first) << ": "
                      << kv.second << " sheet(s)\n";
    for(const auto& g : rep.groups){
        const std::string& name = job.stock[size_t(sol.sheets[g.first_sheet].stock_index)].name;
        std::cout << "  layout #" << g.first_sheet + 1 << (name.empty() ? "" : " [" + name + "]")
                  << (g.material.empty() ? "" : " " + g.material)
                  << " x" << g.count << ": " << g.parts_per_sheet << " part(s), "
                  << g.utilization_pct << "%\n";
    }
    for(const auto& u : sol.unplaced)
        std::cout << "  unplaced " << u.part_id << " (" << toString(u.reason) << ")\n";
}

int main(int argc, char* argv[])
{
    try {
        Job job;
        CLI cli = parse(argc, argv, job);
#ifdef _OPENMP
        spdlog::info("OpenMP threads: {}", omp_get_max_threads());
#endif
        Solution sol = pack(job.parts, job.stock, job.options);
        Report rep = summarize(sol);

        if(!cli.out.empty()) writeSolution(cli.out, sol, rep);
        if(!cli.csv.empty()) writePlacementsCsv(cli.csv, sol);
        printSummary(sol, rep, job);

        if(cli.strict && !sol.unplaced.empty())
            return 2;
        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "ERR: " << e.what() << "\n";
        return 1;
    }
}
