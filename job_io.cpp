#include "job_io.h"
#include "errors.h"
#include <fstream>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <spdlog/spdlog.h>

namespace panelnest {

using nlohmann::json;

// ───────── field helpers ─────────
namespace {

struct Reader {
    const std::string& source;

    [[noreturn]] void fail(const std::string& field, const std::string& what) const {
        throw JobFormatError(source + ": " + field + ": " + what);
    }

    double number(const json& obj, const char* key, const std::string& where) const {
        auto it = obj.find(key);
        if(it == obj.end()) fail(where + "." + key, "missing");
        if(!it->is_number()) fail(where + "." + key, "expected a number");
        return it->get<double>();
    }
    double number(const json& obj, const char* key, const std::string& where, double def) const {
        return obj.contains(key) ? number(obj, key, where) : def;
    }

    int integer(const json& obj, const char* key, const std::string& where, int def) const {
        auto it = obj.find(key);
        if(it == obj.end()) return def;
        if(!it->is_number_integer()) fail(where + "." + key, "expected an integer");
        // get<int>() would wrap silently
        if(it->is_number_unsigned()){
            if(it->get<uint64_t>() > uint64_t(std::numeric_limits<int>::max()))
                fail(where + "." + key, "out of range");
            return int(it->get<uint64_t>());
        }
        int64_t v = it->get<int64_t>();
        if(v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
            fail(where + "." + key, "out of range");
        return int(v);
    }

    bool flag(const json& obj, const char* key, const std::string& where, bool def) const {
        auto it = obj.find(key);
        if(it == obj.end()) return def;
        if(!it->is_boolean()) fail(where + "." + key, "expected true or false");
        return it->get<bool>();
    }

    std::string text(const json& obj, const char* key, const std::string& where, const std::string& def) const {
        auto it = obj.find(key);
        if(it == obj.end()) return def;
        if(it->is_string()) return it->get<std::string>();
        if(it->is_number_integer()) return std::to_string(it->get<long long>());
        fail(where + "." + key, "expected a string");
    }

    const json& array(const json& obj, const char* key) const {
        auto it = obj.find(key);
        if(it == obj.end()) fail(key, "missing");
        if(!it->is_array()) fail(key, "expected an array");
        return *it;
    }
};

}  // namespace

Job parseJob(const json& j, const std::string& source){
    Reader rd{source};
    if(!j.is_object()) rd.fail("<root>", "expected an object");

    Job job;
    job.options.gap = rd.number(j, "gap", "", 0.0);
    job.options.allow_rotation = rd.flag(j, "allow_rotation", "", true);
    job.options.verify = rd.flag(j, "verify", "", false);

    const json& parts = rd.array(j, "parts");
    for(size_t i = 0; i < parts.size(); ++i){
        std::string where = "parts[" + std::to_string(i) + "]";
        const json& p = parts[i];
        if(!p.is_object()) rd.fail(where, "expected an object");
        Part part;
        part.id = rd.text(p, "id", where, "P" + std::to_string(i + 1));
        part.length = rd.number(p, "length", where);
        part.height = rd.number(p, "height", where);
        part.quantity = rd.integer(p, "quantity", where, 1);
        part.material = rd.text(p, "material", where, "");
        job.parts.push_back(std::move(part));
    }

    const json& stock = rd.array(j, "stock");
    for(size_t i = 0; i < stock.size(); ++i){
        std::string where = "stock[" + std::to_string(i) + "]";
        const json& s = stock[i];
        if(!s.is_object()) rd.fail(where, "expected an object");
        StockType st;
        st.name = rd.text(s, "name", where, "");
        st.length = rd.number(s, "length", where);
        st.width = rd.number(s, "width", where);
        st.quantity = rd.integer(s, "quantity", where, kUnlimitedStock);
        st.material = rd.text(s, "material", where, "");
        job.stock.push_back(std::move(st));
    }

    auto it = j.find("refine");
    if(it != j.end() && !it->is_null()){
        if(!it->is_object()) rd.fail("refine", "expected an object");
        const json& r = *it;
        RefineConfig cfg;
        cfg.population_size = rd.integer(r, "population_size", "refine", cfg.population_size);
        cfg.generations = rd.integer(r, "generations", "refine", cfg.generations);
        if(r.contains("seed")){
            if(!r["seed"].is_number_unsigned()) rd.fail("refine.seed", "expected a non-negative integer");
            cfg.seed = r["seed"].get<uint64_t>();
        }
        cfg.top_k = rd.integer(r, "top_k", "refine", cfg.top_k);
        cfg.mutation_rate = rd.number(r, "mutation_rate", "refine", cfg.mutation_rate);
        cfg.jitter = rd.number(r, "jitter", "refine", cfg.jitter);
        cfg.patience = rd.integer(r, "patience", "refine", cfg.patience);
        cfg.time_limit = rd.number(r, "time_limit", "refine", cfg.time_limit);
        job.options.refine = cfg;
    }
    return job;
}

Job loadJob(const std::string& path){
    std::ifstream in(path);
    if(!in) throw JobFormatError(path + ": cannot open file");
    std::stringstream buf;
    buf << in.rdbuf();

    json j;
    try{
        j = json::parse(buf.str());
    }catch(const json::parse_error& e){
        throw JobFormatError(path + ": " + e.what());
    }
    Job job = parseJob(j, path);
    spdlog::info("[JSON] {}: {} part type(s), {} stock type(s)", path, job.parts.size(), job.stock.size());
    return job;
}

// ───────── output ─────────
json solutionToJson(const Solution& sol, const Report& report){
    json out;
    json sheets = json::array();
    for(const auto& s : sol.sheets){
        json places = json::array();
        for(const auto& p : s.placements)
            places.push_back({{"part_id", p.part_id}, {"x", p.x}, {"y", p.y},
                              {"width", p.width}, {"height", p.height}, {"rotated", p.rotated}});
        sheets.push_back({{"stock_index", s.stock_index}, {"length", s.length},
                          {"width", s.width}, {"material", s.material},
                          {"placements", std::move(places)}});
    }
    out["sheets"] = std::move(sheets);

    json unplaced = json::array();
    for(const auto& u : sol.unplaced)
        unplaced.push_back({{"part_id", u.part_id}, {"reason", toString(u.reason)}});
    out["unplaced"] = std::move(unplaced);
    out["stock_exhausted"] = sol.stock_exhausted;

    json hist = json::array();
    for(const auto& kv : report.sheet_size_histogram)
        hist.push_back({{"length", kv.first.first}, {"width", kv.first.second}, {"count", kv.second}});
    json groups = json::array();
    for(const auto& g : report.groups)
        groups.push_back({{"first_sheet", g.first_sheet}, {"count", g.count},
                          {"length", g.length}, {"width", g.width}, {"material", g.material},
                          {"parts_per_sheet", g.parts_per_sheet},
                          {"utilization_pct", g.utilization_pct}});
    out["report"] = {
        {"total_stock_area", report.total_stock_area},
        {"total_part_area", report.total_part_area},
        {"utilization_pct", report.utilization_pct},
        {"waste_pct", report.waste_pct},
        {"placed", report.placed_count},
        {"unplaced", report.unplaced_count},
        {"sheet_size_histogram", std::move(hist)},
        {"sheets_per_material", report.sheets_per_material},
        {"groups", std::move(groups)},
        {"sheet_utilization_pct", report.sheet_utilization_pct},
    };
    return out;
}

void writeSolution(const std::string& path, const Solution& sol, const Report& report){
    std::ofstream f(path);
    if(!f) throw std::runtime_error("cannot write " + path);
    f << solutionToJson(sol, report).dump(2) << "\n";
    spdlog::info("Solution written to {}", path);
}

void writePlacementsCsv(const std::string& path, const Solution& sol){
    std::ofstream csv(path);
    if(!csv) throw std::runtime_error("cannot write " + path);
    csv << "sheet,stock,part,x_mm,y_mm,width_mm,height_mm,rotated\n";
    for(size_t i = 0; i < sol.sheets.size(); ++i)
        for(const auto& pl : sol.sheets[i].placements)
            csv << i + 1 << ',' << sol.sheets[i].stock_index << ',' << pl.part_id << ','
                << std::fixed << std::setprecision(3)
                << pl.x << ',' << pl.y << ',' << pl.width << ',' << pl.height << ','
                << (pl.rotated ? 1 : 0) << "\n";
    spdlog::info("Placements written to {}", path);
}

}  // namespace panelnest
