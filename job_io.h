#pragma once
#include "model.h"
#include "report.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace panelnest {

struct Job {
    std::vector<Part> parts;
    std::vector<StockType> stock;
    PackOptions options;
};

// Throws JobFormatError naming `source` and the offending field.
Job parseJob(const nlohmann::json& j, const std::string& source = "<job>");
Job loadJob(const std::string& path);

nlohmann::json solutionToJson(const Solution& sol, const Report& report);
void writeSolution(const std::string& path, const Solution& sol, const Report& report);
// One line per placement: sheet,stock,part,x_mm,y_mm,width_mm,height_mm,rotated
void writePlacementsCsv(const std::string& path, const Solution& sol);

}  // namespace panelnest
