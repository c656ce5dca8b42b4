#pragma once
#include <nlohmann/json.hpp>
#include "runner.hpp"
#include "settings.hpp"
#include "types.hpp"

namespace scanner {

using json = nlohmann::json;

void to_json(json& j, const PriceBar& b);
void to_json(json& j, const IndicatorSnapshot& s);
void to_json(json& j, const Signal& s);
void to_json(json& j, const Trade& t);
void to_json(json& j, const PerformanceSummary& s);
void to_json(json& j, const DirectionEvaluation& e);
void to_json(json& j, const SymbolEvaluation& e);
void to_json(json& j, const AlgorithmSettingsParams& p);
void to_json(json& j, const AlgorithmSettings& s);
void to_json(json& j, const SimulationConfig& c);
void to_json(json& j, const ScanStats& s);
void to_json(json& j, const ScanReport& r);
void to_json(json& j, const BacktestReport& r);

// Overlays the fields present in `j` onto `base`. Wrong JSON types raise ValidationError.
AlgorithmSettingsParams merge_params(const json& j, AlgorithmSettingsParams base);
SimulationConfig merge_simulation(const json& j, SimulationConfig base);

// merge_params onto the defaults, then range-checked construction.
AlgorithmSettings settings_from_json(const json& j);

void from_json(const json& j, AlgorithmSettingsParams& p);
void from_json(const json& j, SimulationConfig& c);

} // namespace scanner
