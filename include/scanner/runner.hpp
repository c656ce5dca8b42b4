#pragma once
#include <string>
#include <vector>
#include "settings.hpp"
#include "types.hpp"

namespace scanner {

constexpr int kDefaultScanWorkers = 5;
constexpr int kDefaultBacktestWorkers = 3;

// Price history for one symbol: base timeframe bars plus optional HTF bars.
struct SymbolData {
    std::string symbol;
    std::vector<PriceBar> bars;
    std::vector<PriceBar> htf_bars;
};

struct ScanStats {
    int total_symbols = 0;
    int processed = 0;
    int failed = 0;
    int signals_found = 0;
    double execution_seconds = 0.0;
};

struct ScanReport {
    std::string id;
    long long timestamp = 0;
    std::vector<std::string> symbols;
    std::vector<Signal> signals;
    std::vector<SymbolEvaluation> evaluations;
    AlgorithmSettings settings;
    ScanStats stats;
};

struct BacktestReport {
    std::string id;
    long long timestamp = 0;
    std::vector<std::string> symbols;
    std::vector<Trade> trades;
    PerformanceSummary summary;
    AlgorithmSettings settings;
    SimulationConfig simulation;
    int failed_symbols = 0;
    double execution_seconds = 0.0;
};

// Random 128-bit identifier formatted as a UUID v4 string.
std::string make_run_id();

ScanReport scan_symbols(const std::vector<SymbolData>& inputs,
                        const AlgorithmSettings& settings,
                        int max_workers = kDefaultScanWorkers);

BacktestReport run_backtest(const std::vector<SymbolData>& inputs,
                            const AlgorithmSettings& settings,
                            const SimulationConfig& config,
                            int max_workers = kDefaultBacktestWorkers);

} // namespace scanner
