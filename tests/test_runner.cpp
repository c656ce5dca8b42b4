#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <string>
#include <vector>
#include "scanner/errors.hpp"
#include "scanner/runner.hpp"
#include "test_helpers.hpp"

using namespace scanner;

namespace {

std::vector<SymbolData> scan_inputs() {
    auto rise = test_helpers::rising_series("RISE", 60);
    auto flat = test_helpers::flat_series("FLAT", 60, 20.0);
    return {
        SymbolData{"RISE", rise, rise},
        SymbolData{"FLAT", flat, flat},
        SymbolData{"SHRT", test_helpers::flat_series("SHRT", 20, 5.0), {}},
        SymbolData{"NONE", {}, {}},
    };
}

} // namespace

TEST(MakeRunId, IsUuidV4) {
    const std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = make_run_id();
        EXPECT_TRUE(std::regex_match(id, uuid)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(ScanSymbols, MixedUniverse) {
    auto report = scan_symbols(scan_inputs(), test_helpers::trend_settings(), 2);

    EXPECT_FALSE(report.id.empty());
    EXPECT_GT(report.timestamp, 0);
    EXPECT_EQ(report.symbols, (std::vector<std::string>{"RISE", "FLAT", "SHRT", "NONE"}));
    EXPECT_EQ(report.stats.total_symbols, 4);
    EXPECT_EQ(report.stats.processed, 4);
    EXPECT_EQ(report.stats.failed, 0);

    ASSERT_EQ(report.signals.size(), 1u);
    EXPECT_EQ(report.signals[0].symbol, "RISE");
    EXPECT_EQ(report.signals[0].direction, Direction::Long);
    EXPECT_EQ(report.stats.signals_found, 1);

    ASSERT_EQ(report.evaluations.size(), 4u);
    EXPECT_TRUE(report.evaluations[0].evaluated);
    EXPECT_TRUE(report.evaluations[0].long_evaluation.valid);
    EXPECT_TRUE(report.evaluations[1].evaluated);
    EXPECT_FALSE(report.evaluations[1].long_evaluation.valid);
    EXPECT_FALSE(report.evaluations[2].evaluated);
    EXPECT_EQ(report.evaluations[2].error, "Insufficient data (20 bars)");
    EXPECT_EQ(report.evaluations[2].bars, 20u);
    EXPECT_EQ(report.evaluations[3].error, "No data available");
}

TEST(ScanSymbols, FiftyBarsIsNotEvaluated) {
    auto bars = test_helpers::flat_series("HALF", 50, 10.0);
    auto report = scan_symbols({SymbolData{"HALF", bars, {}}}, AlgorithmSettings{}, 1);
    ASSERT_EQ(report.evaluations.size(), 1u);
    EXPECT_FALSE(report.evaluations[0].evaluated);
    EXPECT_EQ(report.evaluations[0].error, "Insufficient data (50 bars)");
    EXPECT_EQ(report.stats.processed, 1);
}

TEST(ScanSymbols, FiftyOneBarsIsEvaluated) {
    auto bars = test_helpers::flat_series("FULL", 51, 10.0);
    auto report = scan_symbols({SymbolData{"FULL", bars, {}}}, AlgorithmSettings{}, 1);
    ASSERT_EQ(report.evaluations.size(), 1u);
    EXPECT_TRUE(report.evaluations[0].evaluated);
    EXPECT_TRUE(report.evaluations[0].error.empty());
}

TEST(ScanSymbols, EmptyUniverse) {
    auto report = scan_symbols({}, AlgorithmSettings{});
    EXPECT_EQ(report.stats.total_symbols, 0);
    EXPECT_TRUE(report.signals.empty());
    EXPECT_TRUE(report.evaluations.empty());
}

TEST(RunBacktest, ResultIndependentOfWorkerCount) {
    std::vector<SymbolData> inputs;
    for (const char* sym : {"AAA", "BBB", "CCC", "DDD"}) {
        auto bars = test_helpers::rising_series(sym, 60);
        inputs.push_back(SymbolData{sym, bars, bars});
    }
    SimulationConfig cfg;
    cfg.max_hold_days = 2;

    auto serial = run_backtest(inputs, test_helpers::trend_settings(), cfg, 1);
    auto parallel = run_backtest(inputs, test_helpers::trend_settings(), cfg, 4);

    ASSERT_EQ(serial.trades.size(), 12u);
    ASSERT_EQ(serial.trades.size(), parallel.trades.size());
    for (std::size_t i = 0; i < serial.trades.size(); ++i) {
        EXPECT_EQ(serial.trades[i].symbol, parallel.trades[i].symbol);
        EXPECT_EQ(serial.trades[i].entry_time, parallel.trades[i].entry_time);
        EXPECT_EQ(serial.trades[i].exit_reason, parallel.trades[i].exit_reason);
    }
    EXPECT_EQ(serial.trades.front().symbol, "AAA");
    EXPECT_EQ(serial.trades.back().symbol, "DDD");
    EXPECT_EQ(serial.summary.total_trades, 12);
    EXPECT_DOUBLE_EQ(serial.summary.total_return, parallel.summary.total_return);
    EXPECT_NE(serial.id, parallel.id);
}

TEST(RunBacktest, SkipsSymbolsWithoutHistory) {
    auto bars = test_helpers::rising_series("RISE", 60);
    std::vector<SymbolData> inputs = {
        SymbolData{"RISE", bars, bars},
        SymbolData{"SHRT", test_helpers::flat_series("SHRT", 10, 5.0), {}},
    };
    auto report = run_backtest(inputs, test_helpers::trend_settings(), SimulationConfig{});
    EXPECT_EQ(report.trades.size(), 1u);
    EXPECT_EQ(report.failed_symbols, 0);
    EXPECT_EQ(report.symbols.size(), 2u);
}

TEST(RunBacktest, RejectsInvalidSimulation) {
    SimulationConfig cfg;
    cfg.max_hold_days = 0;
    EXPECT_THROW(run_backtest({}, AlgorithmSettings{}, cfg), ValidationError);
}
