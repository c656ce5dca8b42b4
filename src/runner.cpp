#include "../include/scanner/runner.hpp"
#include "../include/scanner/performance.hpp"
#include "../include/scanner/signal_engine.hpp"
#include "../include/scanner/simulator.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <exception>
#include <random>
#include <thread>

namespace scanner {

namespace {

// Runs fn(0..count-1) on up to max_workers threads. fn must not throw.
template <typename Fn>
void parallel_for(std::size_t count, int max_workers, Fn&& fn) {
    const std::size_t workers = std::min<std::size_t>(count, static_cast<std::size_t>(std::max(1, max_workers)));
    std::atomic<std::size_t> next{0};
    auto work = [&] {
        for (std::size_t i = next++; i < count; i = next++) {
            fn(i);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (std::size_t w = 0; w < workers; ++w) {
        pool.emplace_back(work);
    }
    for (auto& t : pool) t.join();
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

long long now_epoch() {
    return static_cast<long long>(std::time(nullptr));
}

} // namespace

std::string make_run_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t hi = rng();
    std::uint64_t lo = rng();
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

ScanReport scan_symbols(const std::vector<SymbolData>& inputs,
                        const AlgorithmSettings& settings,
                        int max_workers) {
    const auto started = std::chrono::steady_clock::now();

    ScanReport report;
    report.id = make_run_id();
    report.timestamp = now_epoch();
    report.settings = settings;
    report.stats.total_symbols = static_cast<int>(inputs.size());

    spdlog::info("[scan] {} starting: {} symbols, {} workers", report.id, inputs.size(), max_workers);

    std::vector<SymbolEvaluation> slots(inputs.size());
    std::vector<std::vector<Signal>> found(inputs.size());
    std::vector<char> failed(inputs.size(), 0);

    parallel_for(inputs.size(), max_workers, [&](std::size_t i) {
        const auto& in = inputs[i];
        auto& ev = slots[i];
        ev.symbol = in.symbol;
        ev.bars = in.bars.size();
        try {
            if (in.bars.empty()) {
                ev.error = "No data available";
                spdlog::warn("[scan] no data for {}", in.symbol);
                return;
            }
            ev.timestamp = in.bars.back().timestamp;
            ev.price = in.bars.back().close;
            if (in.bars.size() <= kMinHistoryBars) {
                ev.error = "Insufficient data (" + std::to_string(in.bars.size()) + " bars)";
                spdlog::warn("[scan] insufficient data for {}: {} points", in.symbol, in.bars.size());
                return;
            }

            auto batch = generate_signals(in.bars, in.htf_bars, settings);
            ev.evaluated = batch.evaluated;
            ev.long_evaluation = batch.long_evaluation;
            ev.short_evaluation = batch.short_evaluation;
            if (!batch.evaluated) {
                ev.error = "Indicators could not be computed";
            }
            found[i] = std::move(batch.signals);
        } catch (const std::exception& e) {
            failed[i] = 1;
            ev.error = e.what();
            spdlog::error("[scan] error processing {}: {}", in.symbol, e.what());
        }
    });

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        report.symbols.push_back(inputs[i].symbol);
        if (failed[i]) {
            report.stats.failed++;
        } else {
            report.stats.processed++;
        }
        report.signals.insert(report.signals.end(), found[i].begin(), found[i].end());
    }
    report.evaluations = std::move(slots);
    report.stats.signals_found = static_cast<int>(report.signals.size());
    report.stats.execution_seconds = seconds_since(started);

    spdlog::info("[scan] {} completed: {}/{} symbols processed, {} signals found in {:.2f}s",
                 report.id, report.stats.processed, report.stats.total_symbols,
                 report.stats.signals_found, report.stats.execution_seconds);
    return report;
}

BacktestReport run_backtest(const std::vector<SymbolData>& inputs,
                            const AlgorithmSettings& settings,
                            const SimulationConfig& config,
                            int max_workers) {
    validate(config);
    const auto started = std::chrono::steady_clock::now();

    BacktestReport report;
    report.id = make_run_id();
    report.timestamp = now_epoch();
    report.settings = settings;
    report.simulation = config;

    spdlog::info("[backtest] {} starting: {} symbols, {} workers", report.id, inputs.size(), max_workers);

    std::vector<std::vector<Trade>> slots(inputs.size());
    std::vector<char> failed(inputs.size(), 0);

    parallel_for(inputs.size(), max_workers, [&](std::size_t i) {
        const auto& in = inputs[i];
        try {
            if (in.bars.size() <= kMinHistoryBars) {
                spdlog::warn("[backtest] insufficient data for {}: {} points", in.symbol, in.bars.size());
                return;
            }
            slots[i] = simulate_symbol(in.symbol, in.bars, in.htf_bars, settings, config);
        } catch (const std::exception& e) {
            failed[i] = 1;
            spdlog::error("[backtest] error processing {}: {}", in.symbol, e.what());
        }
    });

    for (std::size_t i = 0; i < inputs.size(); ++i) {
        report.symbols.push_back(inputs[i].symbol);
        if (failed[i]) report.failed_symbols++;
        report.trades.insert(report.trades.end(), slots[i].begin(), slots[i].end());
    }
    report.summary = analyze_performance(report.trades);
    report.execution_seconds = seconds_since(started);

    spdlog::info("[backtest] {} completed: {} trades, win rate {:.2f}, total return {:.4f} in {:.2f}s",
                 report.id, report.summary.total_trades, report.summary.win_rate,
                 report.summary.total_return, report.execution_seconds);
    return report;
}

} // namespace scanner
