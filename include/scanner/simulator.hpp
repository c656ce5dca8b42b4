#pragma once
#include <string>
#include <variant>
#include <vector>
#include "settings.hpp"
#include "types.hpp"

namespace scanner {

struct Position {
    std::string symbol;
    Direction direction;
    long long entry_time;
    double entry_price;
    double confidence;
};

struct Flat {};
struct InPosition { Position position; };

using PositionState = std::variant<Flat, InPosition>;

// Single-symbol position state machine. Feed bars in timestamp order with the
// signals generated on each bar; closed trades are returned as they happen.
class TradeSimulator {
public:
    explicit TradeSimulator(SimulationConfig config);

    std::vector<Trade> step(const PriceBar& bar, const std::vector<Signal>& signals);

    // Force-closes an open position against the last processed bar.
    std::vector<Trade> finish(const PriceBar& last_bar);

    bool is_flat() const { return std::holds_alternative<Flat>(state_); }
    const PositionState& state() const { return state_; }
    const SimulationConfig& config() const { return config_; }

private:
    bool should_exit(const Position& pos, const PriceBar& bar,
                     const std::vector<Signal>& signals, ExitReason& reason) const;
    Trade close(const Position& pos, const PriceBar& bar, ExitReason reason) const;

    SimulationConfig config_;
    PositionState state_;
};

// HTF bars visible from a base bar at `timestamp`: every HTF bar dated (UTC) before
// that bar's day, then the last HTF bar of the same day. Without a same-day bar the
// result is empty.
std::vector<PriceBar> htf_window(const std::vector<PriceBar>& htf_bars, long long timestamp);

// Replays the rule set over one symbol's history, starting at the first bar with a
// full indicator window.
std::vector<Trade> simulate_symbol(
    const std::string& symbol,
    const std::vector<PriceBar>& bars,
    const std::vector<PriceBar>& htf_bars,
    const AlgorithmSettings& settings,
    const SimulationConfig& config
);

} // namespace scanner
