#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scanner {

struct PriceBar {
    std::string symbol;
    long long timestamp;  // epoch seconds, UTC
    double open, high, low, close;
    long long volume;
};

struct IndicatorSnapshot {
    double ema5, ema8, ema13, ema21, ema50;
    double atr;
    double atr_long_line, atr_short_line;
};

enum class Direction { Long, Short };

const char* to_string(Direction d);
Direction parse_direction(const std::string& s);
Direction opposite(Direction d);

struct Signal {
    std::string symbol;
    Direction direction;
    long long timestamp;
    double price;
    IndicatorSnapshot indicators;
    double confidence;
};

enum class ExitReason { OppositeSignal, StopLoss, TakeProfit, Timeout, EndOfData };

const char* to_string(ExitReason r);

struct Trade {
    std::string symbol;
    long long entry_time, exit_time;
    double entry_price, exit_price;
    Direction direction;
    double pnl;          // price units, after commission
    double pnl_percent;  // fraction of entry price, before commission
    ExitReason exit_reason;
};

struct PerformanceSummary {
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double win_rate = 0.0;
    double total_return = 0.0;
    double average_return = 0.0;
    double max_drawdown = 0.0;
    double sharpe_ratio = 0.0;
};

// Rule set conditions, in evaluation order.
enum class ConditionId {
    PolarFormation,
    EmaPositioning,
    EmaMomentum,
    FomoFilter,
    VolatilityFilter,
    HtfConfirmation
};

constexpr std::size_t kConditionCount = 6;

const char* condition_key(ConditionId id);
std::string condition_name(ConditionId id, Direction d);
std::string condition_failure_reason(ConditionId id, Direction d);

struct DirectionEvaluation {
    Direction direction = Direction::Long;
    std::array<bool, kConditionCount> passed{};
    bool htf_evaluated = false;
    int conditions_met = 0;
    int total_conditions = 0;
    double confidence = 0.0;
    bool valid = false;

    bool passed_condition(ConditionId id) const { return passed[static_cast<std::size_t>(id)]; }
    std::vector<std::string> satisfied_conditions() const;
    std::vector<std::string> failure_reasons() const;
};

struct SignalBatch {
    std::vector<Signal> signals;
    // Only meaningful when evaluated is true; false means the indicators could not be computed.
    bool evaluated = false;
    DirectionEvaluation long_evaluation;
    DirectionEvaluation short_evaluation;
};

// Per-symbol scan outcome, kept whether or not a signal fired.
struct SymbolEvaluation {
    std::string symbol;
    long long timestamp = 0;
    double price = 0.0;
    std::size_t bars = 0;
    bool evaluated = false;
    DirectionEvaluation long_evaluation;
    DirectionEvaluation short_evaluation;
    std::string error;
};

} // namespace scanner
