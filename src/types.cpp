#include "../include/scanner/types.hpp"
#include "../include/scanner/errors.hpp"

namespace scanner {

const char* to_string(Direction d) {
    return d == Direction::Long ? "long" : "short";
}

Direction parse_direction(const std::string& s) {
    if (s == "long") return Direction::Long;
    if (s == "short") return Direction::Short;
    throw ValidationError("direction must be 'long' or 'short', got '" + s + "'");
}

Direction opposite(Direction d) {
    return d == Direction::Long ? Direction::Short : Direction::Long;
}

const char* to_string(ExitReason r) {
    switch (r) {
        case ExitReason::OppositeSignal: return "opposite_signal";
        case ExitReason::StopLoss:       return "stop_loss";
        case ExitReason::TakeProfit:     return "take_profit";
        case ExitReason::Timeout:        return "timeout";
        case ExitReason::EndOfData:      return "end_of_data";
    }
    return "unknown";
}

const char* condition_key(ConditionId id) {
    switch (id) {
        case ConditionId::PolarFormation:   return "polar_formation";
        case ConditionId::EmaPositioning:   return "ema_positioning";
        case ConditionId::EmaMomentum:      return "ema_momentum";
        case ConditionId::FomoFilter:       return "fomo_filter";
        case ConditionId::VolatilityFilter: return "volatility_filter";
        case ConditionId::HtfConfirmation:  return "htf_confirmation";
    }
    return "unknown";
}

std::string condition_name(ConditionId id, Direction d) {
    const bool is_long = d == Direction::Long;
    switch (id) {
        case ConditionId::PolarFormation:
            return is_long ? "Bullish polar formation" : "Bearish polar formation";
        case ConditionId::EmaPositioning:
            return is_long ? "EMA5 below ATR long line" : "EMA5 above ATR short line";
        case ConditionId::EmaMomentum:
            return is_long ? "Rising EMAs" : "Falling EMAs";
        case ConditionId::FomoFilter:
            return "FOMO filter passed";
        case ConditionId::VolatilityFilter:
            return "Volatility filter passed";
        case ConditionId::HtfConfirmation:
            return "HTF confirmation";
    }
    return "unknown";
}

std::string condition_failure_reason(ConditionId id, Direction d) {
    const bool is_long = d == Direction::Long;
    switch (id) {
        case ConditionId::PolarFormation:
            return is_long ? "Failed bullish polar formation" : "Failed bearish polar formation";
        case ConditionId::EmaPositioning:
            return is_long ? "EMA5 not below ATR long line" : "EMA5 not above ATR short line";
        case ConditionId::EmaMomentum:
            return is_long ? "EMAs not rising sufficiently" : "EMAs not falling sufficiently";
        case ConditionId::FomoFilter:
            return "Failed FOMO filter (price too extended)";
        case ConditionId::VolatilityFilter:
            return "Failed volatility filter";
        case ConditionId::HtfConfirmation:
            return "Failed HTF confirmation";
    }
    return "unknown";
}

std::vector<std::string> DirectionEvaluation::satisfied_conditions() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < kConditionCount; ++i) {
        auto id = static_cast<ConditionId>(i);
        if (id == ConditionId::HtfConfirmation && !htf_evaluated) continue;
        if (passed[i]) out.push_back(condition_name(id, direction));
    }
    return out;
}

std::vector<std::string> DirectionEvaluation::failure_reasons() const {
    std::vector<std::string> out;
    for (std::size_t i = 0; i < kConditionCount; ++i) {
        auto id = static_cast<ConditionId>(i);
        if (id == ConditionId::HtfConfirmation && !htf_evaluated) {
            out.push_back("No HTF data available");
            continue;
        }
        if (!passed[i]) out.push_back(condition_failure_reason(id, direction));
    }
    return out;
}

} // namespace scanner
