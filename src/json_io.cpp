#include "../include/scanner/json_io.hpp"
#include "../include/scanner/errors.hpp"
#include "../include/scanner/utils.hpp"
#include <cmath>
#include <cstdint>
#include <limits>

namespace scanner {

namespace {

double read_number(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number()) {
        throw ValidationError(std::string(key) + " must be a number");
    }
    return v.get<double>();
}

int read_int(const json& j, const char* key) {
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ValidationError(std::string(key) + " must be an integer");
    }
    if (v.is_number_unsigned()) {
        if (v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(std::string(key) + " out of range");
        }
        return static_cast<int>(v.get<std::uint64_t>());
    }
    const auto wide = v.get<std::int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        throw ValidationError(std::string(key) + " out of range");
    }
    return static_cast<int>(wide);
}

template <typename T, typename Reader>
void overlay(const json& j, const char* key, T& field, Reader read) {
    if (j.contains(key)) field = read(j, key);
}

template <typename T, typename Reader>
void overlay_optional(const json& j, const char* key, std::optional<T>& field, Reader read) {
    if (!j.contains(key)) return;
    if (j.at(key).is_null()) {
        field.reset();
    } else {
        field = read(j, key);
    }
}

// Non-finite doubles have no JSON form.
json number_or_null(double v) {
    return std::isfinite(v) ? json(v) : json(nullptr);
}

} // namespace

void to_json(json& j, const PriceBar& b) {
    j = json{
        {"symbol", b.symbol},
        {"timestamp", format_iso_utc(b.timestamp)},
        {"open", b.open},
        {"high", b.high},
        {"low", b.low},
        {"close", b.close},
        {"volume", b.volume}
    };
}

void to_json(json& j, const IndicatorSnapshot& s) {
    j = json{
        {"ema5", number_or_null(s.ema5)},
        {"ema8", number_or_null(s.ema8)},
        {"ema13", number_or_null(s.ema13)},
        {"ema21", number_or_null(s.ema21)},
        {"ema50", number_or_null(s.ema50)},
        {"atr", number_or_null(s.atr)},
        {"atr_long_line", number_or_null(s.atr_long_line)},
        {"atr_short_line", number_or_null(s.atr_short_line)}
    };
}

void to_json(json& j, const Signal& s) {
    j = json{
        {"symbol", s.symbol},
        {"signal_type", to_string(s.direction)},
        {"timestamp", format_iso_utc(s.timestamp)},
        {"price", s.price},
        {"indicators", s.indicators},
        {"confidence", s.confidence}
    };
}

void to_json(json& j, const Trade& t) {
    j = json{
        {"symbol", t.symbol},
        {"trade_type", to_string(t.direction)},
        {"entry_date", format_iso_utc(t.entry_time)},
        {"exit_date", format_iso_utc(t.exit_time)},
        {"entry_price", t.entry_price},
        {"exit_price", t.exit_price},
        {"pnl", t.pnl},
        {"pnl_percent", t.pnl_percent},
        {"exit_reason", to_string(t.exit_reason)}
    };
}

void to_json(json& j, const PerformanceSummary& s) {
    j = json{
        {"total_trades", s.total_trades},
        {"winning_trades", s.winning_trades},
        {"losing_trades", s.losing_trades},
        {"win_rate", s.win_rate},
        {"total_return", s.total_return},
        {"average_return", s.average_return},
        {"max_drawdown", s.max_drawdown},
        {"sharpe_ratio", s.sharpe_ratio}
    };
}

void to_json(json& j, const DirectionEvaluation& e) {
    json conditions = json::object();
    for (std::size_t i = 0; i < kConditionCount; ++i) {
        auto id = static_cast<ConditionId>(i);
        if (id == ConditionId::HtfConfirmation && !e.htf_evaluated) {
            conditions[condition_key(id)] = nullptr;
        } else {
            conditions[condition_key(id)] = e.passed[i];
        }
    }
    j = json{
        {"direction", to_string(e.direction)},
        {"conditions", conditions},
        {"conditions_met", e.conditions_met},
        {"total_conditions", e.total_conditions},
        {"confidence", e.confidence},
        {"valid", e.valid},
        {"satisfied_conditions", e.satisfied_conditions()},
        {"failure_reasons", e.failure_reasons()}
    };
}

void to_json(json& j, const SymbolEvaluation& e) {
    j = json{
        {"symbol", e.symbol},
        {"bars", e.bars},
        {"evaluated", e.evaluated}
    };
    if (e.timestamp) {
        j["timestamp"] = format_iso_utc(e.timestamp);
        j["price"] = e.price;
    }
    if (e.evaluated) {
        j["long"] = e.long_evaluation;
        j["short"] = e.short_evaluation;
    }
    if (!e.error.empty()) {
        j["error"] = e.error;
    }
}

void to_json(json& j, const AlgorithmSettingsParams& p) {
    j = json{
        {"atr_multiplier", p.atr_multiplier},
        {"ema5_rising_threshold", p.ema5_rising_threshold},
        {"ema8_rising_threshold", p.ema8_rising_threshold},
        {"ema21_rising_threshold", p.ema21_rising_threshold},
        {"volatility_filter", p.volatility_filter},
        {"fomo_filter", p.fomo_filter},
        {"higher_timeframe", p.higher_timeframe}
    };
}

void to_json(json& j, const AlgorithmSettings& s) {
    to_json(j, s.params());
}

void to_json(json& j, const SimulationConfig& c) {
    j = json{
        {"entry_delay_minutes", c.entry_delay_minutes},
        {"stop_loss_percent", c.stop_loss_percent ? json(*c.stop_loss_percent) : json(nullptr)},
        {"take_profit_percent", c.take_profit_percent ? json(*c.take_profit_percent) : json(nullptr)},
        {"max_hold_days", c.max_hold_days ? json(*c.max_hold_days) : json(nullptr)},
        {"commission_per_trade", c.commission_per_trade},
        {"min_confidence", kMinEntryConfidence}
    };
}

void to_json(json& j, const ScanStats& s) {
    j = json{
        {"total_symbols", s.total_symbols},
        {"symbols_processed", s.processed},
        {"symbols_failed", s.failed},
        {"signals_found", s.signals_found},
        {"execution_time", s.execution_seconds}
    };
}

void to_json(json& j, const ScanReport& r) {
    j = json{
        {"id", r.id},
        {"timestamp", format_iso_utc(r.timestamp)},
        {"symbols_scanned", r.symbols},
        {"signals_found", r.signals},
        {"settings_used", r.settings},
        {"execution_time", r.stats.execution_seconds},
        {"stats", r.stats},
        {"evaluations", r.evaluations}
    };
}

void to_json(json& j, const BacktestReport& r) {
    j = json{
        {"id", r.id},
        {"timestamp", format_iso_utc(r.timestamp)},
        {"symbols", r.symbols},
        {"trades", r.trades},
        {"performance", r.summary},
        {"settings_used", r.settings},
        {"simulation", r.simulation},
        {"failed_symbols", r.failed_symbols},
        {"execution_time", r.execution_seconds}
    };
}

AlgorithmSettingsParams merge_params(const json& j, AlgorithmSettingsParams base) {
    if (!j.is_object()) {
        throw ValidationError("settings must be a JSON object");
    }
    overlay(j, "atr_multiplier", base.atr_multiplier, read_number);
    overlay(j, "ema5_rising_threshold", base.ema5_rising_threshold, read_number);
    overlay(j, "ema8_rising_threshold", base.ema8_rising_threshold, read_number);
    overlay(j, "ema21_rising_threshold", base.ema21_rising_threshold, read_number);
    overlay(j, "volatility_filter", base.volatility_filter, read_number);
    overlay(j, "fomo_filter", base.fomo_filter, read_number);
    if (j.contains("higher_timeframe")) {
        const auto& v = j.at("higher_timeframe");
        if (!v.is_string()) {
            throw ValidationError("higher_timeframe must be a string");
        }
        base.higher_timeframe = v.get<std::string>();
    }
    return base;
}

SimulationConfig merge_simulation(const json& j, SimulationConfig base) {
    if (!j.is_object()) {
        throw ValidationError("simulation must be a JSON object");
    }
    overlay(j, "entry_delay_minutes", base.entry_delay_minutes, read_int);
    overlay_optional(j, "stop_loss_percent", base.stop_loss_percent, read_number);
    overlay_optional(j, "take_profit_percent", base.take_profit_percent, read_number);
    overlay_optional(j, "max_hold_days", base.max_hold_days, read_int);
    overlay(j, "commission_per_trade", base.commission_per_trade, read_number);
    return base;
}

AlgorithmSettings settings_from_json(const json& j) {
    return AlgorithmSettings(merge_params(j, AlgorithmSettingsParams{}));
}

void from_json(const json& j, AlgorithmSettingsParams& p) {
    p = merge_params(j, AlgorithmSettingsParams{});
}

void from_json(const json& j, SimulationConfig& c) {
    c = merge_simulation(j, SimulationConfig{});
}

} // namespace scanner
