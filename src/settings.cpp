#include "../include/scanner/settings.hpp"
#include "../include/scanner/errors.hpp"
#include <cctype>
#include <cmath>
#include <sstream>

namespace scanner {

namespace {

struct TimeframeInfo {
    Timeframe tf;
    const char* name;
    long long seconds;
};

const TimeframeInfo kTimeframes[] = {
    {Timeframe::M1,  "1m",  60},
    {Timeframe::M2,  "2m",  120},
    {Timeframe::M5,  "5m",  300},
    {Timeframe::M15, "15m", 900},
    {Timeframe::M30, "30m", 1800},
    {Timeframe::H1,  "1h",  3600},
    {Timeframe::H2,  "2h",  7200},
    {Timeframe::H4,  "4h",  14400},
    {Timeframe::D1,  "1d",  86400},
};

std::string format_bound(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

void check_range(const ParameterRange& range, double value, std::vector<std::string>& errors) {
    if (!std::isfinite(value)) {
        errors.push_back(std::string(range.name) + " must be a valid number");
    } else if (value < range.min) {
        errors.push_back(std::string(range.name) + " must be at least " + format_bound(range.min));
    } else if (value > range.max) {
        errors.push_back(std::string(range.name) + " must be at most " + format_bound(range.max));
    }
}

} // namespace

Timeframe parse_timeframe(const std::string& s) {
    std::string key;
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    for (const auto& info : kTimeframes) {
        if (key == info.name) return info.tf;
    }
    std::string options;
    for (const auto& info : kTimeframes) {
        if (!options.empty()) options += ", ";
        options += info.name;
    }
    throw ValidationError("Invalid timeframe '" + s + "'. Valid options: " + options);
}

const char* to_string(Timeframe tf) {
    for (const auto& info : kTimeframes) {
        if (info.tf == tf) return info.name;
    }
    return "?";
}

long long timeframe_seconds(Timeframe tf) {
    for (const auto& info : kTimeframes) {
        if (info.tf == tf) return info.seconds;
    }
    return 60;
}

std::vector<std::string> valid_timeframes() {
    std::vector<std::string> out;
    for (const auto& info : kTimeframes) out.emplace_back(info.name);
    return out;
}

const std::vector<ParameterRange>& parameter_ranges() {
    static const std::vector<ParameterRange> ranges = {
        {"atr_multiplier",         0.5,   10.0},
        {"ema5_rising_threshold",  0.001, 0.1},
        {"ema8_rising_threshold",  0.001, 0.1},
        {"ema21_rising_threshold", 0.001, 0.1},
        {"volatility_filter",      0.1,   5.0},
        {"fomo_filter",            0.1,   3.0},
    };
    return ranges;
}

AlgorithmSettings::AlgorithmSettings() : AlgorithmSettings(AlgorithmSettingsParams{}) {}

AlgorithmSettings::AlgorithmSettings(const AlgorithmSettingsParams& params)
    : params_(params), higher_timeframe_(Timeframe::M15) {
    const auto& ranges = parameter_ranges();
    const double values[] = {
        params.atr_multiplier,
        params.ema5_rising_threshold,
        params.ema8_rising_threshold,
        params.ema21_rising_threshold,
        params.volatility_filter,
        params.fomo_filter,
    };

    std::vector<std::string> errors;
    for (std::size_t i = 0; i < ranges.size(); ++i) {
        check_range(ranges[i], values[i], errors);
    }

    try {
        higher_timeframe_ = parse_timeframe(params.higher_timeframe);
        params_.higher_timeframe = to_string(higher_timeframe_);
    } catch (const ValidationError& e) {
        errors.push_back(std::string("higher_timeframe: ") + e.what());
    }

    if (!errors.empty()) {
        throw ValidationError(errors);
    }
}

void validate(const SimulationConfig& config) {
    std::vector<std::string> errors;
    if (config.entry_delay_minutes < 0) {
        errors.emplace_back("entry_delay_minutes must be non-negative");
    }
    if (config.stop_loss_percent && !(*config.stop_loss_percent > 0.0 && std::isfinite(*config.stop_loss_percent))) {
        errors.emplace_back("stop_loss_percent must be a positive number");
    }
    if (config.take_profit_percent && !(*config.take_profit_percent > 0.0 && std::isfinite(*config.take_profit_percent))) {
        errors.emplace_back("take_profit_percent must be a positive number");
    }
    if (config.max_hold_days && *config.max_hold_days <= 0) {
        errors.emplace_back("max_hold_days must be positive");
    }
    if (!(config.commission_per_trade >= 0.0) || !std::isfinite(config.commission_per_trade)) {
        errors.emplace_back("commission_per_trade must be non-negative");
    }
    if (!errors.empty()) {
        throw ValidationError(errors);
    }
}

} // namespace scanner
