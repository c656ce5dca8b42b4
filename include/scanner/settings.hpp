#pragma once
#include <optional>
#include <string>
#include <vector>

namespace scanner {

enum class Timeframe { M1, M2, M5, M15, M30, H1, H2, H4, D1 };

Timeframe parse_timeframe(const std::string& s);
const char* to_string(Timeframe tf);
long long timeframe_seconds(Timeframe tf);
std::vector<std::string> valid_timeframes();

// Raw, unvalidated settings values. Defaults match the production rule set.
struct AlgorithmSettingsParams {
    double atr_multiplier = 2.0;
    double ema5_rising_threshold = 0.02;
    double ema8_rising_threshold = 0.01;
    double ema21_rising_threshold = 0.005;
    double volatility_filter = 1.5;
    double fomo_filter = 1.0;
    std::string higher_timeframe = "15m";
};

// Immutable, range-checked settings applied to a whole scan or backtest run.
// Construction throws ValidationError listing every out-of-range field.
class AlgorithmSettings {
public:
    AlgorithmSettings();
    explicit AlgorithmSettings(const AlgorithmSettingsParams& params);

    double atr_multiplier() const { return params_.atr_multiplier; }
    double ema5_rising_threshold() const { return params_.ema5_rising_threshold; }
    double ema8_rising_threshold() const { return params_.ema8_rising_threshold; }
    double ema21_rising_threshold() const { return params_.ema21_rising_threshold; }
    double volatility_filter() const { return params_.volatility_filter; }
    double fomo_filter() const { return params_.fomo_filter; }
    Timeframe higher_timeframe() const { return higher_timeframe_; }

    const AlgorithmSettingsParams& params() const { return params_; }

private:
    AlgorithmSettingsParams params_;
    Timeframe higher_timeframe_;
};

struct ParameterRange {
    const char* name;
    double min;
    double max;
};

const std::vector<ParameterRange>& parameter_ranges();

// Trade simulation knobs. Unset optionals disable the matching exit rule.
struct SimulationConfig {
    int entry_delay_minutes = 1;
    std::optional<double> stop_loss_percent;
    std::optional<double> take_profit_percent;
    std::optional<int> max_hold_days;
    double commission_per_trade = 0.0;
};

constexpr double kMinEntryConfidence = 0.5;

void validate(const SimulationConfig& config);

} // namespace scanner
