#include "../include/scanner/indicators.hpp"
#include "../include/scanner/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace scanner {

double compute_ema(const std::vector<double>& values, int period) {
    if (period <= 0) {
        throw CalculationError("EMA period must be positive, got " + std::to_string(period));
    }
    if (values.size() < static_cast<std::size_t>(period)) {
        throw InsufficientData(
            "Need at least " + std::to_string(period) + " data points for EMA" +
            std::to_string(period) + ", got " + std::to_string(values.size()));
    }

    const double k = 2.0 / (period + 1.0);
    double ema = values.front();
    for (std::size_t i = 1; i < values.size(); ++i) {
        ema = values[i] * k + ema * (1.0 - k);
    }

    if (!std::isfinite(ema)) {
        throw CalculationError("Invalid EMA" + std::to_string(period) + " calculation result");
    }
    return ema;
}

double compute_atr(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    int period
) {
    const std::size_t needed = static_cast<std::size_t>(period) + 1;
    if (highs.size() < needed || lows.size() < needed || closes.size() < needed) {
        throw InsufficientData(
            "Need at least " + std::to_string(needed) + " data points for ATR" + std::to_string(period));
    }
    if (highs.size() != lows.size() || highs.size() != closes.size()) {
        throw CalculationError("High, low, and close price arrays must have same length");
    }

    std::vector<double> true_ranges;
    true_ranges.reserve(closes.size() - 1);
    for (std::size_t i = 1; i < closes.size(); ++i) {
        true_ranges.push_back(std::max({
            highs[i] - lows[i],
            std::abs(highs[i] - closes[i - 1]),
            std::abs(lows[i] - closes[i - 1])
        }));
    }

    double atr = compute_ema(true_ranges, period);
    if (!std::isfinite(atr) || atr < 0.0) {
        throw CalculationError("Invalid ATR calculation result");
    }
    return atr;
}

std::pair<double, double> compute_atr_bands(double close, double atr, double multiplier) {
    if (!(close > 0.0) || !(atr >= 0.0) || !(multiplier > 0.0)) {
        throw CalculationError("Invalid input values for ATR lines calculation");
    }
    return {close - atr * multiplier, close + atr * multiplier};
}

void validate_data_sufficiency(std::size_t data_points) {
    if (data_points < kMinIndicatorBars) {
        throw InsufficientData(
            "Need at least " + std::to_string(kMinIndicatorBars) +
            " data points for all indicators, got " + std::to_string(data_points));
    }
}

IndicatorSnapshot compute_indicators(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    double atr_multiplier
) {
    if (highs.size() != lows.size() || highs.size() != closes.size()) {
        throw CalculationError("Price arrays must have same length");
    }
    validate_data_sufficiency(closes.size());

    IndicatorSnapshot s{};
    s.ema5 = compute_ema(closes, 5);
    s.ema8 = compute_ema(closes, 8);
    s.ema13 = compute_ema(closes, 13);
    s.ema21 = compute_ema(closes, 21);
    s.ema50 = compute_ema(closes, 50);
    s.atr = compute_atr(highs, lows, closes, kAtrPeriod);

    auto bands = compute_atr_bands(closes.back(), s.atr, atr_multiplier);
    s.atr_long_line = bands.first;
    s.atr_short_line = bands.second;
    return s;
}

IndicatorSnapshot compute_indicators(const std::vector<PriceBar>& bars, double atr_multiplier) {
    std::vector<double> highs, lows, closes;
    highs.reserve(bars.size());
    lows.reserve(bars.size());
    closes.reserve(bars.size());
    for (const auto& b : bars) {
        highs.push_back(b.high);
        lows.push_back(b.low);
        closes.push_back(b.close);
    }
    return compute_indicators(highs, lows, closes, atr_multiplier);
}

} // namespace scanner
