#pragma once
#include <utility>
#include <vector>
#include "types.hpp"

namespace scanner {

constexpr int kAtrPeriod = 14;
// Longest EMA period plus one bar for the first true range.
constexpr std::size_t kMinIndicatorBars = 51;

// Recursive EMA seeded with the first value (no SMA seed). Throws InsufficientData / CalculationError.
double compute_ema(const std::vector<double>& values, int period);

// EMA of the true-range series.
double compute_atr(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    int period = kAtrPeriod
);

// {long_line, short_line} = {close - atr*m, close + atr*m}
std::pair<double, double> compute_atr_bands(double close, double atr, double multiplier);

void validate_data_sufficiency(std::size_t data_points);

IndicatorSnapshot compute_indicators(
    const std::vector<double>& highs,
    const std::vector<double>& lows,
    const std::vector<double>& closes,
    double atr_multiplier
);

IndicatorSnapshot compute_indicators(const std::vector<PriceBar>& bars, double atr_multiplier);

} // namespace scanner
