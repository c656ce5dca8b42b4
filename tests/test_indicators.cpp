#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "scanner/errors.hpp"
#include "scanner/indicators.hpp"
#include "test_helpers.hpp"

using namespace scanner;

TEST(ComputeEma, ConstantSeriesIsTheConstant) {
    std::vector<double> values(60, 42.5);
    for (int period : {5, 8, 13, 21, 50}) {
        EXPECT_NEAR(compute_ema(values, period), 42.5, 1e-9) << "period " << period;
    }
}

TEST(ComputeEma, SeededWithFirstValue) {
    // k = 2/3: 1 -> 1*1/3 + 2*2/3 = 5/3 -> 5/9 + 2 = 23/9
    EXPECT_NEAR(compute_ema({1.0, 2.0, 3.0}, 2), 23.0 / 9.0, 1e-12);
}

TEST(ComputeEma, TooFewValuesThrowsInsufficientData) {
    EXPECT_THROW(compute_ema({1.0, 2.0, 3.0}, 5), InsufficientData);
}

TEST(ComputeEma, NonPositivePeriodThrowsCalculationError) {
    EXPECT_THROW(compute_ema({1.0, 2.0}, 0), CalculationError);
    EXPECT_THROW(compute_ema({1.0, 2.0}, -3), CalculationError);
}

TEST(ComputeEma, NonFiniteInputThrowsCalculationError) {
    std::vector<double> values(10, 1.0);
    values[4] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(compute_ema(values, 5), CalculationError);
}

TEST(ComputeAtr, FlatSeriesIsZero) {
    std::vector<double> p(30, 10.0);
    EXPECT_NEAR(compute_atr(p, p, p), 0.0, 1e-12);
}

TEST(ComputeAtr, WideRangesGiveLargerAtr) {
    std::vector<double> hi_wide, lo_wide, hi_narrow, lo_narrow, closes;
    for (int i = 0; i < 40; ++i) {
        const double c = (i % 2 == 0) ? 100.0 : 101.0;
        closes.push_back(c);
        hi_wide.push_back(c + 5.0);
        lo_wide.push_back(c - 5.0);
        hi_narrow.push_back(c + 0.5);
        lo_narrow.push_back(c - 0.5);
    }
    EXPECT_GT(compute_atr(hi_wide, lo_wide, closes), compute_atr(hi_narrow, lo_narrow, closes));
}

TEST(ComputeAtr, UsesGapsToPreviousClose) {
    // Each bar has no intrabar range but gaps 2.0 from the previous close.
    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(i % 2 == 0 ? 100.0 : 102.0);
    EXPECT_NEAR(compute_atr(closes, closes, closes), 2.0, 1e-9);
}

TEST(ComputeAtr, NeedsPeriodPlusOnePoints) {
    std::vector<double> p(14, 10.0);
    EXPECT_THROW(compute_atr(p, p, p), InsufficientData);
}

TEST(ComputeAtr, MismatchedLengthsThrowCalculationError) {
    std::vector<double> a(20, 10.0), b(21, 10.0);
    EXPECT_THROW(compute_atr(a, b, a), CalculationError);
}

TEST(ComputeAtrBands, SymmetricAroundClose) {
    auto bands = compute_atr_bands(100.0, 2.0, 1.5);
    EXPECT_DOUBLE_EQ(bands.first, 97.0);
    EXPECT_DOUBLE_EQ(bands.second, 103.0);
}

TEST(ComputeAtrBands, RejectsInvalidInputs) {
    EXPECT_THROW(compute_atr_bands(0.0, 1.0, 2.0), CalculationError);
    EXPECT_THROW(compute_atr_bands(100.0, -1.0, 2.0), CalculationError);
    EXPECT_THROW(compute_atr_bands(100.0, 1.0, 0.0), CalculationError);
    EXPECT_THROW(compute_atr_bands(std::nan(""), 1.0, 2.0), CalculationError);
}

TEST(ValidateDataSufficiency, RequiresFiftyOnePoints) {
    EXPECT_THROW(validate_data_sufficiency(50), InsufficientData);
    EXPECT_NO_THROW(validate_data_sufficiency(51));
}

TEST(ComputeIndicators, FlatSeriesSnapshot) {
    auto bars = test_helpers::flat_series("FLAT", 60, 25.0);
    auto s = compute_indicators(bars, 2.0);
    EXPECT_NEAR(s.ema5, 25.0, 1e-9);
    EXPECT_NEAR(s.ema50, 25.0, 1e-9);
    EXPECT_NEAR(s.atr, 0.0, 1e-12);
    EXPECT_NEAR(s.atr_long_line, 25.0, 1e-9);
    EXPECT_NEAR(s.atr_short_line, 25.0, 1e-9);
}

TEST(ComputeIndicators, RisingSeriesOrdering) {
    auto bars = test_helpers::rising_series("UP", 60);
    auto s = compute_indicators(bars, 2.0);
    EXPECT_GT(s.ema5, s.ema8);
    EXPECT_GT(s.ema8, s.ema13);
    EXPECT_GT(s.ema13, s.ema21);
    EXPECT_GT(s.ema21, s.ema50);
    EXPECT_GT(s.atr, 0.0);
    EXPECT_NEAR(s.atr_short_line - bars.back().close, 2.0 * s.atr, 1e-9);
}

TEST(ComputeIndicators, FiftyBarsIsNotEnough) {
    auto bars = test_helpers::flat_series("FLAT", 50, 25.0);
    EXPECT_THROW(compute_indicators(bars, 2.0), InsufficientData);
}

TEST(ComputeIndicators, MismatchedArraysThrowBeforeComputing) {
    std::vector<double> a(60, 1.0), b(59, 1.0);
    EXPECT_THROW(compute_indicators(a, a, b, 2.0), CalculationError);
}
