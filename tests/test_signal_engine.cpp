#include <gtest/gtest.h>
#include <limits>
#include <vector>
#include "scanner/signal_engine.hpp"
#include "test_helpers.hpp"

using namespace scanner;
using test_helpers::flat_series;
using test_helpers::make_bar;
using test_helpers::rising_series;
using test_helpers::trend_settings;

namespace {

// Hand-built inputs where every long condition holds with fomo_filter = 3.
class LongEvaluationTest : public ::testing::Test {
protected:
    PriceBar bar = make_bar("AAPL", test_helpers::kJan1_2024, 100.0, 103.0, 99.0, 102.0);
    IndicatorSnapshot ind{100.0, 99.0, 98.5, 98.0, 95.0, 2.0, 101.0, 103.0};
    IndicatorSnapshot prev{97.0, 97.5, 97.4, 97.4, 94.0, 2.0, 95.0, 99.0};
    PriceBar htf_bar = make_bar("AAPL", test_helpers::kJan1_2024, 100.0, 101.5, 99.5, 101.0);
    IndicatorSnapshot htf{100.5, 100.2, 100.0, 99.8, 99.0, 1.0, 100.0, 102.0};
    AlgorithmSettings settings = [] {
        AlgorithmSettingsParams p;
        p.fomo_filter = 3.0;
        return AlgorithmSettings(p);
    }();

    std::vector<IndicatorSnapshot> history() const { return {prev, ind}; }
};

class ShortEvaluationTest : public ::testing::Test {
protected:
    PriceBar bar = make_bar("AAPL", test_helpers::kJan1_2024, 102.0, 103.0, 99.5, 100.0);
    IndicatorSnapshot ind{102.0, 103.0, 103.5, 104.0, 106.0, 2.0, 99.0, 101.0};
    IndicatorSnapshot prev{105.2, 104.1, 104.3, 104.6, 106.5, 2.0, 101.0, 105.0};
    PriceBar htf_bar = make_bar("AAPL", test_helpers::kJan1_2024, 101.0, 101.5, 99.5, 100.0);
    IndicatorSnapshot htf{100.0, 100.3, 100.5, 100.8, 101.0, 1.0, 99.0, 101.0};
    AlgorithmSettings settings = [] {
        AlgorithmSettingsParams p;
        p.fomo_filter = 3.0;
        return AlgorithmSettings(p);
    }();
};

} // namespace

TEST_F(LongEvaluationTest, AllSixConditionsPass) {
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings);
    EXPECT_TRUE(ev.valid);
    EXPECT_EQ(ev.conditions_met, 6);
    EXPECT_EQ(ev.total_conditions, 6);
    EXPECT_DOUBLE_EQ(ev.confidence, 1.0);
    EXPECT_TRUE(ev.failure_reasons().empty());
    EXPECT_EQ(ev.satisfied_conditions().size(), 6u);
}

TEST_F(LongEvaluationTest, WithoutHtfDataTotalIsFive) {
    auto ev = evaluate_long(bar, ind, history(), nullptr, nullptr, settings);
    EXPECT_TRUE(ev.valid);
    EXPECT_FALSE(ev.htf_evaluated);
    EXPECT_EQ(ev.total_conditions, 5);
    EXPECT_DOUBLE_EQ(ev.confidence, 1.0);
    ASSERT_EQ(ev.failure_reasons().size(), 1u);
    EXPECT_EQ(ev.failure_reasons()[0], "No HTF data available");
}

TEST_F(LongEvaluationTest, OneFailedConditionInvalidatesSignal) {
    htf_bar.close = 99.0;  // bearish HTF candle
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings);
    EXPECT_FALSE(ev.valid);
    EXPECT_EQ(ev.conditions_met, 5);
    EXPECT_NEAR(ev.confidence, 5.0 / 6.0, 1e-12);
    EXPECT_FALSE(ev.passed_condition(ConditionId::HtfConfirmation));
    ASSERT_EQ(ev.failure_reasons().size(), 1u);
    EXPECT_EQ(ev.failure_reasons()[0], "Failed HTF confirmation");
}

TEST_F(LongEvaluationTest, PolarFormationNeedsBullishCandle) {
    bar.open = 102.5;
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings);
    EXPECT_FALSE(ev.passed_condition(ConditionId::PolarFormation));
    EXPECT_FALSE(ev.valid);
}

TEST_F(LongEvaluationTest, SingleSnapshotFailsMomentumOnly) {
    auto ev = evaluate_long(bar, ind, {ind}, &htf_bar, &htf, settings);
    EXPECT_FALSE(ev.passed_condition(ConditionId::EmaMomentum));
    EXPECT_EQ(ev.conditions_met, 5);
    EXPECT_FALSE(ev.valid);
}

TEST_F(LongEvaluationTest, MomentumThresholdIsInclusive) {
    // ema21 change exactly at the 0.005 threshold (0.5 / 100).
    prev.ema21 = 100.0;
    ind.ema21 = 100.5;
    ind.ema8 = 99.0;
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings);
    EXPECT_TRUE(ev.passed_condition(ConditionId::EmaMomentum));
}

TEST_F(LongEvaluationTest, BadPreviousEmaFailsConditionWithoutThrowing) {
    prev.ema5 = 0.0;
    DirectionEvaluation ev;
    EXPECT_NO_THROW(ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings));
    EXPECT_FALSE(ev.passed_condition(ConditionId::EmaMomentum));
    EXPECT_TRUE(ev.passed_condition(ConditionId::PolarFormation));
    EXPECT_EQ(ev.conditions_met, 5);
}

TEST_F(LongEvaluationTest, FomoFilterRejectsExtendedPrice) {
    AlgorithmSettings tight;  // fomo_filter 1.0 -> max distance 2.0, close is 3.0 above ema8
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, tight);
    EXPECT_FALSE(ev.passed_condition(ConditionId::FomoFilter));
    EXPECT_FALSE(ev.valid);
}

TEST_F(LongEvaluationTest, VolatilityFilterRejectsQuietMarket) {
    ind.atr = 0.5;  // below 1 / 1.5
    auto ev = evaluate_long(bar, ind, history(), &htf_bar, &htf, settings);
    EXPECT_FALSE(ev.passed_condition(ConditionId::VolatilityFilter));
}

TEST_F(ShortEvaluationTest, MirroredConditionsPass) {
    auto ev = evaluate_short(bar, ind, {prev, ind}, &htf_bar, &htf, settings);
    EXPECT_EQ(ev.direction, Direction::Short);
    EXPECT_TRUE(ev.valid) << ::testing::PrintToString(ev.failure_reasons());
    EXPECT_DOUBLE_EQ(ev.confidence, 1.0);
}

TEST_F(ShortEvaluationTest, LongRulesRejectBearishSetup) {
    auto ev = evaluate_long(bar, ind, {prev, ind}, &htf_bar, &htf, settings);
    EXPECT_FALSE(ev.valid);
    EXPECT_FALSE(ev.passed_condition(ConditionId::PolarFormation));
    EXPECT_FALSE(ev.passed_condition(ConditionId::EmaMomentum));
    EXPECT_FALSE(ev.passed_condition(ConditionId::HtfConfirmation));
}

TEST(GenerateSignals, ShortSeriesYieldsNothing) {
    AlgorithmSettings settings;
    for (std::size_t n : {0u, 1u, 20u, 49u, 50u}) {
        auto bars = rising_series("AAPL", n);
        SignalBatch batch;
        EXPECT_NO_THROW(batch = generate_signals(bars, {}, settings));
        EXPECT_TRUE(batch.signals.empty()) << n << " bars";
        EXPECT_FALSE(batch.evaluated) << n << " bars";
    }
}

TEST(GenerateSignals, FlatSeriesYieldsNoSignals) {
    auto bars = flat_series("FLAT", 60, 50.0);
    auto batch = generate_signals(bars, bars, AlgorithmSettings{});
    EXPECT_TRUE(batch.evaluated);
    EXPECT_TRUE(batch.signals.empty());
    EXPECT_FALSE(batch.long_evaluation.passed_condition(ConditionId::VolatilityFilter));
    EXPECT_FALSE(batch.short_evaluation.passed_condition(ConditionId::VolatilityFilter));
}

TEST(GenerateSignals, RisingSeriesWithBullishHtfFiresLong) {
    auto bars = rising_series("AAPL", 60);
    auto batch = generate_signals(bars, bars, trend_settings());

    ASSERT_TRUE(batch.evaluated);
    ASSERT_EQ(batch.signals.size(), 1u) << ::testing::PrintToString(batch.long_evaluation.failure_reasons());
    const auto& s = batch.signals[0];
    EXPECT_EQ(s.direction, Direction::Long);
    EXPECT_EQ(s.symbol, "AAPL");
    EXPECT_EQ(s.timestamp, bars.back().timestamp);
    EXPECT_DOUBLE_EQ(s.price, bars.back().close);
    EXPECT_DOUBLE_EQ(s.confidence, 1.0);
    EXPECT_EQ(batch.long_evaluation.total_conditions, 6);
    EXPECT_FALSE(batch.short_evaluation.valid);
}

TEST(GenerateSignals, DefaultSettingsRejectTheSameTrend) {
    // With a 2.0 ATR multiplier EMA5 never sits below the long line on this series.
    auto bars = rising_series("AAPL", 60);
    auto batch = generate_signals(bars, bars, AlgorithmSettings{});
    EXPECT_TRUE(batch.evaluated);
    EXPECT_TRUE(batch.signals.empty());
    EXPECT_FALSE(batch.long_evaluation.passed_condition(ConditionId::EmaPositioning));
}

TEST(GenerateSignals, FiftyOneBarsHaveNoMomentumHistory) {
    auto bars = rising_series("AAPL", 51);
    auto batch = generate_signals(bars, bars, trend_settings());
    EXPECT_TRUE(batch.evaluated);
    EXPECT_FALSE(batch.long_evaluation.passed_condition(ConditionId::EmaMomentum));
    EXPECT_TRUE(batch.signals.empty());
}

TEST(GenerateSignals, NoHtfSeriesEvaluatesFiveConditions) {
    auto bars = rising_series("AAPL", 60);
    auto batch = generate_signals(bars, {}, trend_settings());
    ASSERT_EQ(batch.signals.size(), 1u);
    EXPECT_EQ(batch.long_evaluation.total_conditions, 5);
    EXPECT_FALSE(batch.long_evaluation.htf_evaluated);
}

TEST(GenerateSignals, ShortHtfSeriesAbortsBatch) {
    auto bars = rising_series("AAPL", 60);
    std::vector<PriceBar> htf(bars.end() - 10, bars.end());
    SignalBatch batch;
    EXPECT_NO_THROW(batch = generate_signals(bars, htf, trend_settings()));
    EXPECT_FALSE(batch.evaluated);
    EXPECT_TRUE(batch.signals.empty());
}

TEST(GenerateSignals, NonFinitePricesDoNotThrow) {
    auto bars = rising_series("AAPL", 60);
    bars[30].close = std::numeric_limits<double>::quiet_NaN();
    SignalBatch batch;
    EXPECT_NO_THROW(batch = generate_signals(bars, {}, trend_settings()));
    EXPECT_FALSE(batch.evaluated);
    EXPECT_TRUE(batch.signals.empty());
}

TEST(GenerateSignals, IsDeterministic) {
    auto bars = rising_series("AAPL", 70, 50.0, 0.025);
    auto settings = trend_settings();
    auto a = generate_signals(bars, bars, settings);
    auto b = generate_signals(bars, bars, settings);
    ASSERT_EQ(a.signals.size(), b.signals.size());
    for (std::size_t i = 0; i < a.signals.size(); ++i) {
        EXPECT_EQ(a.signals[i].direction, b.signals[i].direction);
        EXPECT_EQ(a.signals[i].confidence, b.signals[i].confidence);
        EXPECT_EQ(a.signals[i].indicators.ema5, b.signals[i].indicators.ema5);
    }
    EXPECT_EQ(a.long_evaluation.passed, b.long_evaluation.passed);
    EXPECT_EQ(a.short_evaluation.passed, b.short_evaluation.passed);
}
