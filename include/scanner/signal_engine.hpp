#pragma once
#include <vector>
#include "settings.hpp"
#include "types.hpp"

namespace scanner {

// Bars of history the engine needs in front of the evaluated bar.
constexpr std::size_t kMinHistoryBars = 50;

// `history` is ordered oldest first; only its last two snapshots drive the momentum rule.
// `htf_bar` / `htf_indicators` are either both set or both null.
DirectionEvaluation evaluate_long(
    const PriceBar& bar,
    const IndicatorSnapshot& indicators,
    const std::vector<IndicatorSnapshot>& history,
    const PriceBar* htf_bar,
    const IndicatorSnapshot* htf_indicators,
    const AlgorithmSettings& settings
);

DirectionEvaluation evaluate_short(
    const PriceBar& bar,
    const IndicatorSnapshot& indicators,
    const std::vector<IndicatorSnapshot>& history,
    const PriceBar* htf_bar,
    const IndicatorSnapshot* htf_indicators,
    const AlgorithmSettings& settings
);

// Evaluates `series.back()` against the rest of `series`, with `htf_series.back()` as the
// higher-timeframe bar when `htf_series` is not empty. Never throws; indicator failures
// yield an empty, unevaluated batch.
SignalBatch generate_signals(
    const std::vector<PriceBar>& series,
    const std::vector<PriceBar>& htf_series,
    const AlgorithmSettings& settings
);

} // namespace scanner
