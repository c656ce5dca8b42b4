#pragma once
#include <vector>
#include "types.hpp"

namespace scanner {

// Summary statistics over closed trades. Returns an all-zero summary for no trades.
PerformanceSummary analyze_performance(const std::vector<Trade>& trades);

// Largest peak-to-trough fall of the cumulative pnl_percent curve, in exit-time order.
double max_drawdown(const std::vector<Trade>& trades);

} // namespace scanner
