#include "../include/scanner/performance.hpp"
#include <algorithm>
#include <cmath>

namespace scanner {

double max_drawdown(const std::vector<Trade>& trades) {
    std::vector<const Trade*> ordered;
    ordered.reserve(trades.size());
    for (const auto& t : trades) ordered.push_back(&t);
    std::stable_sort(ordered.begin(), ordered.end(), [](const Trade* a, const Trade* b) {
        return a->exit_time < b->exit_time;
    });

    double cumulative = 0.0, peak = 0.0, drawdown = 0.0;
    for (const auto* t : ordered) {
        cumulative += t->pnl_percent;
        peak = std::max(peak, cumulative);
        drawdown = std::max(drawdown, peak - cumulative);
    }
    return drawdown;
}

PerformanceSummary analyze_performance(const std::vector<Trade>& trades) {
    PerformanceSummary s;
    if (trades.empty()) return s;

    s.total_trades = static_cast<int>(trades.size());
    for (const auto& t : trades) {
        if (t.pnl > 0) s.winning_trades++; else s.losing_trades++;
        s.total_return += t.pnl_percent;
    }
    s.win_rate = static_cast<double>(s.winning_trades) / s.total_trades;
    s.average_return = s.total_return / s.total_trades;
    s.max_drawdown = max_drawdown(trades);

    if (trades.size() > 1) {
        double sq = 0.0;
        for (const auto& t : trades) {
            const double d = t.pnl_percent - s.average_return;
            sq += d * d;
        }
        const double stdev = std::sqrt(sq / (trades.size() - 1));
        if (stdev > 0.0) s.sharpe_ratio = s.average_return / stdev;
    }
    return s;
}

} // namespace scanner
