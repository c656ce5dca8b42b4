#pragma once
#include <cmath>
#include <string>
#include <vector>
#include "scanner/settings.hpp"
#include "scanner/types.hpp"

namespace test_helpers {

using scanner::PriceBar;

constexpr long long kDay = 86400;
constexpr long long kJan1_2024 = 1704067200;  // 2024-01-01T00:00:00Z

inline PriceBar make_bar(const std::string& symbol, long long ts,
                         double open, double high, double low, double close,
                         long long volume = 1000) {
    return PriceBar{symbol, ts, open, high, low, close, volume};
}

inline std::vector<PriceBar> flat_series(const std::string& symbol, std::size_t count, double price,
                                         long long start = kJan1_2024, long long step = kDay) {
    std::vector<PriceBar> bars;
    for (std::size_t i = 0; i < count; ++i) {
        bars.push_back(make_bar(symbol, start + static_cast<long long>(i) * step, price, price, price, price));
    }
    return bars;
}

// Geometric uptrend: close grows by `growth` per bar, each bar opens at the previous
// close with low == open and high == close * 1.08. With growth 3% the close sits about
// 9% above EMA8 and ATR is about 9% of the close.
inline std::vector<PriceBar> rising_series(const std::string& symbol, std::size_t count,
                                           double start_price = 100.0, double growth = 0.03,
                                           long long start = kJan1_2024, long long step = kDay) {
    std::vector<PriceBar> bars;
    double prev_close = start_price / (1.0 + growth);
    for (std::size_t i = 0; i < count; ++i) {
        const double close = start_price * std::pow(1.0 + growth, static_cast<double>(i));
        const double open = prev_close;
        bars.push_back(make_bar(symbol, start + static_cast<long long>(i) * step,
                                open, close * 1.08, open, close));
        prev_close = close;
    }
    return bars;
}

// Settings under which the rising series above fires a long signal on every bar
// once two indicator snapshots are available.
inline scanner::AlgorithmSettings trend_settings() {
    scanner::AlgorithmSettingsParams p;
    p.atr_multiplier = 0.5;
    p.fomo_filter = 3.0;
    return scanner::AlgorithmSettings(p);
}

inline scanner::Signal make_signal(const std::string& symbol, scanner::Direction d, long long ts,
                                   double price, double confidence = 1.0) {
    return scanner::Signal{symbol, d, ts, price, scanner::IndicatorSnapshot{}, confidence};
}

inline scanner::Trade make_trade(double pnl_percent, long long exit_time,
                                 const std::string& symbol = "AAPL") {
    return scanner::Trade{
        symbol,
        exit_time - kDay, exit_time,
        100.0, 100.0 * (1.0 + pnl_percent),
        scanner::Direction::Long,
        100.0 * pnl_percent,
        pnl_percent,
        scanner::ExitReason::OppositeSignal
    };
}

} // namespace test_helpers
