#include "../include/scanner/simulator.hpp"
#include "../include/scanner/signal_engine.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace scanner {

namespace {

constexpr long long kSecondsPerDay = 86400;

// Floor division, so negative offsets round towards the earlier day.
long long whole_days(long long seconds) {
    long long days = seconds / kSecondsPerDay;
    if (seconds % kSecondsPerDay < 0) --days;
    return days;
}

double directional_move(Direction d, double entry, double exit) {
    return d == Direction::Long ? exit - entry : entry - exit;
}

} // namespace

TradeSimulator::TradeSimulator(SimulationConfig config)
    : config_(std::move(config)), state_(Flat{}) {
    validate(config_);
}

bool TradeSimulator::should_exit(const Position& pos, const PriceBar& bar,
                                 const std::vector<Signal>& signals, ExitReason& reason) const {
    const Direction against = opposite(pos.direction);
    for (const auto& s : signals) {
        if (s.symbol == pos.symbol && s.direction == against) {
            reason = ExitReason::OppositeSignal;
            return true;
        }
    }

    const double move = directional_move(pos.direction, pos.entry_price, bar.close) / pos.entry_price;

    if (config_.stop_loss_percent && -move >= *config_.stop_loss_percent) {
        reason = ExitReason::StopLoss;
        return true;
    }
    if (config_.take_profit_percent && move >= *config_.take_profit_percent) {
        reason = ExitReason::TakeProfit;
        return true;
    }
    if (config_.max_hold_days) {
        if (whole_days(bar.timestamp - pos.entry_time) >= *config_.max_hold_days) {
            reason = ExitReason::Timeout;
            return true;
        }
    }
    return false;
}

Trade TradeSimulator::close(const Position& pos, const PriceBar& bar, ExitReason reason) const {
    const double move = directional_move(pos.direction, pos.entry_price, bar.close);
    Trade t{
        pos.symbol,
        pos.entry_time, bar.timestamp,
        pos.entry_price, bar.close,
        pos.direction,
        move - config_.commission_per_trade,
        move / pos.entry_price,
        reason
    };
    spdlog::debug("[backtest] closed {} {} at {:.4f} ({}), pnl {:.4f}",
                  to_string(t.direction), t.symbol, t.exit_price, to_string(reason), t.pnl);
    return t;
}

std::vector<Trade> TradeSimulator::step(const PriceBar& bar, const std::vector<Signal>& signals) {
    std::vector<Trade> closed;

    if (auto* open = std::get_if<InPosition>(&state_)) {
        ExitReason reason = ExitReason::EndOfData;
        if (should_exit(open->position, bar, signals, reason)) {
            closed.push_back(close(open->position, bar, reason));
            state_ = Flat{};
        }
    }

    if (is_flat()) {
        for (const auto& s : signals) {
            if (s.confidence < kMinEntryConfidence) continue;
            Position pos{
                s.symbol,
                s.direction,
                bar.timestamp + static_cast<long long>(config_.entry_delay_minutes) * 60,
                bar.close,
                s.confidence
            };
            spdlog::debug("[backtest] opened {} {} at {:.4f}", to_string(pos.direction), pos.symbol, pos.entry_price);
            state_ = InPosition{pos};
            break;
        }
    }
    return closed;
}

std::vector<Trade> TradeSimulator::finish(const PriceBar& last_bar) {
    std::vector<Trade> closed;
    if (auto* open = std::get_if<InPosition>(&state_)) {
        closed.push_back(close(open->position, last_bar, ExitReason::EndOfData));
        state_ = Flat{};
    }
    return closed;
}

std::vector<PriceBar> htf_window(const std::vector<PriceBar>& htf_bars, long long timestamp) {
    const long long day = whole_days(timestamp);
    std::vector<PriceBar> out;
    const PriceBar* same_day = nullptr;
    for (const auto& b : htf_bars) {
        const long long d = whole_days(b.timestamp);
        if (d < day) {
            out.push_back(b);
        } else if (d == day) {
            same_day = &b;
        }
    }
    if (!same_day) return {};
    out.push_back(*same_day);
    return out;
}

std::vector<Trade> simulate_symbol(
    const std::string& symbol,
    const std::vector<PriceBar>& bars,
    const std::vector<PriceBar>& htf_bars,
    const AlgorithmSettings& settings,
    const SimulationConfig& config
) {
    TradeSimulator sim(config);
    std::vector<Trade> trades;

    if (bars.size() <= kMinHistoryBars) {
        spdlog::warn("[backtest] {}: insufficient data ({} bars)", symbol, bars.size());
        return trades;
    }

    auto by_time = [](const PriceBar& a, const PriceBar& b) { return a.timestamp < b.timestamp; };
    std::vector<PriceBar> ordered = bars;
    std::stable_sort(ordered.begin(), ordered.end(), by_time);
    std::vector<PriceBar> htf_ordered = htf_bars;
    std::stable_sort(htf_ordered.begin(), htf_ordered.end(), by_time);

    std::vector<PriceBar> series(ordered.begin(), ordered.begin() + kMinHistoryBars);
    series.reserve(ordered.size());

    for (std::size_t i = kMinHistoryBars; i < ordered.size(); ++i) {
        const PriceBar& bar = ordered[i];
        series.push_back(bar);
        auto htf_series = htf_window(htf_ordered, bar.timestamp);
        auto batch = generate_signals(series, htf_series, settings);
        auto closed = sim.step(bar, batch.signals);
        trades.insert(trades.end(), closed.begin(), closed.end());
    }

    auto closed = sim.finish(ordered.back());
    trades.insert(trades.end(), closed.begin(), closed.end());

    spdlog::info("[backtest] {}: {} trades", symbol, trades.size());
    return trades;
}

} // namespace scanner
