#include "../include/scanner/signal_engine.hpp"
#include "../include/scanner/errors.hpp"
#include "../include/scanner/indicators.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <exception>
#include <string>

namespace scanner {

namespace {

bool polar_formation(Direction d, const PriceBar& bar, const IndicatorSnapshot& ind) {
    if (d == Direction::Long) {
        return bar.close > bar.open && bar.close > ind.ema8 && bar.close > ind.ema21;
    }
    return bar.close < bar.open && bar.close < ind.ema8 && bar.close < ind.ema21;
}

bool ema_positioning(Direction d, const IndicatorSnapshot& ind) {
    return d == Direction::Long ? ind.ema5 < ind.atr_long_line : ind.ema5 > ind.atr_short_line;
}

double relative_change(double current, double previous, const char* name) {
    if (!(previous > 0.0) || !std::isfinite(previous) || !std::isfinite(current)) {
        throw CalculationError(std::string("Cannot compute ") + name + " change from " + std::to_string(previous));
    }
    return (current - previous) / previous;
}

bool ema_momentum(Direction d, const std::vector<IndicatorSnapshot>& history, const AlgorithmSettings& settings) {
    if (history.size() < 2) {
        spdlog::debug("[signals] insufficient historical snapshots for EMA momentum check");
        return false;
    }
    const auto& cur = history[history.size() - 1];
    const auto& prev = history[history.size() - 2];

    const double ema5_change = relative_change(cur.ema5, prev.ema5, "ema5");
    const double ema8_change = relative_change(cur.ema8, prev.ema8, "ema8");
    const double ema21_change = relative_change(cur.ema21, prev.ema21, "ema21");

    if (d == Direction::Long) {
        return ema5_change >= settings.ema5_rising_threshold() &&
               ema8_change >= settings.ema8_rising_threshold() &&
               ema21_change >= settings.ema21_rising_threshold();
    }
    return ema5_change <= -settings.ema5_rising_threshold() &&
           ema8_change <= -settings.ema8_rising_threshold() &&
           ema21_change <= -settings.ema21_rising_threshold();
}

bool fomo_filter(const PriceBar& bar, const IndicatorSnapshot& ind, const AlgorithmSettings& settings) {
    const double max_distance = ind.atr * settings.fomo_filter();
    return std::abs(bar.close - ind.ema8) <= max_distance &&
           std::abs(bar.close - ind.ema21) <= max_distance;
}

bool volatility_filter(const IndicatorSnapshot& ind, const AlgorithmSettings& settings) {
    return ind.atr >= 1.0 / settings.volatility_filter();
}

bool htf_confirmation(Direction d, const PriceBar& htf_bar, const IndicatorSnapshot& htf) {
    if (d == Direction::Long) {
        return htf.ema5 > htf.ema8 && htf_bar.close > htf_bar.open;
    }
    return htf.ema5 < htf.ema8 && htf_bar.close < htf_bar.open;
}

// A failing check only fails its own condition.
template <typename Check>
bool guarded(ConditionId id, Direction d, const std::string& symbol, Check&& check) {
    try {
        return check();
    } catch (const std::exception& e) {
        spdlog::error("[signals] {} {} check failed for {}: {}", to_string(d), condition_key(id), symbol, e.what());
        return false;
    }
}

DirectionEvaluation evaluate_direction(
    Direction d,
    const PriceBar& bar,
    const IndicatorSnapshot& ind,
    const std::vector<IndicatorSnapshot>& history,
    const PriceBar* htf_bar,
    const IndicatorSnapshot* htf_ind,
    const AlgorithmSettings& settings
) {
    DirectionEvaluation ev;
    ev.direction = d;
    ev.total_conditions = 5;

    auto record = [&](ConditionId id, bool ok) {
        ev.passed[static_cast<std::size_t>(id)] = ok;
        if (ok) {
            ++ev.conditions_met;
            spdlog::debug("[signals] {} {} passed for {}", to_string(d), condition_key(id), bar.symbol);
        }
    };

    record(ConditionId::PolarFormation, guarded(ConditionId::PolarFormation, d, bar.symbol,
        [&] { return polar_formation(d, bar, ind); }));
    record(ConditionId::EmaPositioning, guarded(ConditionId::EmaPositioning, d, bar.symbol,
        [&] { return ema_positioning(d, ind); }));
    record(ConditionId::EmaMomentum, guarded(ConditionId::EmaMomentum, d, bar.symbol,
        [&] { return ema_momentum(d, history, settings); }));
    record(ConditionId::FomoFilter, guarded(ConditionId::FomoFilter, d, bar.symbol,
        [&] { return fomo_filter(bar, ind, settings); }));
    record(ConditionId::VolatilityFilter, guarded(ConditionId::VolatilityFilter, d, bar.symbol,
        [&] { return volatility_filter(ind, settings); }));

    if (htf_bar && htf_ind) {
        ev.htf_evaluated = true;
        ev.total_conditions = 6;
        record(ConditionId::HtfConfirmation, guarded(ConditionId::HtfConfirmation, d, bar.symbol,
            [&] { return htf_confirmation(d, *htf_bar, *htf_ind); }));
    }

    ev.confidence = static_cast<double>(ev.conditions_met) / ev.total_conditions;
    ev.valid = ev.conditions_met == ev.total_conditions;

    if (ev.valid) {
        spdlog::info("[signals] {} signal generated for {} with confidence {:.2f}",
                     to_string(d), bar.symbol, ev.confidence);
    }
    return ev;
}

std::vector<PriceBar> without_last(const std::vector<PriceBar>& series) {
    return std::vector<PriceBar>(series.begin(), series.end() - 1);
}

} // namespace

DirectionEvaluation evaluate_long(
    const PriceBar& bar,
    const IndicatorSnapshot& indicators,
    const std::vector<IndicatorSnapshot>& history,
    const PriceBar* htf_bar,
    const IndicatorSnapshot* htf_indicators,
    const AlgorithmSettings& settings
) {
    return evaluate_direction(Direction::Long, bar, indicators, history, htf_bar, htf_indicators, settings);
}

DirectionEvaluation evaluate_short(
    const PriceBar& bar,
    const IndicatorSnapshot& indicators,
    const std::vector<IndicatorSnapshot>& history,
    const PriceBar* htf_bar,
    const IndicatorSnapshot* htf_indicators,
    const AlgorithmSettings& settings
) {
    return evaluate_direction(Direction::Short, bar, indicators, history, htf_bar, htf_indicators, settings);
}

SignalBatch generate_signals(
    const std::vector<PriceBar>& series,
    const std::vector<PriceBar>& htf_series,
    const AlgorithmSettings& settings
) {
    SignalBatch batch;
    if (series.empty()) return batch;

    const PriceBar& bar = series.back();
    if (series.size() < kMinHistoryBars + 1) {
        spdlog::debug("[signals] {}: need {} historical bars, have {}",
                      bar.symbol, kMinHistoryBars, series.size() - 1);
        return batch;
    }

    try {
        const IndicatorSnapshot indicators = compute_indicators(series, settings.atr_multiplier());

        std::vector<IndicatorSnapshot> history;
        if (series.size() - 1 >= kMinIndicatorBars) {
            history.push_back(compute_indicators(without_last(series), settings.atr_multiplier()));
        }
        history.push_back(indicators);

        const PriceBar* htf_bar = nullptr;
        IndicatorSnapshot htf_indicators{};
        if (!htf_series.empty()) {
            htf_indicators = compute_indicators(htf_series, settings.atr_multiplier());
            htf_bar = &htf_series.back();
        }
        const IndicatorSnapshot* htf_ind = htf_bar ? &htf_indicators : nullptr;

        batch.long_evaluation = evaluate_long(bar, indicators, history, htf_bar, htf_ind, settings);
        batch.short_evaluation = evaluate_short(bar, indicators, history, htf_bar, htf_ind, settings);
        batch.evaluated = true;

        for (const auto* ev : {&batch.long_evaluation, &batch.short_evaluation}) {
            if (ev->valid) {
                batch.signals.push_back(Signal{bar.symbol, ev->direction, bar.timestamp, bar.close, indicators, ev->confidence});
            }
        }
    } catch (const InsufficientData& e) {
        spdlog::warn("[signals] cannot generate signals for {}: {}", bar.symbol, e.what());
    } catch (const CalculationError& e) {
        spdlog::warn("[signals] cannot generate signals for {}: {}", bar.symbol, e.what());
    } catch (const std::exception& e) {
        spdlog::error("[signals] error generating signals for {}: {}", bar.symbol, e.what());
    }

    if (!batch.evaluated) {
        batch.signals.clear();
    }
    return batch;
}

} // namespace scanner
