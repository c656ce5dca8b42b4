#include "../include/scanner/service.hpp"
#include "../include/scanner/errors.hpp"
#include "../include/scanner/json_io.hpp"
#include "../include/scanner/runner.hpp"
#include "../include/scanner/utils.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace scanner {

namespace {

constexpr long long kSecondsPerDay = 86400;

std::vector<SymbolData> assemble(const std::vector<std::string>& symbols,
                                 std::map<std::string, std::vector<PriceBar>>& bars,
                                 std::map<std::string, std::vector<PriceBar>>& htf_bars) {
    std::vector<SymbolData> inputs;
    inputs.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        inputs.push_back(SymbolData{symbol, std::move(bars[symbol]), std::move(htf_bars[symbol])});
    }
    return inputs;
}

} // namespace

ScannerService::ScannerService(AppConfig config, BarSource& source)
    : config_(std::move(config)), source_(source) {}

json ScannerService::health() const {
    return json{{"status", "healthy"}, {"service", "stock-scanner"}};
}

AlgorithmSettings ScannerService::current_settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

json ScannerService::settings() const {
    return json(current_settings());
}

json ScannerService::update_settings(const json& body) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = AlgorithmSettings(merge_params(body, settings_.params()));
    spdlog::info("[api] settings updated: {}", json(settings_).dump());
    return json{
        {"success", true},
        {"message", "Settings updated successfully"},
        {"settings", settings_}
    };
}

json ScannerService::reset_settings() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = AlgorithmSettings(AlgorithmSettingsParams{});
    spdlog::info("[api] settings reset to defaults");
    return json{
        {"success", true},
        {"message", "Settings reset to defaults"},
        {"settings", settings_}
    };
}

json ScannerService::market_data(const std::string& symbol, const std::string& timeframe,
                                 const std::string& days_text) {
    const auto normalized = validate_symbol(symbol);
    if (!normalized) {
        throw ValidationError("invalid symbol: " + symbol);
    }
    const std::string tf_name = timeframe.empty() ? config_.scan_interval : timeframe;
    const Timeframe tf = parse_timeframe(tf_name);
    int days = config_.scan_range_days;
    if (!days_text.empty()) {
        std::size_t used = 0;
        try {
            days = std::stoi(days_text, &used);
        } catch (const std::logic_error&) {
            throw ValidationError("days must be an integer, got '" + days_text + "'");
        }
        if (used != days_text.size()) {
            throw ValidationError("days must be an integer, got '" + days_text + "'");
        }
        if (days <= 0) throw ValidationError("days must be positive");
    }

    spdlog::info("[api] market data requested for {} ({}, {} days)", *normalized, tf_name, days);

    const auto bars = source_.fetch_recent(*normalized, tf, days);
    json out_bars = json::array();
    for (const auto& bar : bars) out_bars.push_back(bar);
    return json{
        {"symbol", *normalized},
        {"timeframe", to_string(tf)},
        {"count", bars.size()},
        {"bars", std::move(out_bars)}
    };
}

std::vector<std::string> ScannerService::request_symbols(const json& body) const {
    if (!body.is_object() || !body.contains("symbols")) {
        throw ValidationError("symbols is required");
    }
    const auto& raw = body.at("symbols");
    if (!raw.is_array()) {
        throw ValidationError("symbols must be an array of strings");
    }
    std::vector<std::string> symbols;
    for (const auto& s : raw) {
        if (!s.is_string()) {
            throw ValidationError("symbols must be an array of strings");
        }
        symbols.push_back(s.get<std::string>());
    }
    return normalize_symbols(symbols);
}

AlgorithmSettings ScannerService::request_settings(const json& body) const {
    const AlgorithmSettings base = current_settings();
    if (!body.contains("settings") || body.at("settings").is_null()) {
        return base;
    }
    return AlgorithmSettings(merge_params(body.at("settings"), base.params()));
}

json ScannerService::scan(const json& body) {
    const auto symbols = request_symbols(body);
    const auto settings = request_settings(body);
    const Timeframe base_tf = parse_timeframe(config_.scan_interval);

    spdlog::info("[api] scan requested for {} symbols", symbols.size());

    auto bars = source_.fetch_many(symbols, base_tf, config_.scan_range_days);
    auto htf_bars = source_.fetch_many(symbols, settings.higher_timeframe(), config_.scan_range_days);

    auto report = scan_symbols(assemble(symbols, bars, htf_bars), settings, config_.scan_workers);
    return json(report);
}

json ScannerService::backtest(const json& body) {
    const auto symbols = request_symbols(body);
    const auto settings = request_settings(body);

    std::vector<std::string> errors;
    if (!body.contains("start_date") || !body.at("start_date").is_string()) {
        errors.emplace_back("start_date is required (YYYY-MM-DD)");
    }
    if (!body.contains("end_date") || !body.at("end_date").is_string()) {
        errors.emplace_back("end_date is required (YYYY-MM-DD)");
    }
    if (!errors.empty()) throw ValidationError(errors);

    const auto range = parse_date_range(body.at("start_date").get<std::string>(),
                                        body.at("end_date").get<std::string>());

    SimulationConfig simulation;
    if (body.contains("simulation") && !body.at("simulation").is_null()) {
        simulation = merge_simulation(body.at("simulation"), simulation);
    }
    validate(simulation);

    bool include_files = false;
    if (body.contains("include_files")) {
        if (!body.at("include_files").is_boolean()) {
            throw ValidationError("include_files must be a boolean");
        }
        include_files = body.at("include_files").get<bool>();
    }

    spdlog::info("[api] backtest requested for {} symbols, {} -> {}", symbols.size(),
                 body.at("start_date").get<std::string>(), body.at("end_date").get<std::string>());

    // end date is inclusive
    const long long start = range.first;
    const long long end = range.second + kSecondsPerDay;

    auto bars = source_.fetch_many(symbols, Timeframe::D1, start, end);
    auto htf_bars = settings.higher_timeframe() == Timeframe::D1
        ? bars
        : source_.fetch_many(symbols, settings.higher_timeframe(), start, end);

    auto report = run_backtest(assemble(symbols, bars, htf_bars), settings, simulation, config_.backtest_workers);

    json result = report;
    if (include_files) {
        result["files"] = {
            {"trades.csv", trades_to_csv(report.trades)},
            {"summary.csv", summary_to_csv(report.summary)}
        };
    }
    return result;
}

} // namespace scanner
