#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "app_config.hpp"
#include "market_data.hpp"
#include "settings.hpp"

namespace scanner {

// Request handling behind the REST endpoints: JSON in, JSON out. Bad input raises
// ValidationError; data-source failures are absorbed per symbol.
class ScannerService {
public:
    ScannerService(AppConfig config, BarSource& source);

    nlohmann::json health() const;

    nlohmann::json settings() const;
    nlohmann::json update_settings(const nlohmann::json& body);
    nlohmann::json reset_settings();

    // Raw bars for one symbol; query values arrive as text. An empty timeframe or days
    // falls back to the scan defaults.
    nlohmann::json market_data(const std::string& symbol, const std::string& timeframe,
                               const std::string& days);

    // {symbols, settings?}
    nlohmann::json scan(const nlohmann::json& body);

    // {symbols, start_date, end_date, settings?, simulation?, include_files?}
    nlohmann::json backtest(const nlohmann::json& body);

    AlgorithmSettings current_settings() const;

private:
    std::vector<std::string> request_symbols(const nlohmann::json& body) const;
    AlgorithmSettings request_settings(const nlohmann::json& body) const;

    AppConfig config_;
    BarSource& source_;
    mutable std::mutex mutex_;
    AlgorithmSettings settings_;
};

} // namespace scanner
