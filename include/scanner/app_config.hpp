#pragma once
#include <string>
#include "market_data.hpp"

namespace scanner {

struct LoggingConfig {
    std::string level = "INFO";
    std::string file = "logs/app.log";
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
};

struct AppConfig {
    std::string api_host = "0.0.0.0";
    int api_port = 8000;
    int api_threads = 4;

    LoggingConfig logging;

    long fetch_timeout_seconds = 30;
    int fetch_retry_count = 3;
    int cache_ttl_minutes = 5;
    std::string chart_api_url = "https://query1.finance.yahoo.com/v8/finance/chart/";

    std::string scan_interval = "1m";
    int scan_range_days = 5;
    int scan_workers = 5;
    int backtest_workers = 3;

    MarketDataOptions market_data_options() const;
};

// Defaults, then the JSON file at `path` (if non-empty), then environment variables.
// Throws std::runtime_error for an unreadable file and ValidationError for bad values.
AppConfig load_app_config(const std::string& path = "");

// Applies recognised environment variables (API_PORT, LOG_LEVEL, ...) to `config`.
void apply_env_overrides(AppConfig& config);

void validate(const AppConfig& config);

} // namespace scanner
