#include "../include/scanner/app_config.hpp"
#include "../include/scanner/errors.hpp"
#include "../include/scanner/settings.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace scanner {

namespace {

const char* const kLogLevels[] = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};

int parse_int(const std::string& name, const std::string& value) {
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(value, &used);
    } catch (const std::logic_error&) {
        throw ValidationError(name + " must be an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw ValidationError(name + " must be an integer, got '" + value + "'");
    }
    return out;
}

template <typename T>
void read_json(const json& j, const char* key, T& field) {
    if (!j.contains(key)) return;
    try {
        field = j.at(key).get<T>();
    } catch (const json::exception& e) {
        throw ValidationError(std::string(key) + ": " + e.what());
    }
}

void read_env(const char* name, std::string& field) {
    if (const char* v = std::getenv(name)) field = v;
}

template <typename Int>
void read_env(const char* name, Int& field) {
    if (const char* v = std::getenv(name)) field = static_cast<Int>(parse_int(name, v));
}

} // namespace

MarketDataOptions AppConfig::market_data_options() const {
    MarketDataOptions opts;
    opts.base_url = chart_api_url;
    opts.timeout_seconds = fetch_timeout_seconds;
    opts.retry_count = fetch_retry_count;
    opts.cache_ttl_minutes = cache_ttl_minutes;
    return opts;
}

void apply_env_overrides(AppConfig& config) {
    read_env("API_HOST", config.api_host);
    read_env("API_PORT", config.api_port);
    read_env("API_THREADS", config.api_threads);
    read_env("LOG_LEVEL", config.logging.level);
    read_env("LOG_FILE", config.logging.file);
    read_env("FETCH_TIMEOUT", config.fetch_timeout_seconds);
    read_env("FETCH_RETRY_COUNT", config.fetch_retry_count);
    read_env("CACHE_TTL_MINUTES", config.cache_ttl_minutes);
    read_env("CHART_API_URL", config.chart_api_url);
    read_env("SCAN_INTERVAL", config.scan_interval);
    read_env("SCAN_RANGE_DAYS", config.scan_range_days);
    read_env("SCAN_WORKERS", config.scan_workers);
    read_env("BACKTEST_WORKERS", config.backtest_workers);
}

void validate(const AppConfig& config) {
    std::vector<std::string> errors;
    if (config.api_port <= 0 || config.api_port > 65535) errors.emplace_back("api_port must be in 1..65535");
    if (config.api_threads <= 0) errors.emplace_back("api_threads must be positive");
    if (config.fetch_timeout_seconds <= 0) errors.emplace_back("fetch_timeout_seconds must be positive");
    if (config.fetch_retry_count <= 0) errors.emplace_back("fetch_retry_count must be positive");
    if (config.cache_ttl_minutes < 0) errors.emplace_back("cache_ttl_minutes must be non-negative");
    if (config.scan_range_days <= 0) errors.emplace_back("scan_range_days must be positive");
    if (config.scan_workers <= 0) errors.emplace_back("scan_workers must be positive");
    if (config.backtest_workers <= 0) errors.emplace_back("backtest_workers must be positive");
    if (config.chart_api_url.empty()) errors.emplace_back("chart_api_url must not be empty");

    std::string level = config.logging.level;
    std::transform(level.begin(), level.end(), level.begin(), ::toupper);
    bool known_level = false;
    for (const char* name : kLogLevels) {
        if (level == name) known_level = true;
    }
    if (!known_level) errors.push_back("log_level must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");

    try {
        parse_timeframe(config.scan_interval);
    } catch (const ValidationError& e) {
        errors.push_back(std::string("scan_interval: ") + e.what());
    }

    if (!errors.empty()) throw ValidationError(errors);
}

AppConfig load_app_config(const std::string& path) {
    AppConfig config;

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            throw std::runtime_error("Cannot open config file: " + path);
        }
        json j;
        try {
            in >> j;
        } catch (const json::parse_error& e) {
            throw std::runtime_error("Invalid config file " + path + ": " + e.what());
        }
        read_json(j, "api_host", config.api_host);
        read_json(j, "api_port", config.api_port);
        read_json(j, "api_threads", config.api_threads);
        read_json(j, "log_level", config.logging.level);
        read_json(j, "log_file", config.logging.file);
        read_json(j, "fetch_timeout_seconds", config.fetch_timeout_seconds);
        read_json(j, "fetch_retry_count", config.fetch_retry_count);
        read_json(j, "cache_ttl_minutes", config.cache_ttl_minutes);
        read_json(j, "chart_api_url", config.chart_api_url);
        read_json(j, "scan_interval", config.scan_interval);
        read_json(j, "scan_range_days", config.scan_range_days);
        read_json(j, "scan_workers", config.scan_workers);
        read_json(j, "backtest_workers", config.backtest_workers);
    }

    apply_env_overrides(config);
    validate(config);
    return config;
}

} // namespace scanner
