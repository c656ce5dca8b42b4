#pragma once
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "settings.hpp"
#include "types.hpp"

namespace scanner {

constexpr std::size_t kMaxSymbolLength = 12;
constexpr std::size_t kMaxSymbolsPerRequest = 100;

// Trimmed, upper-cased symbol, or nullopt when it is not a plausible ticker.
std::optional<std::string> validate_symbol(const std::string& raw);

// Validates and de-duplicates, keeping first-seen order. Throws ValidationError
// listing every rejected entry.
std::vector<std::string> normalize_symbols(const std::vector<std::string>& symbols,
                                           std::size_t max_symbols = kMaxSymbolsPerRequest);

// Drops unusable bars (non-finite or non-positive prices, broken high/low range)
// and returns the rest sorted by timestamp.
std::vector<PriceBar> clean_bars(std::vector<PriceBar> bars);

// Chart API JSON body -> raw bars. Entries with a null price are skipped.
std::vector<PriceBar> parse_chart_response(const std::string& symbol, const std::string& body);

// Resamples to `bucket_seconds` buckets aligned on epoch multiples.
std::vector<PriceBar> aggregate_bars(const std::vector<PriceBar>& bars, long long bucket_seconds);

// Interval string understood by the chart API for a timeframe (2h/4h are fetched as 60m).
const char* chart_interval(Timeframe tf);

struct MarketDataOptions {
    std::string base_url = "https://query1.finance.yahoo.com/v8/finance/chart/";
    long timeout_seconds = 30;
    int retry_count = 3;
    int cache_ttl_minutes = 5;
    int historical_cache_ttl_minutes = 30;
    std::chrono::milliseconds min_request_interval{300};
};

// Source of cleaned, timestamp-ordered bars.
class BarSource {
public:
    virtual ~BarSource() = default;

    virtual std::vector<PriceBar> fetch_range(const std::string& symbol, Timeframe tf,
                                              long long start_time, long long end_time) = 0;
    virtual std::vector<PriceBar> fetch_recent(const std::string& symbol, Timeframe tf, int days) = 0;

    // Per-symbol failures are logged and leave an empty series.
    std::map<std::string, std::vector<PriceBar>> fetch_many(
        const std::vector<std::string>& symbols, Timeframe tf, long long start_time, long long end_time);
    std::map<std::string, std::vector<PriceBar>> fetch_many(
        const std::vector<std::string>& symbols, Timeframe tf, int days);
};

// Chart API client. Thread-safe: the cache and request pacing are shared.
class MarketDataClient : public BarSource {
public:
    explicit MarketDataClient(MarketDataOptions options = {});

    std::vector<PriceBar> fetch_range(const std::string& symbol, Timeframe tf,
                                      long long start_time, long long end_time) override;
    std::vector<PriceBar> fetch_recent(const std::string& symbol, Timeframe tf, int days) override;

    std::size_t cache_size() const;
    void clear_cache();

private:
    struct CacheEntry {
        std::chrono::steady_clock::time_point expires;
        std::vector<PriceBar> bars;
    };

    std::vector<PriceBar> fetch(const std::string& symbol, Timeframe tf,
                                const std::string& query, const std::string& cache_key, int ttl_minutes);
    std::string request(const std::string& url);
    void rate_limit();

    MarketDataOptions options_;
    mutable std::mutex mutex_;
    std::map<std::string, CacheEntry> cache_;
    std::mutex pace_mutex_;
    std::chrono::steady_clock::time_point last_request_{};
};

} // namespace scanner
