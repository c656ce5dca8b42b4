#include "../include/scanner/market_data.hpp"
#include "../include/scanner/errors.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append((char*)contents, size * nmemb);
    return size * nmemb;
}

static std::string trim_upper(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    std::string out = begin < end ? std::string(begin, end) : std::string();
    std::transform(out.begin(), out.end(), out.begin(), ::toupper);
    return out;
}

namespace scanner {

namespace {

const std::regex kStockPattern(R"(^[A-Z]{1,5}(\.[A-Z]{1,2})?(-[A-Z])?$)");
const std::regex kCryptoPattern(R"(^[A-Z]{2,10}-(USD|EUR|BTC|ETH)$)");
const std::regex kPlainPattern(R"(^[A-Z]{1,8}$)");
const std::regex kInvalidChars(R"([^A-Z0-9.\-])");

const std::set<std::string> kReservedWords = {"NULL", "NONE", "UNDEFINED", "TEST", "DEMO", "SAMPLE"};

std::string symbol_error(const std::string& raw, const std::string& symbol) {
    if (symbol.empty()) return "Symbol cannot be empty";
    if (symbol.size() > kMaxSymbolLength) {
        return "Symbol '" + raw + "' too long (max " + std::to_string(kMaxSymbolLength) + " characters)";
    }
    if (kReservedWords.count(symbol)) return "'" + symbol + "' is a reserved word";
    if (!std::isupper(static_cast<unsigned char>(symbol.front())) || std::regex_search(symbol, kInvalidChars)) {
        return "Symbol '" + symbol + "' contains invalid characters";
    }
    return "Symbol '" + symbol + "' does not match valid format";
}

bool is_valid_price(double v) {
    return std::isfinite(v) && v > 0.0;
}

long long bucket_start(long long ts, long long bucket) {
    long long q = ts / bucket;
    if (ts % bucket < 0) --q;
    return q * bucket;
}

} // namespace

std::optional<std::string> validate_symbol(const std::string& raw) {
    const std::string symbol = trim_upper(raw);
    if (symbol.empty() || symbol.size() > kMaxSymbolLength) return std::nullopt;
    if (kReservedWords.count(symbol)) return std::nullopt;
    if (!std::isupper(static_cast<unsigned char>(symbol.front()))) return std::nullopt;
    if (std::regex_search(symbol, kInvalidChars)) return std::nullopt;

    if (std::regex_match(symbol, kStockPattern) ||
        std::regex_match(symbol, kCryptoPattern) ||
        std::regex_match(symbol, kPlainPattern)) {
        return symbol;
    }
    return std::nullopt;
}

std::vector<std::string> normalize_symbols(const std::vector<std::string>& symbols, std::size_t max_symbols) {
    if (symbols.empty()) {
        throw ValidationError("At least one symbol is required");
    }

    std::vector<std::string> errors;
    if (symbols.size() > max_symbols) {
        errors.push_back("Too many symbols (max " + std::to_string(max_symbols) + ")");
    }

    std::vector<std::string> out;
    std::set<std::string> seen;
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        auto symbol = validate_symbol(symbols[i]);
        if (!symbol) {
            errors.push_back("symbols[" + std::to_string(i) + "]: " + symbol_error(symbols[i], trim_upper(symbols[i])));
            continue;
        }
        if (seen.insert(*symbol).second) {
            out.push_back(*symbol);
        } else {
            spdlog::debug("[fetch] duplicate symbol '{}' removed", *symbol);
        }
    }

    if (!errors.empty()) throw ValidationError(errors);
    return out;
}

std::vector<PriceBar> clean_bars(std::vector<PriceBar> bars) {
    std::vector<PriceBar> out;
    out.reserve(bars.size());
    for (auto& b : bars) {
        if (!is_valid_price(b.open) || !is_valid_price(b.high) ||
            !is_valid_price(b.low) || !is_valid_price(b.close)) {
            continue;
        }
        if (b.high < std::max(b.open, b.close) || b.low > std::min(b.open, b.close)) {
            continue;
        }
        if (b.volume < 0) b.volume = 0;
        out.push_back(std::move(b));
    }
    std::stable_sort(out.begin(), out.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

std::vector<PriceBar> parse_chart_response(const std::string& symbol, const std::string& body) {
    json response;
    try {
        response = json::parse(body);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error for " + symbol + ": " + std::string(e.what()));
    }

    const auto chart = response.find("chart");
    if (chart == response.end() || !chart->is_object()) {
        throw std::runtime_error("Unexpected chart response for " + symbol);
    }

    const auto error = chart->find("error");
    if (error != chart->end() && !error->is_null()) {
        std::string description = error->is_object()
            ? error->value("description", std::string("unknown error"))
            : error->dump();
        throw std::runtime_error("Chart API error for " + symbol + ": " + description);
    }

    const auto result = chart->find("result");
    if (result == chart->end() || !result->is_array() || result->empty()) {
        return {};
    }

    const auto& series = result->at(0);
    if (!series.contains("timestamp") || !series.contains("indicators")) {
        return {};
    }
    const auto& timestamps = series.at("timestamp");
    const auto& indicators = series.at("indicators");
    if (!timestamps.is_array() || !indicators.contains("quote")) {
        return {};
    }
    const auto& quotes = indicators.at("quote");
    if (!quotes.is_array() || quotes.empty()) {
        return {};
    }
    const auto& q = quotes.at(0);

    auto at = [&](const char* field, std::size_t i) -> const json* {
        if (!q.contains(field)) return nullptr;
        const auto& arr = q.at(field);
        if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) return nullptr;
        return &arr[i];
    };

    std::vector<PriceBar> bars;
    bars.reserve(timestamps.size());
    for (std::size_t i = 0; i < timestamps.size(); ++i) {
        const json* o = at("open", i);
        const json* h = at("high", i);
        const json* l = at("low", i);
        const json* c = at("close", i);
        if (!o || !h || !l || !c || !timestamps[i].is_number()) continue;
        const json* v = at("volume", i);

        PriceBar b;
        b.symbol = symbol;
        b.timestamp = timestamps[i].get<long long>();
        b.open = o->get<double>();
        b.high = h->get<double>();
        b.low = l->get<double>();
        b.close = c->get<double>();
        b.volume = v ? v->get<long long>() : 0;
        bars.push_back(std::move(b));
    }
    return bars;
}

std::vector<PriceBar> aggregate_bars(const std::vector<PriceBar>& bars, long long bucket_seconds) {
    if (bucket_seconds <= 0) {
        throw ValidationError("bucket_seconds must be positive");
    }

    std::vector<PriceBar> sorted = bars;
    std::stable_sort(sorted.begin(), sorted.end(), [](const PriceBar& a, const PriceBar& b) {
        return a.timestamp < b.timestamp;
    });

    std::vector<PriceBar> out;
    for (const auto& b : sorted) {
        const long long start = bucket_start(b.timestamp, bucket_seconds);
        if (!out.empty() && out.back().timestamp == start) {
            auto& cur = out.back();
            cur.high = std::max(cur.high, b.high);
            cur.low = std::min(cur.low, b.low);
            cur.close = b.close;
            cur.volume += b.volume;
        } else {
            PriceBar agg = b;
            agg.timestamp = start;
            out.push_back(std::move(agg));
        }
    }
    return out;
}

const char* chart_interval(Timeframe tf) {
    switch (tf) {
        case Timeframe::M1:  return "1m";
        case Timeframe::M2:  return "2m";
        case Timeframe::M5:  return "5m";
        case Timeframe::M15: return "15m";
        case Timeframe::M30: return "30m";
        case Timeframe::H1:
        case Timeframe::H2:
        case Timeframe::H4:  return "60m";
        case Timeframe::D1:  return "1d";
    }
    return "1d";
}

MarketDataClient::MarketDataClient(MarketDataOptions options) : options_(std::move(options)) {}

void MarketDataClient::rate_limit() {
    std::lock_guard<std::mutex> lock(pace_mutex_);
    const auto now = std::chrono::steady_clock::now();
    const auto next = last_request_ + options_.min_request_interval;
    if (now < next) {
        std::this_thread::sleep_for(next - now);
    }
    last_request_ = std::chrono::steady_clock::now();
}

std::string MarketDataClient::request(const std::string& url) {
    std::string last_error = "no attempts made";
    const int attempts = std::max(1, options_.retry_count);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        rate_limit();
        spdlog::debug("[fetch] attempt {}/{} URL: {}", attempt, attempts, url);

        CURL* curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to init CURL");
        }

        std::string readBuffer;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &readBuffer);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, options_.timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "stock-scanner/1.0");
        CURLcode res = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (res != CURLE_OK) {
            last_error = "CURL error: " + std::string(curl_easy_strerror(res));
        } else if (status == 404) {
            // unknown symbol; the body carries the API's error description
            return readBuffer;
        } else if (status >= 400) {
            last_error = "HTTP " + std::to_string(status);
        } else {
            return readBuffer;
        }

        spdlog::warn("[fetch] attempt {}/{} failed: {}", attempt, attempts, last_error);
        if (attempt < attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500 * attempt));
        }
    }
    throw std::runtime_error(last_error + " (" + url + ")");
}

std::vector<PriceBar> MarketDataClient::fetch(const std::string& symbol, Timeframe tf,
                                              const std::string& query, const std::string& cache_key,
                                              int ttl_minutes) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(cache_key);
        if (it != cache_.end()) {
            if (it->second.expires > std::chrono::steady_clock::now()) {
                spdlog::debug("[fetch] cache hit {}", cache_key);
                return it->second.bars;
            }
            cache_.erase(it);
        }
    }

    std::ostringstream url;
    url << options_.base_url << symbol << "?interval=" << chart_interval(tf) << query;

    auto bars = clean_bars(parse_chart_response(symbol, request(url.str())));
    if (tf == Timeframe::H2 || tf == Timeframe::H4) {
        bars = aggregate_bars(bars, timeframe_seconds(tf));
    }
    spdlog::info("[fetch] {} {}: {} bars", symbol, to_string(tf), bars.size());

    std::lock_guard<std::mutex> lock(mutex_);
    cache_[cache_key] = CacheEntry{
        std::chrono::steady_clock::now() + std::chrono::minutes(ttl_minutes),
        bars
    };
    return bars;
}

std::vector<PriceBar> MarketDataClient::fetch_range(const std::string& symbol, Timeframe tf,
                                                    long long start_time, long long end_time) {
    if (start_time >= end_time) {
        throw ValidationError("start_time must be before end_time");
    }
    std::ostringstream query;
    query << "&period1=" << start_time << "&period2=" << end_time;
    std::ostringstream key;
    key << "historical_" << symbol << "_" << to_string(tf) << "_" << start_time << "_" << end_time;
    return fetch(symbol, tf, query.str(), key.str(), options_.historical_cache_ttl_minutes);
}

std::vector<PriceBar> MarketDataClient::fetch_recent(const std::string& symbol, Timeframe tf, int days) {
    if (days <= 0) {
        throw ValidationError("days must be positive");
    }
    const std::string range = std::to_string(days) + "d";
    const std::string key = "current_" + symbol + "_" + to_string(tf) + "_" + range;
    return fetch(symbol, tf, "&range=" + range, key, options_.cache_ttl_minutes);
}

std::map<std::string, std::vector<PriceBar>> BarSource::fetch_many(
    const std::vector<std::string>& symbols, Timeframe tf, long long start_time, long long end_time) {
    std::map<std::string, std::vector<PriceBar>> out;
    for (const auto& symbol : symbols) {
        try {
            out[symbol] = fetch_range(symbol, tf, start_time, end_time);
        } catch (const std::exception& e) {
            spdlog::error("[fetch] error fetching historical data for {}: {}", symbol, e.what());
            out[symbol] = {};
        }
    }
    return out;
}

std::map<std::string, std::vector<PriceBar>> BarSource::fetch_many(
    const std::vector<std::string>& symbols, Timeframe tf, int days) {
    std::map<std::string, std::vector<PriceBar>> out;
    for (const auto& symbol : symbols) {
        try {
            out[symbol] = fetch_recent(symbol, tf, days);
        } catch (const std::exception& e) {
            spdlog::error("[fetch] error fetching data for {}: {}", symbol, e.what());
            out[symbol] = {};
        }
    }
    return out;
}

std::size_t MarketDataClient::cache_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

void MarketDataClient::clear_cache() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    spdlog::info("[fetch] data cache cleared");
}

} // namespace scanner
