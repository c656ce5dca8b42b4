#include "../include/scanner/utils.hpp"
#include "../include/scanner/errors.hpp"
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace scanner {

long long utc_to_unix(const std::string& date_str, const std::string& time_str) {
    std::string dt = date_str + " " + time_str;
    std::tm tm = {};
    std::istringstream ss(dt);
    ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
        throw std::runtime_error("Invalid date/time format: " + dt);
    }
    std::tm requested = tm;
    std::time_t utc_time = timegm(&tm);
    // timegm normalises out-of-range fields (Feb 30 -> Mar 1); reject those
    if (tm.tm_year != requested.tm_year || tm.tm_mon != requested.tm_mon || tm.tm_mday != requested.tm_mday) {
        throw std::runtime_error("Invalid calendar date: " + date_str);
    }
    return static_cast<long long>(utc_time);
}

std::string format_iso_utc(long long epoch_sec) {
    std::time_t t = static_cast<std::time_t>(epoch_sec);
    std::tm tm = {};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::pair<long long, long long> parse_date_range(const std::string& start_date, const std::string& end_date) {
    static const long long kMinDate = utc_to_unix("2000-01-01");
    std::vector<std::string> errors;

    auto parse = [&](const std::string& value, const char* field, long long& out) {
        try {
            out = utc_to_unix(value);
        } catch (const std::runtime_error&) {
            errors.push_back(std::string("Invalid date format for ") + field + ". Use YYYY-MM-DD");
            return false;
        }
        if (out < kMinDate) {
            errors.push_back(std::string(field) + " cannot be before 2000-01-01");
            return false;
        }
        return true;
    };

    long long start = 0, end = 0;
    const bool start_ok = parse(start_date, "start_date", start);
    const bool end_ok = parse(end_date, "end_date", end);

    if (start_ok && end_ok) {
        if (start >= end) {
            errors.emplace_back("Start date must be before end date");
        } else if ((end - start) / 86400 > kMaxBacktestRangeDays) {
            errors.push_back("Date range too long (maximum " + std::to_string(kMaxBacktestRangeDays) + " days)");
        }
    }

    if (!errors.empty()) throw ValidationError(errors);
    return {start, end};
}

static std::string double_to_string(double v, int precision = 4) {
    if (std::isnan(v)) return "";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << v;
    return oss.str();
}

static std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ";";
        out += item;
    }
    return out;
}

// Quoted CSV field; embedded quotes are doubled.
static std::string csv_quote(const std::string& field) {
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string trades_to_csv(const std::vector<Trade>& trades) {
    std::ostringstream ss;
    ss << "symbol,direction,entry_time,entry_price,exit_time,exit_price,pnl,pnl_percent,exit_reason\n";
    for (const auto& t : trades) {
        ss << t.symbol << ","
           << to_string(t.direction) << ","
           << format_iso_utc(t.entry_time) << ","
           << double_to_string(t.entry_price) << ","
           << format_iso_utc(t.exit_time) << ","
           << double_to_string(t.exit_price) << ","
           << double_to_string(t.pnl) << ","
           << double_to_string(t.pnl_percent, 6) << ","
           << to_string(t.exit_reason) << "\n";
    }
    return ss.str();
}

std::string signals_to_csv(const std::vector<Signal>& signals) {
    std::ostringstream ss;
    ss << "symbol,direction,timestamp,price,confidence,ema5,ema8,ema13,ema21,ema50,atr,atr_long_line,atr_short_line\n";
    for (const auto& s : signals) {
        const auto& ind = s.indicators;
        ss << s.symbol << ","
           << to_string(s.direction) << ","
           << format_iso_utc(s.timestamp) << ","
           << double_to_string(s.price) << ","
           << double_to_string(s.confidence, 6) << ","
           << double_to_string(ind.ema5) << ","
           << double_to_string(ind.ema8) << ","
           << double_to_string(ind.ema13) << ","
           << double_to_string(ind.ema21) << ","
           << double_to_string(ind.ema50) << ","
           << double_to_string(ind.atr) << ","
           << double_to_string(ind.atr_long_line) << ","
           << double_to_string(ind.atr_short_line) << "\n";
    }
    return ss.str();
}

std::string summary_to_csv(const PerformanceSummary& summary) {
    std::ostringstream ss;
    ss << "metric,value\n"
       << "total_trades," << summary.total_trades << "\n"
       << "winning_trades," << summary.winning_trades << "\n"
       << "losing_trades," << summary.losing_trades << "\n"
       << "win_rate," << double_to_string(summary.win_rate, 6) << "\n"
       << "total_return," << double_to_string(summary.total_return, 6) << "\n"
       << "average_return," << double_to_string(summary.average_return, 6) << "\n"
       << "max_drawdown," << double_to_string(summary.max_drawdown, 6) << "\n"
       << "sharpe_ratio," << double_to_string(summary.sharpe_ratio, 6) << "\n";
    return ss.str();
}

std::string evaluations_to_csv(const std::vector<SymbolEvaluation>& evaluations) {
    std::ostringstream ss;
    ss << "symbol,timestamp,price,bars,direction,conditions_met,total_conditions,confidence,valid,satisfied,failed,error\n";
    for (const auto& e : evaluations) {
        if (!e.evaluated) {
            ss << e.symbol << ","
               << (e.timestamp ? format_iso_utc(e.timestamp) : "") << ","
               << (e.timestamp ? double_to_string(e.price) : "") << ","
               << e.bars << ",,,,,false,,,"
               << csv_quote(e.error) << "\n";
            continue;
        }
        for (const auto* ev : {&e.long_evaluation, &e.short_evaluation}) {
            ss << e.symbol << ","
               << format_iso_utc(e.timestamp) << ","
               << double_to_string(e.price) << ","
               << e.bars << ","
               << to_string(ev->direction) << ","
               << ev->conditions_met << ","
               << ev->total_conditions << ","
               << double_to_string(ev->confidence, 6) << ","
               << (ev->valid ? "true" : "false") << ","
               << csv_quote(join(ev->satisfied_conditions())) << ","
               << csv_quote(join(ev->failure_reasons())) << ","
               << csv_quote(e.error) << "\n";
        }
    }
    return ss.str();
}

} // namespace scanner
