#pragma once
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

namespace scanner {

constexpr int kMaxBacktestRangeDays = 365 * 5;

// "YYYY-MM-DD" (or "YYYY-MM-DD HH:MM:SS") interpreted as UTC.
long long utc_to_unix(const std::string& date_str, const std::string& time_str = "00:00:00");

// 2024-01-31T14:30:00Z
std::string format_iso_utc(long long epoch_sec);

// Parses and checks a backtest date range: both dates valid, not before 2000-01-01,
// start < end, at most kMaxBacktestRangeDays apart. Returns {start, end} epoch seconds.
// Throws ValidationError listing every problem.
std::pair<long long, long long> parse_date_range(const std::string& start_date, const std::string& end_date);

std::string trades_to_csv(const std::vector<Trade>& trades);
std::string signals_to_csv(const std::vector<Signal>& signals);
std::string summary_to_csv(const PerformanceSummary& summary);
std::string evaluations_to_csv(const std::vector<SymbolEvaluation>& evaluations);

} // namespace scanner
