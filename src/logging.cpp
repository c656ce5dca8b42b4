#include "../include/scanner/logging.hpp"
#include "../include/scanner/errors.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace scanner {

spdlog::level::level_enum parse_log_level(const std::string& level) {
    std::string s = level;
    std::transform(s.begin(), s.end(), s.begin(), ::toupper);
    if (s == "DEBUG") return spdlog::level::debug;
    if (s == "INFO") return spdlog::level::info;
    if (s == "WARNING") return spdlog::level::warn;
    if (s == "ERROR") return spdlog::level::err;
    if (s == "CRITICAL") return spdlog::level::critical;
    throw ValidationError("Invalid log level '" + level + "'. Valid options: DEBUG, INFO, WARNING, ERROR, CRITICAL");
}

void init_logging(const LoggingConfig& config) {
    const auto level = parse_log_level(config.level);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, config.max_file_size, config.max_files));
    }

    auto logger = std::make_shared<spdlog::logger>("stock_scanner", sinks.begin(), sinks.end());
    logger->set_level(level);
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] %v");
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::info("[app] logging initialised at level {}{}", config.level,
                 config.file.empty() ? std::string() : ", file " + config.file);
}

} // namespace scanner
