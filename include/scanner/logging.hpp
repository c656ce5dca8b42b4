#pragma once
#include <string>
#include <spdlog/common.h>
#include "app_config.hpp"

namespace scanner {

// DEBUG | INFO | WARNING | ERROR | CRITICAL, case-insensitive. Throws ValidationError.
spdlog::level::level_enum parse_log_level(const std::string& level);

// Installs the default "stock_scanner" logger: colour console plus, when
// config.file is set, a rotating file.
void init_logging(const LoggingConfig& config);

} // namespace scanner
