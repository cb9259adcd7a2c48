#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace royaos::util {

// Install the colored "royaos" console logger as spdlog's default logger
void init_logger(const std::string& level = "info");

void set_log_level(spdlog::level::level_enum level);

// Parse "trace".."critical"/"off"; unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace royaos::util
