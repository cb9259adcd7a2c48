#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace royaos::util {

void init_logger(const std::string& level) {
    auto console = spdlog::get("royaos");
    if (!console) {
        console = spdlog::stdout_color_mt("royaos");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(parse_log_level(level));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str returns off for names it does not know
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace royaos::util
