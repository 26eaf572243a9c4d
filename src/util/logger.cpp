#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace sandpool::util {

void init_logger(const std::string& name) {
    auto console = spdlog::get(name);
    if (!console) {
        console = spdlog::stdout_color_mt(name);
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum log_level_from_string(const std::string& str) {
    if (str == "trace")    return spdlog::level::trace;
    if (str == "debug")    return spdlog::level::debug;
    if (str == "info")     return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error")    return spdlog::level::err;
    if (str == "critical") return spdlog::level::critical;
    if (str == "off")      return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace sandpool::util
