#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace sandpool::util {

// Install a colored stdout logger as the spdlog default
void init_logger(const std::string& name = "sandpool");

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn", "error", "critical", "off".
// Anything else maps to info.
spdlog::level::level_enum log_level_from_string(const std::string& str);

} // namespace sandpool::util
