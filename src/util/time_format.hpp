#pragma once
#include <chrono>
#include <optional>
#include <string>

namespace sandpool::util {

using Timestamp = std::chrono::system_clock::time_point;

// ISO 8601 UTC with millisecond precision, e.g. 2026-01-31T12:00:00.250Z
std::string format_iso8601(Timestamp tp);

std::optional<Timestamp> parse_iso8601(const std::string& text);

} // namespace sandpool::util
