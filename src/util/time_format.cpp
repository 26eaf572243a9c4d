#include "util/time_format.hpp"
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace sandpool::util {

std::string format_iso8601(Timestamp tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    if (ms.count() < 0) {
        ms += std::chrono::milliseconds(1000);
        time_t -= 1;
    }

    std::tm tm = {};
    gmtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

std::optional<Timestamp> parse_iso8601(const std::string& text) {
    std::tm tm = {};
    int ms = 0;
    int fields = std::sscanf(text.c_str(), "%d-%d-%dT%d:%d:%d.%dZ",
                             &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                             &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms);
    if (fields < 6) {
        return std::nullopt;
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    tp += std::chrono::milliseconds(fields == 7 ? ms : 0);
    return tp;
}

} // namespace sandpool::util
