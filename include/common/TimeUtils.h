#pragma once

#include "common/Types.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace rebalsim {
namespace utils {

constexpr long long kMillisPerMinute = 60LL * 1000LL;
constexpr long long kMillisPerDay = 24LL * 60LL * kMillisPerMinute;

inline long long toEpochMs(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline Timestamp fromEpochMs(long long ms) {
    return Timestamp(std::chrono::milliseconds(ms));
}

// "YYYY-MM-DD" (UTC midnight)
inline std::optional<Timestamp> parseDate(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%d");
    if (iss.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = 0;
    const std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(t);
}

inline std::string formatIsoDate(Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

inline std::string formatDay(Timestamp ts) {
    const std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

} // namespace utils
} // namespace rebalsim
