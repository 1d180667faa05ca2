#pragma once

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ds::util {

// Zero value emitted for timestamps that were never set
inline constexpr auto ZERO_TIMESTAMP = "0001-01-01T00:00:00Z";

// RFC 3339 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.125Z
inline std::string timePointToString(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const auto secs = time_point_cast<seconds>(tp);
    auto millis = duration_cast<milliseconds>(tp - secs).count();
    std::time_t ts = system_clock::to_time_t(secs);
    if (millis < 0) {
        millis += 1000;
        --ts;
    }

    std::tm tm{};
    gmtime_r(&ts, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

inline std::string timePointToString(const std::optional<std::chrono::system_clock::time_point>& tp) {
    if (!tp) return ZERO_TIMESTAMP;
    return timePointToString(*tp);
}

inline std::chrono::system_clock::time_point parseTimePoint(const std::string& iso) {
    if (iso == ZERO_TIMESTAMP) return {};

    std::tm tm = {};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::runtime_error("Failed to parse timestamp: " + iso);

    auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
    if (ss.peek() == '.') {
        ss.get();
        std::string frac;
        while (std::isdigit(ss.peek())) frac += static_cast<char>(ss.get());
        frac = (frac + "000").substr(0, 3);
        tp += std::chrono::milliseconds(std::stoi(frac));
    }
    return tp;
}

} // namespace ds::util
