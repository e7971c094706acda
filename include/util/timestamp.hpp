#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace ts::util {

// Milliseconds since the Unix epoch. Zero means "unset".
using Timestamp = std::int64_t;

inline Timestamp nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

inline Timestamp toMillis(const std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromMillis(const Timestamp ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

inline std::string timestampToString(const Timestamp ms) {
    if (ms == 0) return "never";
    const std::time_t secs = static_cast<std::time_t>(ms / 1000);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&secs), "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z'; // ISO 8601 UTC
    return oss.str();
}

} // namespace ts::util
