#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <filesystem>

namespace ts::storage {

inline util::Timestamp fileTimeToMillis(const std::filesystem::file_time_type ftime) {
    return util::toMillis(std::chrono::file_clock::to_sys(ftime));
}

inline std::filesystem::file_time_type millisToFileTime(const util::Timestamp ms) {
    return std::chrono::file_clock::from_sys(util::fromMillis(ms));
}

}
