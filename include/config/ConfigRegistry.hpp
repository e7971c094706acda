#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace ts::config {

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path);
    static void init(Config config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace ts::config
