#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ts::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> treesync() { return get("treesync"); }
    static std::shared_ptr<spdlog::logger> sync()     { return get("sync"); }
    static std::shared_ptr<spdlog::logger> index()    { return get("index"); }
    static std::shared_ptr<spdlog::logger> local()    { return get("local"); }
    static std::shared_ptr<spdlog::logger> remote()   { return get("remote"); }
    static std::shared_ptr<spdlog::logger> config()   { return get("config"); }
    static std::shared_ptr<spdlog::logger> state()    { return get("state"); }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
