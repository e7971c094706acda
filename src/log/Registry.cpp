#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace ts::log {

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            (cnf.log_dir / "treesync.log").string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("treesync", sub_levels.treesync);
    makeLogger("sync",     sub_levels.sync);
    makeLogger("index",    sub_levels.index);
    makeLogger("local",    sub_levels.local);
    makeLogger("remote",   sub_levels.remote);
    makeLogger("config",   sub_levels.config);
    makeLogger("state",    sub_levels.state);

    initialized_ = true;
    treesync()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

}
