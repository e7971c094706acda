#pragma once

#include "sync/model/ConflictPolicy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace ts::config {

struct SyncConfig {
    std::filesystem::path local_root;
    std::filesystem::path remote_root;     // backing directory of the directory remote store
    std::string remote_folder_name = "TreeSync";
    sync::model::ConflictPolicy conflict_policy = sync::model::ConflictPolicy::PreferNewer;

    std::vector<std::string> excluded_folders = {".obsidian", ".git", ".trash"};
    std::vector<std::string> excluded_extensions;
    bool include_hidden_files = false;

    unsigned int max_concurrency = 4;
    unsigned int max_pages_per_container = 10000;
    unsigned int remote_page_size = 1000;

    bool auto_sync = false;
    std::chrono::minutes interval{30};
    bool sync_on_startup = false;
};

struct StateConfig {
    std::filesystem::path path = "treesync-state.json";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum treesync = spdlog::level::info;   // Startup, shutdown, run summaries
    spdlog::level::level_enum sync     = spdlog::level::info;   // Planning decisions, item failures
    spdlog::level::level_enum index    = spdlog::level::warn;   // Listing anomalies
    spdlog::level::level_enum local    = spdlog::level::warn;   // Disk I/O
    spdlog::level::level_enum remote   = spdlog::level::warn;   // Remote store I/O
    spdlog::level::level_enum config   = spdlog::level::warn;
    spdlog::level::level_enum state    = spdlog::level::warn;   // Watermark persistence
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
    std::filesystem::path log_dir; // empty => console only
};

struct Config {
    SyncConfig sync;
    StateConfig state;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

// Reports the effective settings through the config logger.
void logSummary(const Config& cfg);

}
