#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ts::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["local_root"] = rhs.local_root.string();
        node["remote_root"] = rhs.remote_root.string();
        node["remote_folder_name"] = rhs.remote_folder_name;
        node["conflict_policy"] = ts::sync::model::to_string(rhs.conflict_policy);
        node["excluded_folders"] = rhs.excluded_folders;
        node["excluded_extensions"] = rhs.excluded_extensions;
        node["include_hidden_files"] = rhs.include_hidden_files;
        node["max_concurrency"] = rhs.max_concurrency;
        node["max_pages_per_container"] = rhs.max_pages_per_container;
        node["remote_page_size"] = rhs.remote_page_size;
        node["auto_sync"] = rhs.auto_sync;
        node["interval_minutes"] = rhs.interval.count();
        node["sync_on_startup"] = rhs.sync_on_startup;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        const SyncConfig def;
        rhs.local_root = node["local_root"].as<std::string>("");
        rhs.remote_root = node["remote_root"].as<std::string>("");
        rhs.remote_folder_name = node["remote_folder_name"].as<std::string>(def.remote_folder_name);
        rhs.conflict_policy = ts::sync::model::conflictPolicyFromString(
            node["conflict_policy"].as<std::string>(ts::sync::model::to_string(def.conflict_policy)));
        rhs.excluded_folders = node["excluded_folders"].as<std::vector<std::string>>(def.excluded_folders);
        rhs.excluded_extensions = node["excluded_extensions"].as<std::vector<std::string>>(def.excluded_extensions);
        rhs.include_hidden_files = node["include_hidden_files"].as<bool>(def.include_hidden_files);
        rhs.max_concurrency = node["max_concurrency"].as<unsigned int>(def.max_concurrency);
        rhs.max_pages_per_container = node["max_pages_per_container"].as<unsigned int>(def.max_pages_per_container);
        rhs.remote_page_size = node["remote_page_size"].as<unsigned int>(def.remote_page_size);
        rhs.auto_sync = node["auto_sync"].as<bool>(def.auto_sync);
        rhs.interval = std::chrono::minutes(node["interval_minutes"].as<long>(def.interval.count()));
        rhs.sync_on_startup = node["sync_on_startup"].as<bool>(def.sync_on_startup);
        return true;
    }
};

template<>
struct convert<StateConfig> {
    static Node encode(const StateConfig& rhs) {
        Node node;
        node["path"] = rhs.path.string();
        return node;
    }

    static bool decode(const Node& node, StateConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.path = node["path"].as<std::string>(StateConfig{}.path.string());
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["treesync"] = to_std_string(spdlog::level::to_string_view(rhs.treesync));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["index"]    = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["local"]    = to_std_string(spdlog::level::to_string_view(rhs.local));
        node["remote"]   = to_std_string(spdlog::level::to_string_view(rhs.remote));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["state"]    = to_std_string(spdlog::level::to_string_view(rhs.state));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.treesync = spdlog::level::from_str(node["treesync"].as<std::string>("info"));
        rhs.sync     = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.index    = spdlog::level::from_str(node["index"].as<std::string>("warn"));
        rhs.local    = spdlog::level::from_str(node["local"].as<std::string>("warn"));
        rhs.remote   = spdlog::level::from_str(node["remote"].as<std::string>("warn"));
        rhs.config   = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        rhs.state    = spdlog::level::from_str(node["state"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        node["log_dir"] = rhs.log_dir.string();
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        rhs.log_dir = node["log_dir"].as<std::string>("");
        return true;
    }
};

}
