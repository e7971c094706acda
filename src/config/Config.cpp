#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

namespace ts::config {

Config loadConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path))
        throw std::runtime_error("Config file not found: " + path.string());

    Config cfg;
    const YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["state"]) YAML::convert<StateConfig>::decode(node, cfg.state);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    if (cfg.sync.max_concurrency == 0) cfg.sync.max_concurrency = 1;
    if (cfg.sync.local_root.empty()) throw std::runtime_error("sync.local_root is required");
    if (cfg.sync.remote_root.empty()) throw std::runtime_error("sync.remote_root is required");
    if (cfg.sync.remote_folder_name.empty())
        throw std::runtime_error("sync.remote_folder_name must not be empty");

    return cfg;
}

void logSummary(const Config& cfg) {
    const auto logger = log::Registry::config();
    const auto& s = cfg.sync;

    logger->info("[Config] Syncing {} with {}/{} under {}", s.local_root.string(), s.remote_root.string(),
                 s.remote_folder_name, to_string(s.conflict_policy));
    logger->info("[Config] Excluding folders [{}] and extensions [{}]{}", fmt::join(s.excluded_folders, ", "),
                 fmt::join(s.excluded_extensions, ", "), s.include_hidden_files ? "" : ", hidden files skipped");
    logger->info("[Config] State file {}", cfg.state.path.string());

    if (s.auto_sync) logger->info("[Config] Auto sync every {} min", s.interval.count());
    else logger->debug("[Config] Auto sync off");
}

}
