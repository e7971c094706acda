#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "TempDir.hpp"

#include <fstream>
#include <spdlog/sinks/ringbuffer_sink.h>

using namespace ts::config;
using namespace ts::test;

namespace {

std::filesystem::path writeConfig(const TempDir& dir, const std::string& yaml) {
    const auto p = dir.path() / "treesync.yaml";
    std::ofstream(p) << yaml;
    return p;
}

}

TEST(ConfigTest, LoadsSyncStateAndLogging) {
    TempDir dir;
    const auto cfg = loadConfig(writeConfig(dir, R"(
sync:
  local_root: /tmp/vault
  remote_root: /tmp/share
  remote_folder_name: Notes
  conflict_policy: ask
  excluded_folders: [drafts]
  excluded_extensions: [tmp, .log]
  include_hidden_files: true
  max_concurrency: 8
  auto_sync: true
  interval_minutes: 5
state:
  path: /tmp/state.json
logging:
  log_dir: /tmp/logs
  levels:
    console_log_level: debug
    subsystem_levels:
      sync: trace
)"));

    EXPECT_EQ(cfg.sync.local_root.string(), "/tmp/vault");
    EXPECT_EQ(cfg.sync.remote_folder_name, "Notes");
    EXPECT_EQ(cfg.sync.conflict_policy, ts::sync::model::ConflictPolicy::KeepBoth);
    EXPECT_EQ(cfg.sync.excluded_folders, std::vector<std::string>{"drafts"});
    EXPECT_EQ(cfg.sync.excluded_extensions, (std::vector<std::string>{"tmp", ".log"}));
    EXPECT_TRUE(cfg.sync.include_hidden_files);
    EXPECT_EQ(cfg.sync.max_concurrency, 8u);
    EXPECT_TRUE(cfg.sync.auto_sync);
    EXPECT_EQ(cfg.sync.interval.count(), 5);
    EXPECT_EQ(cfg.state.path.string(), "/tmp/state.json");
    EXPECT_EQ(cfg.logging.log_dir.string(), "/tmp/logs");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.index, spdlog::level::warn);
}

TEST(ConfigTest, DefaultsApplyForOmittedKeys) {
    TempDir dir;
    const auto cfg = loadConfig(writeConfig(dir, "sync:\n  local_root: /a\n  remote_root: /b\n"));

    EXPECT_EQ(cfg.sync.remote_folder_name, "TreeSync");
    EXPECT_EQ(cfg.sync.conflict_policy, ts::sync::model::ConflictPolicy::PreferNewer);
    EXPECT_EQ(cfg.sync.excluded_folders, (std::vector<std::string>{".obsidian", ".git", ".trash"}));
    EXPECT_FALSE(cfg.sync.include_hidden_files);
    EXPECT_EQ(cfg.sync.max_concurrency, 4u);
    EXPECT_FALSE(cfg.sync.auto_sync);
}

TEST(ConfigTest, ZeroConcurrencyIsClamped) {
    TempDir dir;
    const auto cfg = loadConfig(writeConfig(dir, "sync:\n  local_root: /a\n  remote_root: /b\n  max_concurrency: 0\n"));
    EXPECT_EQ(cfg.sync.max_concurrency, 1u);
}

TEST(ConfigTest, RejectsBadInput) {
    TempDir dir;
    EXPECT_THROW(loadConfig(dir.path() / "missing.yaml"), std::runtime_error);
    EXPECT_THROW(loadConfig(writeConfig(dir, "sync:\n  remote_root: /b\n")), std::runtime_error);
    EXPECT_THROW(loadConfig(writeConfig(dir, "sync:\n  local_root: /a\n  remote_root: /b\n  conflict_policy: dice\n")),
                 std::invalid_argument);
}

TEST(ConfigTest, SummaryIsLoggedThroughConfigLogger) {
    const auto logger = ts::log::Registry::config();
    const auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
    ring->set_pattern("%n %v");
    const auto previous = logger->level();
    logger->sinks().push_back(ring);
    logger->set_level(spdlog::level::info);

    Config cfg;
    cfg.sync.local_root = "/tmp/vault";
    cfg.sync.remote_root = "/tmp/share";
    cfg.sync.excluded_folders = {"drafts"};
    logSummary(cfg);

    logger->sinks().pop_back();
    logger->set_level(previous);

    const auto lines = ring->last_formatted();
    ASSERT_GE(lines.size(), 3u);
    for (const auto& line : lines) EXPECT_EQ(line.rfind("config ", 0), 0u) << line;
    EXPECT_NE(lines[0].find("/tmp/vault"), std::string::npos);
    EXPECT_NE(lines[0].find("prefer-newer"), std::string::npos);
    EXPECT_NE(lines[1].find("drafts"), std::string::npos);
}
