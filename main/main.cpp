#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "state/StateStore.hpp"
#include "storage/DirectoryRemoteStore.hpp"
#include "storage/LocalDiskStore.hpp"
#include "sync/Controller.hpp"
#include "sync/LogProgressSink.hpp"
#include "sync/Session.hpp"
#include "util/timestamp.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <thread>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace ts;
using namespace ts::sync;
using namespace ts::sync::model;

namespace {

std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

struct Args {
    std::string configPath = "treesync.yaml";
    bool json = false;
    std::string command;
};

void printUsage() {
    fmt::print(stderr,
               "usage: treesync [-c config.yaml] [--json] <command>\n\n"
               "commands:\n"
               "  run      reconcile the local and remote trees once\n"
               "  plan     show what a run would do without doing it\n"
               "  status   show the stored watermark and remote folder id\n"
               "  daemon   sync on the configured schedule until interrupted\n");
}

bool parseArgs(const int argc, char** argv, Args& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i + 1 < argc) args.configPath = argv[++i];
        else if (a == "--json") args.json = true;
        else if (a == "-h" || a == "--help") return false;
        else if (args.command.empty()) args.command = a;
        else return false;
    }
    return !args.command.empty();
}

std::shared_ptr<Session> makeSession(const config::Config& cfg, ProgressSink* sink) {
    Session::Deps deps;
    deps.local = std::make_shared<storage::LocalDiskStore>(cfg.sync.local_root);
    deps.remote = std::make_shared<storage::DirectoryRemoteStore>(cfg.sync.remote_root, cfg.sync.remote_page_size);
    deps.state = std::make_shared<state::JsonStateStore>(cfg.state.path);
    deps.progress = sink;
    return std::make_shared<Session>(cfg.sync, std::move(deps));
}

void printResult(const RunResult& r, const bool json) {
    if (json) {
        fmt::print("{}\n", nlohmann::json(r).dump(2));
        return;
    }

    fmt::print("status:    {}\n", to_string(r.status));
    if (!r.abortReason.empty()) fmt::print("reason:    {}\n", r.abortReason);
    fmt::print("conflicts: {} ok, {} failed\n", r.conflicts.succeeded, r.conflicts.failed);
    fmt::print("uploads:   {} ok, {} failed\n", r.uploads.succeeded, r.uploads.failed);
    fmt::print("downloads: {} ok, {} failed\n", r.downloads.succeeded, r.downloads.failed);
    fmt::print("deleted:   {} local, {} remote\n", r.deleteLocal.succeeded, r.deleteRemote.succeeded);
    for (const auto& f : r.failures)
        fmt::print("  failed {} {}: {}\n", to_string(f.action), f.path, f.message);
    fmt::print("watermark: {}\n", util::timestampToString(r.watermarkAfter));
}

int exitCode(const RunResult& r) {
    switch (r.status) {
    case RunResult::Status::Completed: return 0;
    case RunResult::Status::Busy: return 2;
    default: return 1;
    }
}

int cmdRun(const config::Config& cfg, const bool json) {
    LogProgressSink sink;
    const auto session = makeSession(cfg, json ? nullptr : &sink);
    const auto result = session->run();
    printResult(result, json);
    return exitCode(result);
}

int cmdPlan(const config::Config& cfg, const bool json) {
    const auto session = makeSession(cfg, nullptr);
    const auto preview = session->dryRun();

    if (!preview.result.completed()) {
        printResult(preview.result, json);
        return exitCode(preview.result);
    }

    if (json) {
        fmt::print("{}\n", nlohmann::json{{"plan", preview.plan}, {"conflicts", preview.resolved}}.dump(2));
        return 0;
    }

    const auto list = [](const char* label, const std::vector<PathEntry>& entries) {
        for (const auto& e : entries) fmt::print("{:<14} {}{}\n", label, e.path, e.isContainer ? "/" : "");
    };

    list("upload", preview.plan.uploads);
    list("download", preview.plan.downloads);
    list("delete-local", preview.plan.deleteLocal);
    list("delete-remote", preview.plan.deleteRemote);
    for (const auto& a : preview.resolved)
        fmt::print("{:<14} {} -> {}{}\n", "conflict", a.path, to_string(a.type),
                   a.duplicatePath ? " (copy: " + *a.duplicatePath + ")" : "");

    if (preview.plan.empty()) fmt::print("Nothing to do.\n");
    return 0;
}

int cmdStatus(const config::Config& cfg, const bool json) {
    state::JsonStateStore store(cfg.state.path);
    const auto s = store.load();

    if (json) {
        fmt::print("{}\n", nlohmann::json(s).dump(2));
        return 0;
    }

    fmt::print("local:       {}\n", cfg.sync.local_root.string());
    fmt::print("remote:      {} / {}\n", cfg.sync.remote_root.string(), cfg.sync.remote_folder_name);
    fmt::print("last sync:   {}\n", util::timestampToString(s.watermark));
    fmt::print("remote root: {}\n", s.remoteRootId.value_or("(not created)"));
    return 0;
}

int cmdDaemon(const config::Config& cfg) {
    LogProgressSink sink;
    const auto session = makeSession(cfg, &sink);

    Controller controller(session, {
        .autoSync = cfg.sync.auto_sync,
        .interval = cfg.sync.interval,
        .runOnStartup = cfg.sync.sync_on_startup,
    });

    if (!cfg.sync.auto_sync && !cfg.sync.sync_on_startup)
        log::Registry::treesync()->warn("[*] auto_sync and sync_on_startup are both off; daemon will idle");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    controller.start();
    while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    log::Registry::treesync()->info("[*] Shutting down...");
    controller.stop();
    return 0;
}

}

int main(const int argc, char** argv) {
    Args args;
    if (!parseArgs(argc, argv, args)) {
        printUsage();
        return 64;
    }

    try {
        config::ConfigRegistry::init(args.configPath);
        log::Registry::init();
        if (args.json) spdlog::set_level(spdlog::level::warn);

        const auto& cfg = config::ConfigRegistry::get();
        config::logSummary(cfg);

        if (args.command == "run") return cmdRun(cfg, args.json);
        if (args.command == "plan") return cmdPlan(cfg, args.json);
        if (args.command == "status") return cmdStatus(cfg, args.json);
        if (args.command == "daemon") return cmdDaemon(cfg);

        printUsage();
        return 64;
    } catch (const std::exception& e) {
        fmt::print(stderr, "treesync: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
