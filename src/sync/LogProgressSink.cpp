#include "sync/LogProgressSink.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;

void LogProgressSink::onProgress(const Progress& progress) {
    if (progress.completed && progress.total)
        log::Registry::sync()->info("[{}] ({}/{}) {}", to_string(progress.phase),
                                    *progress.completed, *progress.total, progress.message);
    else
        log::Registry::sync()->info("[{}] {}", to_string(progress.phase), progress.message);
}
