#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace ts::sync::model {

enum class Phase {
    Idle,
    Preparing,
    Indexing,
    Planning,
    Resolving,
    Executing,
};

struct Progress {
    Phase phase{Phase::Idle};
    std::string message;
    std::optional<std::size_t> completed{};
    std::optional<std::size_t> total{};
    std::string currentPath{};
};

// Fire-and-forget observer. Implementations must not block.
struct ProgressSink {
    virtual ~ProgressSink() = default;
    virtual void onProgress(const Progress& progress) = 0;
};

std::string to_string(const Phase& phase);

}
