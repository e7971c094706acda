#pragma once

#include "sync/model/Action.hpp"
#include "util/timestamp.hpp"

#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

struct ItemFailure {
    ActionType action{ActionType::Upload};
    std::string path;
    std::string message;
};

struct CategoryCounts {
    std::size_t planned{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t skipped{0};  // cancelled before dispatch, or a non-empty container left in place
};

struct RunResult {
    enum class Status { Completed, Aborted, Busy, Cancelled };
    enum class AbortKind { None, Auth, Structural, Internal };

    Status status{Status::Completed};
    AbortKind abortKind{AbortKind::None};
    std::string abortReason;

    util::Timestamp startedAt{0};
    util::Timestamp finishedAt{0};
    util::Timestamp watermarkBefore{0};
    util::Timestamp watermarkAfter{0};

    CategoryCounts conflicts, uploads, downloads, deleteLocal, deleteRemote;
    std::vector<ItemFailure> failures;

    [[nodiscard]] std::size_t failedCount() const { return failures.size(); }

    [[nodiscard]] std::size_t succeededCount() const {
        return conflicts.succeeded + uploads.succeeded + downloads.succeeded +
               deleteLocal.succeeded + deleteRemote.succeeded;
    }

    [[nodiscard]] bool completed() const { return status == Status::Completed; }

    static RunResult busy();
    static RunResult aborted(AbortKind kind, std::string reason);
};

std::string to_string(const RunResult::Status& s);
std::string to_string(const RunResult::AbortKind& k);

void to_json(nlohmann::json& j, const CategoryCounts& c);
void to_json(nlohmann::json& j, const ItemFailure& f);
void to_json(nlohmann::json& j, const RunResult& r);

}
