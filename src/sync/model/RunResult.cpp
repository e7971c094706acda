#include "sync/model/RunResult.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ts::sync::model;

RunResult RunResult::busy() {
    RunResult r;
    r.status = Status::Busy;
    r.abortReason = "Sync already in progress";
    return r;
}

RunResult RunResult::aborted(const AbortKind kind, std::string reason) {
    RunResult r;
    r.status = Status::Aborted;
    r.abortKind = kind;
    r.abortReason = std::move(reason);
    return r;
}

std::string ts::sync::model::to_string(const RunResult::Status& s) {
    switch (s) {
    case RunResult::Status::Completed: return "completed";
    case RunResult::Status::Aborted: return "aborted";
    case RunResult::Status::Busy: return "busy";
    case RunResult::Status::Cancelled: return "cancelled";
    default: throw std::invalid_argument("Unknown run status");
    }
}

std::string ts::sync::model::to_string(const RunResult::AbortKind& k) {
    switch (k) {
    case RunResult::AbortKind::None: return "none";
    case RunResult::AbortKind::Auth: return "auth";
    case RunResult::AbortKind::Structural: return "structural";
    case RunResult::AbortKind::Internal: return "internal";
    default: throw std::invalid_argument("Unknown abort kind");
    }
}

void ts::sync::model::to_json(nlohmann::json& j, const CategoryCounts& c) {
    j = {
        {"planned", c.planned},
        {"succeeded", c.succeeded},
        {"failed", c.failed},
        {"skipped", c.skipped}
    };
}

void ts::sync::model::to_json(nlohmann::json& j, const ItemFailure& f) {
    j = {
        {"action", to_string(f.action)},
        {"path", f.path},
        {"message", f.message}
    };
}

void ts::sync::model::to_json(nlohmann::json& j, const RunResult& r) {
    j = {
        {"status", to_string(r.status)},
        {"started_at", r.startedAt},
        {"finished_at", r.finishedAt},
        {"watermark_before", r.watermarkBefore},
        {"watermark_after", r.watermarkAfter},
        {"conflicts", r.conflicts},
        {"uploads", r.uploads},
        {"downloads", r.downloads},
        {"delete_local", r.deleteLocal},
        {"delete_remote", r.deleteRemote},
        {"failed", r.failedCount()},
        {"failures", r.failures}
    };

    if (r.status == RunResult::Status::Aborted || r.status == RunResult::Status::Busy) {
        j["abort_kind"] = to_string(r.abortKind);
        j["abort_reason"] = r.abortReason;
    }
}
