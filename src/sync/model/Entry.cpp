#include "sync/model/Entry.hpp"

#include <nlohmann/json.hpp>

using namespace ts::sync::model;

void ts::sync::model::to_json(nlohmann::json& j, const PathEntry& e) {
    j = {
        {"path", e.path},
        {"name", e.name},
        {"is_container", e.isContainer},
        {"size", e.size}
    };

    if (e.localModifiedAt) j["local_modified_at"] = *e.localModifiedAt;
    if (e.remoteModifiedAt) j["remote_modified_at"] = *e.remoteModifiedAt;
    if (e.remoteId) j["remote_id"] = *e.remoteId;
    if (e.contentHash) j["content_hash"] = *e.contentHash;
}
