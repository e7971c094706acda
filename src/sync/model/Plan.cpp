#include "sync/model/Plan.hpp"

#include <nlohmann/json.hpp>

using namespace ts::sync::model;

void ts::sync::model::to_json(nlohmann::json& j, const ConflictCase& c) {
    j = {
        {"path", c.path},
        {"local", c.local},
        {"remote", c.remote}
    };
}

void ts::sync::model::to_json(nlohmann::json& j, const SyncPlan& p) {
    j = {
        {"conflicts", p.conflicts},
        {"uploads", p.uploads},
        {"downloads", p.downloads},
        {"delete_local", p.deleteLocal},
        {"delete_remote", p.deleteRemote}
    };
}
