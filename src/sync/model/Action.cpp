#include "sync/model/Action.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace ts::sync::model;

std::string ts::sync::model::to_string(const ActionType& type) {
    switch (type) {
    case ActionType::Upload: return "upload";
    case ActionType::Download: return "download";
    case ActionType::KeepBoth: return "keep-both";
    case ActionType::DeleteLocal: return "delete-local";
    case ActionType::DeleteRemote: return "delete-remote";
    default: throw std::invalid_argument("Unknown action type");
    }
}

void ts::sync::model::to_json(nlohmann::json& j, const Action& a) {
    j = {
        {"type", to_string(a.type)},
        {"path", a.path}
    };

    if (a.local) j["local"] = *a.local;
    if (a.remote) j["remote"] = *a.remote;
    if (a.duplicatePath) j["duplicate_path"] = *a.duplicatePath;
}
