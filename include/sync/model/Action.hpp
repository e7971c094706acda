#pragma once

#include "sync/model/Entry.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

enum class ActionType {
    Upload,
    Download,
    KeepBoth,
    DeleteLocal,
    DeleteRemote,
};

struct Action {
    ActionType type{ActionType::Upload};
    std::string path;
    std::optional<PathEntry> local{};
    std::optional<PathEntry> remote{};
    std::optional<std::string> duplicatePath{}; // KeepBoth only

    [[nodiscard]] bool isContainer() const {
        return (local && local->isContainer) || (remote && remote->isContainer);
    }
};

std::string to_string(const ActionType& type);

void to_json(nlohmann::json& j, const Action& a);

}
