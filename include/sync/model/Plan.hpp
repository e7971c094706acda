#pragma once

#include "sync/model/Entry.hpp"

#include <cstddef>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ts::sync::model {

struct ConflictCase {
    std::string path;
    PathEntry local;
    PathEntry remote;
};

struct SyncPlan {
    std::vector<PathEntry> uploads;
    std::vector<PathEntry> downloads;
    std::vector<PathEntry> deleteLocal;
    std::vector<PathEntry> deleteRemote;
    std::vector<ConflictCase> conflicts;

    [[nodiscard]] std::size_t size() const {
        return uploads.size() + downloads.size() + deleteLocal.size() + deleteRemote.size() + conflicts.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }
};

void to_json(nlohmann::json& j, const ConflictCase& c);
void to_json(nlohmann::json& j, const SyncPlan& p);

}
