#pragma once

#include <string>

namespace ts::sync::model {

enum class ConflictPolicy {
    PreferLocal,
    PreferRemote,
    PreferNewer,
    KeepBoth
};

std::string to_string(const ConflictPolicy& cp);

// Accepts "prefer-local", "prefer_local", "local", ... and "ask" as keep-both.
ConflictPolicy conflictPolicyFromString(const std::string& str);

}
