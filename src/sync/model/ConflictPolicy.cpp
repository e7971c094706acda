#include "sync/model/ConflictPolicy.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ts::sync::model;

std::string ts::sync::model::to_string(const ConflictPolicy& cp) {
    switch (cp) {
    case ConflictPolicy::PreferLocal: return "prefer-local";
    case ConflictPolicy::PreferRemote: return "prefer-remote";
    case ConflictPolicy::PreferNewer: return "prefer-newer";
    case ConflictPolicy::KeepBoth: return "keep-both";
    default: throw std::invalid_argument("Unknown conflict policy");
    }
}

ConflictPolicy ts::sync::model::conflictPolicyFromString(const std::string& str) {
    std::string s = str;
    std::ranges::replace(s, '_', '-');

    if (s == "prefer-local" || s == "local" || s == "keep-local") return ConflictPolicy::PreferLocal;
    if (s == "prefer-remote" || s == "remote" || s == "keep-remote") return ConflictPolicy::PreferRemote;
    if (s == "prefer-newer" || s == "newer" || s == "keep-newest") return ConflictPolicy::PreferNewer;
    if (s == "keep-both" || s == "ask") return ConflictPolicy::KeepBoth;
    throw std::invalid_argument("Unknown conflict policy: " + str);
}
