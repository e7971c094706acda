#include "sync/Resolver.hpp"
#include "sync/model/errors.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::util;

Resolver::Resolver(const ConflictPolicy policy, Clock clock)
    : policy_(policy), clock_(clock ? std::move(clock) : Clock(nowMillis)) {}

Action Resolver::resolve(const ConflictCase& conflict) const {
    return resolveAt(conflict, policy_ == ConflictPolicy::KeepBoth ? clock_() : 0);
}

std::vector<Action> Resolver::resolveAll(const std::vector<ConflictCase>& conflicts) const {
    std::vector<Action> actions;
    actions.reserve(conflicts.size());
    if (conflicts.empty()) return actions;

    const auto stamp = policy_ == ConflictPolicy::KeepBoth ? clock_() : 0;
    for (const auto& c : conflicts) actions.push_back(resolveAt(c, stamp));
    return actions;
}

Action Resolver::resolveAt(const ConflictCase& conflict, const Timestamp stamp) const {
    Action a{.path = conflict.path, .local = conflict.local, .remote = conflict.remote};

    switch (policy_) {
    case ConflictPolicy::PreferLocal:
        a.type = ActionType::Upload;
        break;
    case ConflictPolicy::PreferRemote:
        a.type = ActionType::Download;
        break;
    case ConflictPolicy::PreferNewer:
        a.type = conflict.local.localStamp() > conflict.remote.remoteStamp() ? ActionType::Upload
                                                                              : ActionType::Download;
        break;
    case ConflictPolicy::KeepBoth:
        a.type = ActionType::KeepBoth;
        a.duplicatePath = conflictCopyPath(conflict.path, stamp);
        break;
    default:
        throw ConflictPolicyExhausted("No resolution for conflict policy value " +
                                      std::to_string(static_cast<int>(policy_)));
    }

    log::Registry::sync()->debug("[Resolver] {} -> {} ({})", conflict.path, to_string(a.type), to_string(policy_));
    return a;
}

std::string Resolver::conflictCopyPath(const std::string& path, const Timestamp stamp) {
    const auto norm = normalizeRelPath(path);
    const auto name = lastSegment(norm);
    const auto marker = "_conflict_" + std::to_string(stamp);

    // A leading dot is part of the name, not an extension separator.
    const auto dot = name.rfind('.');
    const auto renamed = (dot == std::string::npos || dot == 0)
        ? name + marker
        : name.substr(0, dot) + marker + name.substr(dot);

    return joinRelPath(parentOf(norm), renamed);
}
