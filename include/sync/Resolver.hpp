#pragma once

#include "sync/model/Action.hpp"
#include "sync/model/ConflictPolicy.hpp"
#include "sync/model/Plan.hpp"

#include <functional>
#include <string>
#include <vector>

namespace ts::sync {

// Turns each detected conflict into one concrete action under a single policy.
// Never reads store state.
class Resolver {
public:
    using Clock = std::function<util::Timestamp()>;

    explicit Resolver(model::ConflictPolicy policy, Clock clock = util::nowMillis);

    [[nodiscard]] model::Action resolve(const model::ConflictCase& conflict) const;

    // Reads the clock once so every keep-both copy in a run shares one stamp.
    [[nodiscard]] std::vector<model::Action> resolveAll(const std::vector<model::ConflictCase>& conflicts) const;

    // "notes/a.md" + 1700000000000 -> "notes/a_conflict_1700000000000.md"
    static std::string conflictCopyPath(const std::string& path, util::Timestamp stamp);

    [[nodiscard]] model::ConflictPolicy policy() const { return policy_; }

private:
    model::ConflictPolicy policy_;
    Clock clock_;

    [[nodiscard]] model::Action resolveAt(const model::ConflictCase& conflict, util::Timestamp stamp) const;
};

}
