#pragma once

#include <stdexcept>
#include <string>

namespace ts::sync::model {

struct SyncError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// No valid credential. Aborts the run before indexing.
struct AuthFailure final : SyncError {
    using SyncError::SyncError;
};

// One item's network or disk operation failed. Isolated to that item.
struct TransientIOFailure final : SyncError {
    using SyncError::SyncError;
};

// An index could not be built. Aborts the run.
struct StructuralFailure final : SyncError {
    using SyncError::SyncError;
};

// Raised when a cancellation request is observed between units of work.
struct Cancelled final : SyncError {
    using SyncError::SyncError;
};

// Unreachable unless a policy value escapes the enum.
struct ConflictPolicyExhausted final : std::logic_error {
    using std::logic_error::logic_error;
};

}
