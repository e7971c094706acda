#include "sync/model/Progress.hpp"

#include <stdexcept>

using namespace ts::sync::model;

std::string ts::sync::model::to_string(const Phase& phase) {
    switch (phase) {
    case Phase::Idle: return "idle";
    case Phase::Preparing: return "preparing";
    case Phase::Indexing: return "indexing";
    case Phase::Planning: return "planning";
    case Phase::Resolving: return "resolving";
    case Phase::Executing: return "executing";
    default: throw std::invalid_argument("Unknown phase");
    }
}
