#pragma once

#include "sync/model/Entry.hpp"

#include <functional>
#include <string>

namespace ts::storage {
class LocalStore;
class RemoteStore;
}

namespace ts::sync {

class Filter;

// Builds path-keyed snapshots of both trees. Any failure other than
// AuthFailure or Cancelled surfaces as StructuralFailure.
struct Indexer {
    using CancelCheck = std::function<bool()>;

    static model::Index buildLocal(storage::LocalStore& store, const Filter& filter,
                                   const CancelCheck& cancelled = {});

    static model::Index buildRemote(storage::RemoteStore& store, const std::string& rootId,
                                    const Filter& filter, unsigned int maxPagesPerContainer,
                                    const CancelCheck& cancelled = {});

private:
    static void dropOrphans(model::Index& index);
};

}
