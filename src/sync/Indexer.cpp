#include "sync/Indexer.hpp"
#include "sync/Filter.hpp"
#include "sync/model/errors.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <deque>
#include <unordered_set>

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::storage;
using namespace ts::util;

namespace {

void throwIfCancelled(const Indexer::CancelCheck& cancelled) {
    if (cancelled && cancelled()) throw Cancelled("Indexing cancelled");
}

}

Index Indexer::buildLocal(LocalStore& store, const Filter& filter, const CancelCheck& cancelled) {
    Index index;

    try {
        for (const auto& listed : store.listAllEntries()) {
            throwIfCancelled(cancelled);

            const auto path = normalizeRelPath(listed.path);
            if (path.empty() || filter.shouldExclude(path)) continue;

            const auto st = store.stat(path);
            if (!st) {
                log::Registry::index()->debug("[Indexer] {} vanished before stat, skipping", path);
                continue;
            }

            PathEntry e;
            e.path = path;
            e.name = lastSegment(path);
            e.isContainer = st->isContainer;
            e.localModifiedAt = st->mtime;
            e.size = st->isContainer ? 0 : st->size;
            index.emplace(path, std::move(e));
        }
    } catch (const Cancelled&) {
        throw;
    } catch (const AuthFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw StructuralFailure(std::string("Local index failed: ") + e.what());
    }

    dropOrphans(index);
    log::Registry::index()->debug("[Indexer] Local index holds {} entries", index.size());
    return index;
}

Index Indexer::buildRemote(RemoteStore& store, const std::string& rootId, const Filter& filter,
                           const unsigned int maxPagesPerContainer, const CancelCheck& cancelled) {
    struct Pending {
        std::string containerId;
        std::string prefix;
    };

    Index index;
    std::deque<Pending> worklist{{rootId, ""}};

    try {
        while (!worklist.empty()) {
            throwIfCancelled(cancelled);

            const auto [containerId, prefix] = std::move(worklist.front());
            worklist.pop_front();

            std::optional<std::string> token;
            std::unordered_set<std::string> seenTokens;
            unsigned int pages = 0;

            do {
                if (++pages > maxPagesPerContainer)
                    throw StructuralFailure("Container '" + (prefix.empty() ? "/" : prefix) +
                                            "' exceeded " + std::to_string(maxPagesPerContainer) + " pages");

                auto page = store.listChildren(containerId, token);

                for (auto& child : page.entries) {
                    const auto path = joinRelPath(prefix, child.name);
                    if (filter.shouldExclude(path)) continue;

                    PathEntry e;
                    e.path = path;
                    e.name = child.name;
                    e.isContainer = child.isContainer;
                    e.remoteModifiedAt = child.modifiedAt;
                    e.size = child.isContainer ? 0 : child.size;
                    e.remoteId = child.id;
                    e.contentHash = child.contentHash;

                    if (!index.emplace(path, std::move(e)).second) {
                        log::Registry::index()->warn("[Indexer] Duplicate remote name '{}', keeping the first", path);
                        continue;
                    }

                    if (child.isContainer) worklist.push_back({child.id, path});
                }

                token = std::move(page.nextPageToken);
                if (token && !seenTokens.insert(*token).second)
                    throw StructuralFailure("Remote store repeated page token '" + *token + "' under '" +
                                            (prefix.empty() ? "/" : prefix) + "'");
            } while (token);
        }
    } catch (const AuthFailure&) {
        throw;
    } catch (const Cancelled&) {
        throw;
    } catch (const StructuralFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw StructuralFailure(std::string("Remote index failed: ") + e.what());
    }

    log::Registry::index()->debug("[Indexer] Remote index holds {} entries", index.size());
    return index;
}

void Indexer::dropOrphans(Index& index) {
    // Parents sort before children, so one forward pass sees removals in order.
    for (auto it = index.begin(); it != index.end();) {
        const auto parent = parentOf(it->first);
        if (!parent.empty() && !index.contains(parent)) {
            log::Registry::index()->debug("[Indexer] Dropping {} beneath an excluded container", it->first);
            it = index.erase(it);
        } else ++it;
    }
}
