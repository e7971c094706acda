#pragma once

#include "auth/CredentialProvider.hpp"
#include "state/StateStore.hpp"
#include "storage/LocalStore.hpp"
#include "storage/RemoteStore.hpp"
#include "sync/model/errors.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <cstdio>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace ts::test {

inline std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }
inline std::string text(const std::vector<uint8_t>& b) { return {b.begin(), b.end()}; }

class MemoryLocalStore final : public storage::LocalStore {
public:
    struct Node {
        bool isContainer{false};
        std::vector<uint8_t> content;
        util::Timestamp mtime{0};
    };

    // mtime stamped on writes that do not carry one
    util::Timestamp clock{5'000'000};

    std::set<std::string> failReads, failWrites;
    std::function<void(const std::string&)> onWrite;

    void putFile(const std::string& path, const std::string& content, const util::Timestamp mtime) {
        std::scoped_lock lock(mutex_);
        makeParents(path, mtime);
        nodes_[path] = {false, bytes(content), mtime};
    }

    void putDir(const std::string& path, const util::Timestamp mtime) {
        std::scoped_lock lock(mutex_);
        makeParents(path, mtime);
        nodes_[path] = {true, {}, mtime};
    }

    // Removes a subtree behind the sync's back, as a user would.
    void erase(const std::string& path) {
        std::scoped_lock lock(mutex_);
        std::erase_if(nodes_, [&](const auto& kv) { return util::isSameOrDescendant(kv.first, path); });
    }

    std::optional<Node> node(const std::string& path) const {
        std::scoped_lock lock(mutex_);
        const auto it = nodes_.find(path);
        if (it == nodes_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> trashed() const {
        std::scoped_lock lock(mutex_);
        return trashed_;
    }

    std::vector<std::string> ops() const {
        std::scoped_lock lock(mutex_);
        return ops_;
    }

    std::vector<storage::LocalEntry> listAllEntries() override {
        std::scoped_lock lock(mutex_);
        std::vector<storage::LocalEntry> out;
        for (const auto& [p, n] : nodes_) out.push_back({p, n.isContainer});
        return out;
    }

    std::optional<storage::LocalStat> stat(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        const auto it = nodes_.find(path);
        if (it == nodes_.end()) return std::nullopt;
        return storage::LocalStat{it->second.mtime, it->second.content.size(), it->second.isContainer};
    }

    std::vector<uint8_t> readBytes(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        if (failReads.contains(path)) throw sync::model::TransientIOFailure("read failed: " + path);
        const auto it = nodes_.find(path);
        if (it == nodes_.end() || it->second.isContainer) throw sync::model::TransientIOFailure("no file: " + path);
        return it->second.content;
    }

    void writeBytes(const std::string& path, const std::vector<uint8_t>& content,
                    const std::optional<util::Timestamp>& mtime) override {
        {
            std::scoped_lock lock(mutex_);
            if (failWrites.contains(path)) throw sync::model::TransientIOFailure("write failed: " + path);
            makeParents(path, clock);
            nodes_[path] = {false, content, mtime.value_or(clock)};
            ops_.push_back("write " + path);
        }
        if (onWrite) onWrite(path);
    }

    void ensureContainer(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        if (path.empty()) return;
        makeParents(path, clock);
        if (!nodes_.contains(path)) {
            nodes_[path] = {true, {}, clock};
            ops_.push_back("mkdir " + path);
        }
    }

    bool exists(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        return nodes_.contains(path);
    }

    storage::ContainerListing listContainer(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        storage::ContainerListing listing;
        for (const auto& [p, n] : nodes_) {
            if (util::parentOf(p) != path) continue;
            (n.isContainer ? listing.containers : listing.files).push_back(p);
        }
        return listing;
    }

    void removeEmptyContainer(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        nodes_.erase(path);
        ops_.push_back("rmdir " + path);
    }

    void moveToTrash(const std::string& path) override {
        std::scoped_lock lock(mutex_);
        for (auto it = nodes_.begin(); it != nodes_.end();) {
            if (util::isSameOrDescendant(it->first, path)) it = nodes_.erase(it);
            else ++it;
        }
        trashed_.push_back(path);
        ops_.push_back("trash " + path);
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_;
    std::vector<std::string> trashed_;
    std::vector<std::string> ops_;

    void makeParents(const std::string& path, const util::Timestamp mtime) {
        for (auto p = util::parentOf(path); !p.empty(); p = util::parentOf(p))
            if (!nodes_.contains(p)) nodes_[p] = {true, {}, mtime};
    }
};

class MemoryRemoteStore final : public storage::RemoteStore {
public:
    struct Node {
        std::string id;
        std::string name;
        std::string parentId;
        bool isContainer{false};
        std::vector<uint8_t> content;
        util::Timestamp mtime{0};
        std::string mimeType;
    };

    explicit MemoryRemoteStore(std::string rootName = "TreeSync", const std::size_t pageSize = 100)
        : rootName_(std::move(rootName)), pageSize_(pageSize) {}

    util::Timestamp clock{6'000'000};

    bool repeatPageToken{false};
    bool failListing{false};
    bool authBroken{false};
    std::set<std::string> failUploads, failDownloads, failTrash;   // by name

    std::string rootId() {
        std::scoped_lock lock(mutex_);
        return ensureRoot();
    }

    std::string putFile(const std::string& path, const std::string& content, const util::Timestamp mtime) {
        std::scoped_lock lock(mutex_);
        const auto parent = makeDirs(util::parentOf(path), mtime);
        auto id = newId();
        nodes_[id] = {id, util::lastSegment(path), parent, false, bytes(content), mtime, {}};
        return id;
    }

    std::string putDir(const std::string& path, const util::Timestamp mtime) {
        std::scoped_lock lock(mutex_);
        return makeDirs(path, mtime);
    }

    // Adds a second child with an existing name, as some stores allow.
    std::string putDuplicate(const std::string& path, const std::string& content, const util::Timestamp mtime) {
        std::scoped_lock lock(mutex_);
        const auto parent = makeDirs(util::parentOf(path), mtime);
        auto id = newId();
        nodes_[id] = {id, util::lastSegment(path), parent, false, bytes(content), mtime, {}};
        return id;
    }

    // Removes a subtree behind the sync's back, as another client would.
    void erase(const std::string& path) {
        std::scoped_lock lock(mutex_);
        auto id = ensureRoot();
        for (const auto& seg : util::splitSegments(path)) {
            const auto child = childNamed(id, seg);
            if (!child) return;
            id = *child;
        }
        eraseSubtree(id);
    }

    std::optional<Node> nodeAt(const std::string& path) {
        std::scoped_lock lock(mutex_);
        auto id = ensureRoot();
        for (const auto& seg : util::splitSegments(path)) {
            const auto child = childNamed(id, seg);
            if (!child) return std::nullopt;
            id = *child;
        }
        return nodes_.at(id);
    }

    std::vector<std::string> trashedIds() const {
        std::scoped_lock lock(mutex_);
        return trashed_;
    }

    std::vector<std::string> ops() const {
        std::scoped_lock lock(mutex_);
        return ops_;
    }

    std::size_t listCalls() const {
        std::scoped_lock lock(mutex_);
        return listCalls_;
    }

    std::string findOrCreateContainer(const std::string& name, const std::optional<std::string>& parentId) override {
        std::scoped_lock lock(mutex_);
        if (authBroken) throw sync::model::AuthFailure("token revoked");
        if (!parentId && name == rootName_) return ensureRoot();

        const auto parent = parentId.value_or("");
        if (const auto existing = childNamed(parent, name)) return *existing;

        auto id = newId();
        nodes_[id] = {id, name, parent, true, {}, clock, {}};
        ops_.push_back("mkdir " + name);
        return id;
    }

    storage::RemotePage listChildren(const std::string& containerId, const std::optional<std::string>& pageToken) override {
        std::scoped_lock lock(mutex_);
        ++listCalls_;
        if (authBroken) throw sync::model::AuthFailure("token revoked");
        if (failListing) throw sync::model::TransientIOFailure("listing unavailable");

        std::vector<const Node*> children;
        for (const auto& [id, n] : nodes_)
            if (n.parentId == containerId && !isTrashed(id)) children.push_back(&n);
        std::ranges::sort(children, [](const Node* a, const Node* b) { return a->id < b->id; });

        const std::size_t offset = pageToken ? std::stoul(pageToken->substr(1)) : 0;
        storage::RemotePage page;
        const auto end = std::min(children.size(), offset + pageSize_);
        for (auto i = offset; i < end; ++i) page.entries.push_back(toEntry(*children[i]));
        if (end < children.size()) page.nextPageToken = "p" + std::to_string(repeatPageToken ? pageSize_ : end);
        return page;
    }

    storage::RemoteEntry getMetadata(const std::string& id) override {
        std::scoped_lock lock(mutex_);
        return toEntry(nodes_.at(id));
    }

    std::vector<uint8_t> download(const std::string& id) override {
        std::scoped_lock lock(mutex_);
        const auto& n = nodes_.at(id);
        if (failDownloads.contains(n.name)) throw sync::model::TransientIOFailure("download failed: " + n.name);
        ops_.push_back("download " + n.name);
        return n.content;
    }

    storage::RemoteEntry upload(const storage::UploadRequest& req) override {
        std::scoped_lock lock(mutex_);
        if (failUploads.contains(req.name)) throw sync::model::TransientIOFailure("upload failed: " + req.name);

        const auto id = req.existingId ? *req.existingId : newId();
        auto& n = nodes_[id];
        n.id = id;
        n.name = req.name;
        if (!req.existingId) n.parentId = req.parentId;
        n.content = req.content;
        n.mtime = req.modifiedAt.value_or(clock);
        n.mimeType = req.mimeType;
        ops_.push_back(std::string(req.existingId ? "update " : "create ") + req.name);
        return toEntry(n);
    }

    void trash(const std::string& id) override {
        std::scoped_lock lock(mutex_);
        const auto& n = nodes_.at(id);
        if (failTrash.contains(n.name)) throw sync::model::TransientIOFailure("trash failed: " + n.name);
        trashed_.push_back(id);
        ops_.push_back("trash " + n.name);
    }

private:
    mutable std::mutex mutex_;
    std::string rootName_;
    std::size_t pageSize_;
    std::map<std::string, Node> nodes_;
    std::vector<std::string> trashed_;
    std::vector<std::string> ops_;
    std::size_t listCalls_{0};
    std::size_t nextId_{1};

    std::string newId() {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "r%06zu", nextId_++);
        return buf;
    }

    bool isTrashed(const std::string& id) const {
        return std::ranges::find(trashed_, id) != trashed_.end();
    }

    std::optional<std::string> childNamed(const std::string& parent, const std::string& name) const {
        for (const auto& [id, n] : nodes_)
            if (n.parentId == parent && n.name == name && !isTrashed(id)) return id;
        return std::nullopt;
    }

    void eraseSubtree(const std::string& id) {
        std::vector<std::string> children;
        for (const auto& [cid, n] : nodes_)
            if (n.parentId == id) children.push_back(cid);
        for (const auto& c : children) eraseSubtree(c);
        nodes_.erase(id);
    }

    std::string ensureRoot() {
        if (const auto existing = childNamed("", rootName_)) return *existing;
        auto id = newId();
        nodes_[id] = {id, rootName_, "", true, {}, 1, {}};
        return id;
    }

    std::string makeDirs(const std::string& path, const util::Timestamp mtime) {
        auto id = ensureRoot();
        for (const auto& seg : util::splitSegments(path)) {
            if (const auto child = childNamed(id, seg)) {
                id = *child;
                continue;
            }
            auto created = newId();
            nodes_[created] = {created, seg, id, true, {}, mtime, {}};
            id = created;
        }
        return id;
    }

    static storage::RemoteEntry toEntry(const Node& n) {
        return {n.id, n.name, n.isContainer, n.mtime, n.content.size(), std::nullopt, n.parentId};
    }
};

class MemoryStateStore final : public state::StateStore {
public:
    state::SyncState state;
    std::size_t saves{0};

    state::SyncState load() override {
        std::scoped_lock lock(mutex_);
        return state;
    }

    void save(const state::SyncState& s) override {
        std::scoped_lock lock(mutex_);
        state = s;
        ++saves;
    }

private:
    std::mutex mutex_;
};

class FixedCredentials final : public auth::CredentialProvider {
public:
    std::optional<std::string> token;

    explicit FixedCredentials(std::optional<std::string> t) : token(std::move(t)) {}

    std::optional<std::string> validAccessToken() override { return token; }
};

}
