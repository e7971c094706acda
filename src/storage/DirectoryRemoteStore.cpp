#include "storage/DirectoryRemoteStore.hpp"
#include "storage/diskTime.hpp"
#include "sync/model/errors.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

using namespace ts::storage;
using namespace ts::sync::model;
using namespace ts::util;
namespace fs = std::filesystem;

DirectoryRemoteStore::DirectoryRemoteStore(fs::path root, const std::size_t pageSize)
    : root_(std::move(root)), pageSize_(pageSize == 0 ? 1 : pageSize) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw TransientIOFailure("Cannot create remote root " + root_.string() + ": " + ec.message());
}

fs::path DirectoryRemoteStore::resolve(const std::string& id) const {
    const auto norm = normalizeRelPath(id);
    for (const auto& seg : splitSegments(norm))
        if (seg == "..") throw std::invalid_argument("Remote id escapes store root: " + id);
    return norm.empty() ? root_ : root_ / fs::path(norm);
}

RemoteEntry DirectoryRemoteStore::describe(const std::string& id) const {
    const auto p = resolve(id);
    std::error_code ec;

    const auto status = fs::status(p, ec);
    if (ec || !fs::exists(status)) throw TransientIOFailure("Remote object not found: " + id);

    RemoteEntry e;
    e.id = normalizeRelPath(id);
    e.name = lastSegment(e.id);
    e.isContainer = fs::is_directory(status);
    e.size = e.isContainer ? 0 : fs::file_size(p, ec);
    e.modifiedAt = fileTimeToMillis(fs::last_write_time(p, ec));
    if (ec) throw TransientIOFailure("Cannot stat remote object " + id + ": " + ec.message());

    const auto parent = parentOf(e.id);
    e.parentId = parent;
    return e;
}

std::string DirectoryRemoteStore::findOrCreateContainer(const std::string& name,
                                                        const std::optional<std::string>& parentId) {
    if (name.empty() || name.find('/') != std::string::npos || name == "." || name == "..")
        throw std::invalid_argument("Invalid container name: '" + name + "'");

    std::scoped_lock lock(mutex_);

    const auto id = joinRelPath(parentId.value_or(""), name);
    const auto p = resolve(id);

    std::error_code ec;
    if (fs::exists(p, ec) && !fs::is_directory(p, ec))
        throw TransientIOFailure("Remote object exists and is not a container: " + id);

    if (fs::create_directories(p, ec))
        log::Registry::remote()->debug("[DirectoryRemoteStore] Created container {}", id);
    if (ec) throw TransientIOFailure("Failed to create container " + id + ": " + ec.message());

    return id;
}

RemotePage DirectoryRemoteStore::listChildren(const std::string& containerId,
                                              const std::optional<std::string>& pageToken) {
    const auto p = resolve(containerId);
    const auto parent = normalizeRelPath(containerId);

    std::error_code ec;
    if (!fs::is_directory(p, ec)) throw TransientIOFailure("Not a remote container: " + containerId);

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(p, ec)) {
        const auto name = entry.path().filename().string();
        if (parent.empty() && name == TRASH_DIR) continue;
        if (entry.is_symlink(ec)) continue;
        names.push_back(name);
    }
    if (ec) throw TransientIOFailure("Failed to list " + containerId + ": " + ec.message());

    std::ranges::sort(names);

    std::size_t offset = 0;
    if (pageToken) {
        try {
            offset = std::stoull(*pageToken);
        } catch (const std::exception&) {
            throw TransientIOFailure("Invalid page token: " + *pageToken);
        }
    }

    RemotePage page;
    const auto end = std::min(names.size(), offset + pageSize_);
    for (auto i = offset; i < end; ++i) page.entries.push_back(describe(joinRelPath(parent, names[i])));
    if (end < names.size()) page.nextPageToken = std::to_string(end);

    return page;
}

RemoteEntry DirectoryRemoteStore::getMetadata(const std::string& id) {
    return describe(id);
}

std::vector<uint8_t> DirectoryRemoteStore::download(const std::string& id) {
    const auto p = resolve(id);
    std::ifstream in(p, std::ios::binary | std::ios::ate);
    if (!in) throw TransientIOFailure("Failed to open remote object: " + id);

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw TransientIOFailure("Failed to read remote object: " + id);

    return buffer;
}

RemoteEntry DirectoryRemoteStore::upload(const UploadRequest& request) {
    const auto id = request.existingId ? normalizeRelPath(*request.existingId)
                                       : joinRelPath(request.parentId, request.name);
    const auto p = resolve(id);

    std::error_code ec;
    if (!fs::is_directory(p.parent_path(), ec))
        throw TransientIOFailure("Parent container does not exist for " + id);

    const auto tmp = p.parent_path() / ("." + p.filename().string() + ".tsync-upload");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw TransientIOFailure("Failed to open upload target for " + id);
        out.write(reinterpret_cast<const char*>(request.content.data()),
                  static_cast<std::streamsize>(request.content.size()));
        if (!out) throw TransientIOFailure("Failed to write upload for " + id);
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw TransientIOFailure("Failed to commit upload for " + id + ": " + ec.message());
    }

    if (request.modifiedAt) {
        fs::last_write_time(p, millisToFileTime(*request.modifiedAt), ec);
        if (ec) log::Registry::remote()->warn("[DirectoryRemoteStore] Could not set mtime on {}: {}", id, ec.message());
    }

    log::Registry::remote()->debug("[DirectoryRemoteStore] Stored {} ({} bytes, {})",
                                   id, request.content.size(), request.mimeType);
    return describe(id);
}

void DirectoryRemoteStore::trash(const std::string& id) {
    const auto norm = normalizeRelPath(id);
    if (norm.empty()) throw std::invalid_argument("Refusing to trash the remote root");

    const auto src = resolve(norm);
    auto dest = root_ / TRASH_DIR / fs::path(norm);

    std::scoped_lock lock(mutex_);

    std::error_code ec;
    if (!fs::exists(src, ec)) throw TransientIOFailure("Remote object not found: " + id);

    fs::create_directories(dest.parent_path(), ec);
    if (ec) throw TransientIOFailure("Failed to create remote trash: " + ec.message());
    if (fs::exists(dest, ec)) dest += "." + std::to_string(nowMillis());

    fs::rename(src, dest, ec);
    if (ec) throw TransientIOFailure("Failed to trash " + id + ": " + ec.message());
}
