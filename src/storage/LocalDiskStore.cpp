#include "storage/LocalDiskStore.hpp"
#include "storage/diskTime.hpp"
#include "sync/model/errors.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <system_error>

using namespace ts::storage;
using namespace ts::sync::model;
using namespace ts::util;
namespace fs = std::filesystem;

LocalDiskStore::LocalDiskStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw TransientIOFailure("Cannot create local root " + root_.string() + ": " + ec.message());
}

fs::path LocalDiskStore::absPath(const std::string& rel) const {
    const auto norm = normalizeRelPath(rel);
    for (const auto& seg : splitSegments(norm))
        if (seg == "..") throw std::invalid_argument("Path escapes local root: " + rel);
    return norm.empty() ? root_ : root_ / fs::path(norm);
}

std::vector<LocalEntry> LocalDiskStore::listAllEntries() {
    std::vector<LocalEntry> entries;
    std::error_code ec;

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) throw TransientIOFailure("Cannot list " + root_.string() + ": " + ec.message());

    for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) throw TransientIOFailure("Listing " + root_.string() + " failed: " + ec.message());

        const auto rel = it->path().lexically_relative(root_).generic_string();
        if (rel == TRASH_DIR) {
            it.disable_recursion_pending();
            continue;
        }

        if (it->is_symlink(ec)) continue;
        const bool isDir = it->is_directory(ec);
        if (!isDir && !it->is_regular_file(ec)) continue;

        entries.push_back({rel, isDir});
    }

    return entries;
}

std::optional<LocalStat> LocalDiskStore::stat(const std::string& path) {
    const auto p = absPath(path);
    std::error_code ec;

    const auto status = fs::status(p, ec);
    if (ec || !fs::exists(status)) return std::nullopt;

    LocalStat st;
    st.isContainer = fs::is_directory(status);
    st.size = st.isContainer ? 0 : fs::file_size(p, ec);
    if (ec) return std::nullopt;

    const auto ftime = fs::last_write_time(p, ec);
    if (ec) return std::nullopt;
    st.mtime = fileTimeToMillis(ftime);
    return st;
}

std::vector<uint8_t> LocalDiskStore::readBytes(const std::string& path) {
    const auto p = absPath(path);
    std::ifstream in(p, std::ios::binary | std::ios::ate);
    if (!in) throw TransientIOFailure("Failed to open file: " + p.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(buffer.data()), size))
        throw TransientIOFailure("Failed to read file: " + p.string());

    return buffer;
}

void LocalDiskStore::writeBytes(const std::string& path, const std::vector<uint8_t>& content,
                                const std::optional<Timestamp>& mtime) {
    const auto p = absPath(path);
    ensureContainer(parentOf(normalizeRelPath(path)));

    // Write beside the target then rename, so a crash never leaves a torn file.
    const auto tmp = p.parent_path() / ("." + p.filename().string() + ".tsync-tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw TransientIOFailure("Failed to open temp file: " + tmp.string());
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        if (!out) throw TransientIOFailure("Failed to write file: " + tmp.string());
    }

    std::error_code ec;
    fs::rename(tmp, p, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw TransientIOFailure("Failed to move " + tmp.string() + " into place: " + ec.message());
    }

    if (mtime) {
        fs::last_write_time(p, millisToFileTime(*mtime), ec);
        if (ec) log::Registry::local()->warn("[LocalDiskStore] Could not set mtime on {}: {}", path, ec.message());
    }
}

void LocalDiskStore::ensureContainer(const std::string& path) {
    const auto p = absPath(path);
    std::error_code ec;
    if (fs::is_directory(p, ec)) return;

    fs::create_directories(p, ec);
    if (ec) throw TransientIOFailure("Failed to create directory " + p.string() + ": " + ec.message());
}

bool LocalDiskStore::exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(absPath(path), ec);
}

ContainerListing LocalDiskStore::listContainer(const std::string& path) {
    const auto p = absPath(path);
    std::error_code ec;
    ContainerListing listing;

    for (const auto& entry : fs::directory_iterator(p, ec)) {
        const auto rel = joinRelPath(normalizeRelPath(path), entry.path().filename().string());
        if (entry.is_directory(ec)) listing.containers.push_back(rel);
        else listing.files.push_back(rel);
    }

    if (ec) throw TransientIOFailure("Failed to list " + p.string() + ": " + ec.message());
    return listing;
}

void LocalDiskStore::removeEmptyContainer(const std::string& path) {
    const auto p = absPath(path);
    if (p == root_) throw std::invalid_argument("Refusing to remove the local root");

    std::error_code ec;
    if (!fs::is_empty(p, ec)) throw TransientIOFailure("Directory is not empty: " + p.string());
    fs::remove(p, ec);
    if (ec) throw TransientIOFailure("Failed to remove directory " + p.string() + ": " + ec.message());
}

void LocalDiskStore::moveToTrash(const std::string& path) {
    const auto norm = normalizeRelPath(path);
    const auto src = absPath(norm);
    auto dest = root_ / TRASH_DIR / fs::path(norm);

    std::error_code ec;
    fs::create_directories(dest.parent_path(), ec);
    if (ec) throw TransientIOFailure("Failed to create trash directory: " + ec.message());

    if (fs::exists(dest, ec))
        dest += "." + std::to_string(nowMillis());

    fs::rename(src, dest, ec);
    if (ec) throw TransientIOFailure("Failed to trash " + src.string() + ": " + ec.message());

    log::Registry::local()->debug("[LocalDiskStore] Trashed {} -> {}", norm, dest.string());
}
