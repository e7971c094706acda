#include "util/Magic.hpp"
#include "util/fsPath.hpp"
#include "log/Registry.hpp"

#include <magic.h>
#include <mutex>
#include <stdexcept>
#include <unordered_map>

using namespace ts::util;

Magic::Magic() {
    cookie = magic_open(MAGIC_MIME_TYPE);
    if (!cookie) throw std::runtime_error("Failed to create magic cookie");

    // nullptr lets libmagic find its default database
    if (magic_load(cookie, nullptr) != 0) {
        const std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        magic_close(cookie);
        throw std::runtime_error("Failed to load magic database: " + err);
    }
}

Magic::~Magic() {
    if (cookie) magic_close(cookie);
}

std::string Magic::mime_type_buffer(const std::vector<uint8_t>& buffer) const {
    if (buffer.empty()) throw std::invalid_argument("Cannot detect MIME type from empty buffer");

    const char* result = magic_buffer(cookie, buffer.data(), buffer.size());
    if (!result) {
        const std::string err = magic_error(cookie) ? magic_error(cookie) : "Unknown error";
        throw std::runtime_error("magic_buffer failed: " + err);
    }
    return {result};
}

std::string Magic::get_mime_type_from_buffer(const std::vector<uint8_t>& buffer) {
    // magic_t is not thread-safe; uploads run on the worker pool
    static std::mutex mutex;
    static Magic instance;
    std::scoped_lock lock(mutex);
    return instance.mime_type_buffer(buffer);
}

std::string ts::util::inferMimeType(const std::string_view path, const std::vector<uint8_t>& content) {
    static const std::unordered_map<std::string, std::string> mimeMap = {
        {".md", "text/markdown"}, {".txt", "text/plain"}, {".json", "application/json"},
        {".css", "text/css"}, {".js", "application/javascript"}, {".png", "image/png"},
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".gif", "image/gif"},
        {".svg", "image/svg+xml"}, {".pdf", "application/pdf"}, {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"}, {".webp", "image/webp"}, {".canvas", "application/json"},
    };

    if (const auto it = mimeMap.find(extensionOf(path)); it != mimeMap.end()) return it->second;
    if (content.empty()) return "application/octet-stream";

    try {
        return Magic::get_mime_type_from_buffer(content);
    } catch (const std::exception& e) {
        log::Registry::sync()->debug("[Magic] Falling back to octet-stream for {}: {}", path, e.what());
        return "application/octet-stream";
    }
}
