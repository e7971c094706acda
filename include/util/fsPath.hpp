#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ts::util {

// Helpers for tree-relative paths: '/'-separated, no leading or trailing '/'.

std::string normalizeRelPath(std::string_view path);

std::vector<std::string> splitSegments(std::string_view path);

std::string joinRelPath(std::string_view parent, std::string_view name);

// "" for top-level entries
std::string parentOf(std::string_view path);

std::string lastSegment(std::string_view path);

// Lowercased extension of the last segment including the dot, or "" when the
// segment has none (dotfiles like ".env" have no extension).
std::string extensionOf(std::string_view path);

// Number of segments; used to order containers deepest-first.
std::size_t depthOf(std::string_view path);

bool isSameOrDescendant(std::string_view path, std::string_view ancestor);

}
