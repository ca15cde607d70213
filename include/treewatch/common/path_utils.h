#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace treewatch {

// Decides whether a path takes part in watching. Applies to files and directories.
using PathFilter = std::function<bool(const std::filesystem::path&)>;

// Absolute, lexically normal form without a trailing separator.
// Used as the key for every path the manager stores.
std::filesystem::path NormalizePath(const std::filesystem::path& path);

// True when `ancestor` equals `path` or is one of its ancestors, compared
// component by component ("/a/b" is not an ancestor of "/a/bc").
bool IsSameOrAncestor(const std::filesystem::path& ancestor, const std::filesystem::path& path);

// True when one of the paths lies inside the other.
bool PathsOverlap(const std::filesystem::path& a, const std::filesystem::path& b);

// Number of components in the path.
size_t PathDepth(const std::filesystem::path& path);

// Entries whose name starts with a '.' are hidden.
bool IsHidden(const std::filesystem::path& path);

// Filter that rejects hidden entries.
PathFilter DefaultPathFilter();

// Filter that accepts everything.
PathFilter AcceptAllFilter();

// Replaces a leading "~" or "~/" with the user's home directory ($HOME, else
// the passwd entry). Other forms, or no known home, are returned unchanged.
std::filesystem::path ExpandHomeDirectory(const std::string& path);

}  // namespace treewatch
