#include "treewatch/common/path_utils.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <iterator>
#include <string>
#include <system_error>

namespace treewatch {

std::filesystem::path NormalizePath(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    std::filesystem::path normal = absolute.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

bool IsSameOrAncestor(const std::filesystem::path& ancestor, const std::filesystem::path& path) {
    auto a_it = ancestor.begin();
    auto p_it = path.begin();
    for (; a_it != ancestor.end(); ++a_it, ++p_it) {
        if (a_it->empty() && std::next(a_it) == ancestor.end()) {
            // Trailing separator: "/a/b/" behaves like "/a/b".
            return true;
        }
        if (p_it == path.end() || *a_it != *p_it) {
            return false;
        }
    }
    return true;
}

bool PathsOverlap(const std::filesystem::path& a, const std::filesystem::path& b) {
    return IsSameOrAncestor(a, b) || IsSameOrAncestor(b, a);
}

size_t PathDepth(const std::filesystem::path& path) {
    return static_cast<size_t>(std::distance(path.begin(), path.end()));
}

bool IsHidden(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.front() == '.';
}

PathFilter DefaultPathFilter() {
    return [](const std::filesystem::path& path) { return !IsHidden(path); };
}

PathFilter AcceptAllFilter() {
    return [](const std::filesystem::path&) { return true; };
}

std::filesystem::path ExpandHomeDirectory(const std::string& path) {
    if (path.empty() || path[0] != '~' || (path.size() > 1 && path[1] != '/')) {
        return path;
    }

    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        const struct passwd* entry = getpwuid(getuid());
        home = entry != nullptr ? entry->pw_dir : nullptr;
    }
    if (home == nullptr || *home == '\0') {
        return path;
    }

    std::filesystem::path expanded(home);
    if (path.size() > 2) {
        expanded /= path.substr(2);
    }
    return expanded;
}

}  // namespace treewatch
