#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace sn::util {

inline fs::path common_path_prefix(const fs::path& a, const fs::path& b) {
    fs::path result;
    auto ait = a.begin();
    auto bit = b.begin();

    while (ait != a.end() && bit != b.end() && *ait == *bit) {
        result /= *ait;
        ++ait;
        ++bit;
    }

    return result;
}

inline fs::path stripTrailingSeparator(const fs::path& path) {
    auto norm = path.lexically_normal();
    if (!norm.has_filename() && norm.has_relative_path()) return norm.parent_path();
    return norm;
}

// Resolves symlinks in the existing part of the path but leaves the final
// component alone, so a path that names a symlink is judged by where it lives.
inline fs::path resolveParent(const fs::path& path) {
    const auto norm = stripTrailingSeparator(fs::absolute(path));
    if (!norm.has_relative_path()) return norm;
    return stripTrailingSeparator(fs::weakly_canonical(norm.parent_path())) / norm.filename();
}

[[nodiscard]] inline bool isUnderRoot(const fs::path& path, const fs::path& root) {
    const auto rootResolved = stripTrailingSeparator(fs::weakly_canonical(fs::absolute(root)));
    // Component-wise, so /tmp/abc-other is never mistaken for a child of /tmp/abc
    return common_path_prefix(resolveParent(path), rootResolved) == rootResolved;
}

inline void validateUnderRoot(const fs::path& path, const fs::path& root) {
    if (!isUnderRoot(path, root))
        throw std::logic_error("Path " + path.string() + " is not under root " + root.string());
}

}
