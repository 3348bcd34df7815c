#pragma once

#include "plan/model/RenamePlan.hpp"
#include "sanitize/Sanitizer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sn::plan {

struct ScanOptions {
    ::sn::sanitize::Options sanitize{};
    bool followSymlinks = false;  // symlinks are renamed like files, never descended into
};

struct Planner {
    /// Scans `root` bottom-up and returns a collision-free rename plan whose
    /// actions can be applied in order. Read-only: nothing on disk changes.
    ///
    /// Throws std::invalid_argument if `root` is not a directory or the options
    /// are unusable, std::logic_error if a destination escapes the root.
    static model::RenamePlan build(const fs::path& root, const ScanOptions& opts = {});

private:
    struct Entry {
        std::string name;
        model::EntryKind kind;
    };

    static void visit(const fs::path& dir, const ScanOptions& opts, model::RenamePlan& plan);
    static void planDirectory(const fs::path& dir, const std::vector<Entry>& entries,
                              const ScanOptions& opts, model::RenamePlan& plan);
    static void warnIfTooLong(const fs::path& path, model::RenamePlan& plan);
};

}
