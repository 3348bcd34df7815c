#pragma once

#include "plan/Planner.hpp"
#include "shell/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sn::shell::commands {

enum ExitCode : int {
    Success = 0,
    Failure = 1,    // bad input, or at least one rename failed
    Cancelled = 2,  // declined at the confirmation prompt
};

// Resolved invocation: config defaults with command-line overrides applied.
struct RenameOptions {
    std::filesystem::path root;
    plan::ScanOptions scan;
    bool write = false;
    bool yes = false;
    bool verbose = false;
    std::optional<std::filesystem::path> logFile;
};

const std::vector<FlagSpec>& renameFlags();
std::string usage(const std::string& prog);

/// Merges the parsed call over the configured defaults.
/// Throws std::invalid_argument with a user-facing message on bad input.
RenameOptions resolveOptions(const CommandCall& call);

// Scan, report, confirm, execute, log. Returns the process exit code.
int runRename(const CommandCall& call, StreamIO& io);

}
