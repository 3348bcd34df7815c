#include "shell/Summary.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

using namespace sn::plan::model;

namespace sn::shell {

std::string kindLabel(const EntryKind kind) {
    switch (kind) {
    case EntryKind::Directory: return "[dir] ";
    case EntryKind::Symlink: return "[link]";
    case EntryKind::File: return "[file]";
    }
    return "[?]   ";
}

std::string formatPlanSummary(const RenamePlan& plan, const bool verbose) {
    std::string out;
    auto it = std::back_inserter(out);

    fmt::format_to(it, "Scanned {} entries under {}\n", plan.totalEntriesScanned, plan.root.string());

    if (!plan.skippedSymlinks.empty()) {
        fmt::format_to(it, "Skipped {} symlinks (use --follow-symlinks to process)\n", plan.skippedSymlinks.size());
        if (verbose)
            for (const auto& link : plan.skippedSymlinks) fmt::format_to(it, "  symlink: {}\n", link.string());
    }

    if (plan.hasChanges()) {
        fmt::format_to(it, "Found {} entries to rename:\n\n", plan.totalRenamesNeeded);

        for (const auto& action : plan.actions) {
            if (!action.needsRename) continue;
            fmt::format_to(it, "  {} {} -> {}\n", kindLabel(action.kind), action.originalName, action.finalName);
            fmt::format_to(it, "         in {}\n", action.source.parent_path().string());
            if (verbose)
                for (const auto& issue : action.issues) fmt::format_to(it, "         * {}\n", issue);
        }
    }

    if (!plan.warnings.empty()) {
        fmt::format_to(it, "\nWarnings ({}):\n", plan.warnings.size());
        for (const auto& warning : plan.warnings) fmt::format_to(it, "  ! {}\n", warning);
    }

    return out;
}

std::string formatResultCounts(const std::vector<RenameResult>& results) {
    const auto successes = std::count_if(results.begin(), results.end(), [](const auto& r) { return r.success; });
    const auto failures = static_cast<std::ptrdiff_t>(results.size()) - successes;
    return fmt::format("Done: {} renamed, {} errors.", successes, failures);
}

}
