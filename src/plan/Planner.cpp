#include "plan/Planner.hpp"
#include "plan/Collisions.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"
#include "util/utf8.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <map>
#include <stdexcept>
#include <system_error>

using namespace sn::plan;
using namespace sn::plan::model;
using namespace sn::logging;
using namespace sn::util;

namespace {

void addWarning(RenamePlan& plan, std::string warning) {
    LogRegistry::planner()->warn("[Planner] {}", warning);
    plan.warnings.push_back(std::move(warning));
}

}

RenamePlan Planner::build(const fs::path& root, const ScanOptions& opts) {
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        throw std::invalid_argument("Root path is not a directory: " + root.string());

    if (opts.sanitize.maxLength == 0)
        throw std::invalid_argument("Maximum name length must be positive");

    if (opts.sanitize.mode == sanitize::Mode::Override && sanitize::isRestrictedChar(opts.sanitize.replaceChar))
        throw std::invalid_argument("Replace character is itself a restricted character");

    RenamePlan plan;
    plan.root = fs::canonical(root);

    LogRegistry::planner()->debug("[Planner] Scanning {} (follow symlinks: {}, max length: {})",
                                  plan.root.string(), opts.followSymlinks, opts.sanitize.maxLength);

    visit(plan.root, opts, plan);

    LogRegistry::planner()->info("[Planner] Scanned {} entries under {}: {} renames, {} warnings, {} symlinks skipped",
                                 plan.totalEntriesScanned, plan.root.string(), plan.totalRenamesNeeded,
                                 plan.warnings.size(), plan.skippedSymlinks.size());
    return plan;
}

void Planner::visit(const fs::path& dir, const ScanOptions& opts, RenamePlan& plan) {
    std::vector<Entry> entries;
    std::vector<fs::path> subdirs;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        addWarning(plan, fmt::format("Cannot read directory {}: {}", dir.string(), ec.message()));
        return;
    }

    std::vector<fs::directory_entry> children;
    while (it != fs::directory_iterator()) {
        children.push_back(*it);
        it.increment(ec);
        if (ec) break;
    }
    if (ec) addWarning(plan, fmt::format("Listing of {} stopped early: {}", dir.string(), ec.message()));

    // Directory iteration order is unspecified; sort so plans are reproducible
    std::sort(children.begin(), children.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().native() < b.path().filename().native();
    });

    for (const auto& child : children) {
        auto name = child.path().filename().string();

        if (child.is_symlink(ec)) {
            if (!opts.followSymlinks) {
                plan.skippedSymlinks.push_back(child.path());
                ++plan.totalEntriesScanned;
                continue;
            }
            entries.push_back({std::move(name), EntryKind::Symlink});
            continue;
        }

        if (child.is_directory(ec)) {
            subdirs.push_back(child.path());
            entries.push_back({std::move(name), EntryKind::Directory});
            continue;
        }

        entries.push_back({std::move(name), EntryKind::File});
    }

    // Post-order: everything beneath a directory is planned before the directory itself
    for (const auto& sub : subdirs) visit(sub, opts, plan);

    planDirectory(dir, entries, opts, plan);
}

void Planner::planDirectory(const fs::path& dir, const std::vector<Entry>& entries,
                            const ScanOptions& opts, RenamePlan& plan) {
    plan.totalEntriesScanned += entries.size();

    struct Pending {
        EntryKind kind;
        std::vector<std::string> issues;
    };

    std::map<std::string, std::string> desired;
    std::map<std::string, Pending> pending;
    NameSet untouched;
    std::vector<std::string> untouchedOrdered;

    for (const auto& [name, kind] : entries) {
        auto res = sanitize::sanitizeName(name, opts.sanitize);
        if (res.name == name) {
            untouched.insert(name);
            untouchedOrdered.push_back(name);
            continue;
        }
        LogRegistry::sanitize()->debug("[Sanitizer] {} -> {} ({})", name, res.name, fmt::join(res.issues, "; "));
        desired.emplace(name, std::move(res.name));
        pending.emplace(name, Pending{kind, std::move(res.issues)});
    }

    if (!desired.empty()) {
        const auto resolution = resolveCollisions(desired, untouched, opts.sanitize.maxLength);

        // Left in place under its old name; the rest of the directory is still planned
        for (const auto& original : resolution.unresolved)
            addWarning(plan, fmt::format("No free name within {} characters; left unchanged: {}",
                                         opts.sanitize.maxLength, (dir / original).string()));

        for (const auto& [original, finalName] : resolution.names) {
            auto& [kind, issues] = pending.at(original);

            if (finalName != desired.at(original))
                issues.push_back(fmt::format("Name collision resolved: appended suffix to get '{}'", finalName));

            auto source = dir / original;
            auto destination = dir / finalName;

            validateUnderRoot(destination, plan.root);

            LogRegistry::planner()->debug("[Planner] {} {} -> {}", to_string(kind), source.string(), finalName);

            plan.actions.push_back(RenameAction{
                std::move(source), destination, kind, original, finalName, std::move(issues), true});
            ++plan.totalRenamesNeeded;

            warnIfTooLong(destination, plan);
        }
    }

    // Entries that keep their name can still sit at a path Windows cannot open
    for (const auto& name : untouchedOrdered) warnIfTooLong(dir / name, plan);
}

void Planner::warnIfTooLong(const fs::path& path, RenamePlan& plan) {
    const auto len = utf8::length(path.string());
    if (len <= sanitize::WINDOWS_MAX_PATH) return;
    addWarning(plan, fmt::format("Path length {} exceeds Windows MAX_PATH ({}): {}",
                                 len, sanitize::WINDOWS_MAX_PATH, path.string()));
}
