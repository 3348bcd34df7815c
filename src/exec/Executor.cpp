#include "exec/Executor.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

using namespace sn::exec;
using namespace sn::plan::model;
using namespace sn::logging;

namespace fs = std::filesystem;

namespace {

// symlink_status so a dangling symlink still counts as present
bool occupied(const fs::path& path) {
    std::error_code ec;
    return fs::exists(fs::symlink_status(path, ec));
}

RenameResult failure(const RenameAction& action, std::string message) {
    LogRegistry::executor()->error("[Executor] {} -> {}: {}", action.source.string(),
                                   action.destination.string(), message);
    return {action, false, std::move(message)};
}

}

std::vector<RenameResult> Executor::run(const RenamePlan& plan) {
    std::vector<RenameResult> results;
    results.reserve(plan.actions.size());

    for (const auto& action : plan.actions) {
        if (!action.needsRename) continue;
        results.push_back(apply(action));
    }

    const auto failures = static_cast<std::size_t>(
        std::count_if(results.begin(), results.end(), [](const auto& r) { return !r.success; }));
    LogRegistry::executor()->info("[Executor] Applied plan for {}: {} renamed, {} failed", plan.root.string(),
                                  results.size() - failures, failures);
    return results;
}

RenameResult Executor::apply(const RenameAction& action) {
    // The tree may have changed since the plan was built
    if (!occupied(action.source))
        return failure(action, "Source no longer exists: " + action.source.string());

    if (occupied(action.destination))
        return failure(action, "Destination already exists: " + action.destination.string());

    std::error_code ec;
    fs::rename(action.source, action.destination, ec);
    if (ec) return failure(action, ec.message());

    LogRegistry::executor()->debug("[Executor] Renamed {} -> {}", action.source.string(), action.destination.string());
    LogRegistry::audit()->info("RENAME {} {} -> {}", to_string(action.kind), action.source.string(),
                               action.destination.string());
    return {action, true, std::nullopt};
}
