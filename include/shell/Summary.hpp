#pragma once

#include "plan/model/RenamePlan.hpp"
#include "plan/model/RenameResult.hpp"

#include <string>
#include <vector>

namespace sn::shell {

// Fixed-width label for listings, e.g. "[dir] " or "[file]".
std::string kindLabel(plan::model::EntryKind kind);

/// Human-readable plan: scan counts, skipped symlinks, one block per rename and
/// the warnings. Verbose mode adds per-rename issues and symlink paths.
std::string formatPlanSummary(const plan::model::RenamePlan& plan, bool verbose = false);

std::string formatResultCounts(const std::vector<plan::model::RenameResult>& results);

}
