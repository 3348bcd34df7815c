#pragma once

#include "plan/model/EntryKind.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace sn::plan::model {

// One planned rename. Never modified once the planner has emitted it.
struct RenameAction {
    const fs::path source;
    const fs::path destination;
    const EntryKind kind;
    const std::string originalName;
    const std::string finalName;
    const std::vector<std::string> issues;  // why the name changed, in pipeline order
    const bool needsRename;
};

}
