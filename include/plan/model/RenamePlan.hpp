#pragma once

#include "plan/model/RenameAction.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sn::plan::model {

struct RenamePlan {
    fs::path root;

    // Contents always precede their containing directory
    std::vector<RenameAction> actions;

    std::vector<std::string> warnings;
    std::vector<fs::path> skippedSymlinks;
    std::size_t totalEntriesScanned = 0;
    std::size_t totalRenamesNeeded = 0;

    [[nodiscard]] bool hasChanges() const { return totalRenamesNeeded > 0; }
};

}
