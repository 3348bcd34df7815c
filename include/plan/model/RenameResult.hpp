#pragma once

#include "plan/model/RenameAction.hpp"

#include <optional>
#include <string>

namespace sn::plan::model {

struct RenameResult {
    RenameAction action;
    bool success = false;
    std::optional<std::string> errorMessage{};
};

}
