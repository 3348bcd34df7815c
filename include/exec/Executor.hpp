#pragma once

#include "plan/model/RenamePlan.hpp"
#include "plan/model/RenameResult.hpp"

#include <vector>

namespace sn::exec {

class Executor {
public:
    /// Applies the plan's actions strictly in order, one at a time. A failed
    /// action is recorded and the remaining ones are still attempted.
    static std::vector<plan::model::RenameResult> run(const plan::model::RenamePlan& plan);

    static plan::model::RenameResult apply(const plan::model::RenameAction& action);
};

}
