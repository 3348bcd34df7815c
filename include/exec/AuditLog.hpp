#pragma once

#include "plan/model/RenameResult.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace fs = std::filesystem;

namespace sn::exec {

struct CompletedRename {
    fs::path source;
    fs::path destination;
};

struct FailedRename {
    fs::path source;
    std::optional<std::string> error;
};

// Record of one execution run, kept for auditing or manual rollback.
struct AuditLog {
    std::string timestamp;  // ISO 8601, UTC
    fs::path root;
    std::vector<CompletedRename> renames;
    std::vector<FailedRename> errors;

    static AuditLog fromResults(const std::vector<plan::model::RenameResult>& results, const fs::path& root);

    // Pretty-printed JSON; parent directories are created as needed.
    void write(const fs::path& file) const;
};

// rename_log_YYYYMMDD_HHMMSS.json, UTC
std::string generateLogFilename();

void to_json(nlohmann::json& j, const CompletedRename& r);
void to_json(nlohmann::json& j, const FailedRename& r);
void to_json(nlohmann::json& j, const AuditLog& log);

}
