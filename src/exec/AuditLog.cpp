#include "exec/AuditLog.hpp"
#include "logging/LogRegistry.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sn::exec;
using namespace sn::logging;

namespace sn::exec {

void to_json(nlohmann::json& j, const CompletedRename& r) {
    j = {
        {"source", r.source.string()},
        {"destination", r.destination.string()}
    };
}

void to_json(nlohmann::json& j, const FailedRename& r) {
    j = {{"source", r.source.string()}};
    if (r.error) j["error"] = *r.error;
}

void to_json(nlohmann::json& j, const AuditLog& log) {
    j = {
        {"timestamp", log.timestamp},
        {"root", log.root.string()},
        {"total_renames", log.renames.size()},
        {"total_errors", log.errors.size()},
        {"renames", log.renames},
        {"errors", log.errors}
    };
}

std::string generateLogFilename() {
    return "rename_log_" + util::getFileStamp() + ".json";
}

}

AuditLog AuditLog::fromResults(const std::vector<plan::model::RenameResult>& results, const fs::path& root) {
    AuditLog log;
    log.timestamp = util::getCurrentTimestamp();
    log.root = root;

    for (const auto& r : results) {
        if (r.success) log.renames.push_back({r.action.source, r.action.destination});
        else log.errors.push_back({r.action.source, r.errorMessage});
    }

    return log;
}

void AuditLog::write(const fs::path& file) const {
    if (file.has_parent_path()) fs::create_directories(file.parent_path());

    std::ofstream out(file, std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open rename log for writing: " + file.string());

    // Invalid UTF-8 in a name is written as U+FFFD rather than aborting the dump
    out << nlohmann::json(*this).dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
    if (!out) throw std::runtime_error("Failed to write rename log: " + file.string());

    LogRegistry::executor()->info("[AuditLog] Wrote {} renames and {} errors to {}", renames.size(), errors.size(),
                                  file.string());
}
