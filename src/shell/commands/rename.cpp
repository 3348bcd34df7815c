#include "shell/commands/rename.hpp"
#include "shell/Summary.hpp"
#include "config/ConfigRegistry.hpp"
#include "exec/AuditLog.hpp"
#include "exec/Executor.hpp"
#include "logging/LogRegistry.hpp"
#include "sanitize/Sanitizer.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>

#include <array>
#include <charconv>
#include <istream>
#include <ostream>
#include <stdexcept>

using namespace sn::config;
using namespace sn::exec;
using namespace sn::logging;
using namespace sn::plan;

namespace sn::shell::commands {

namespace {

constexpr std::array<const char*, 5> BOOLEAN_FLAGS = {"write", "yes", "follow-symlinks", "verbose", "help"};

std::size_t parseMaxLength(const std::string& text) {
    std::size_t value = 0;
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value == 0)
        throw std::invalid_argument("--max-length must be a positive integer, got '" + text + "'");
    return value;
}

bool confirmed(StreamIO& io, const std::size_t count) {
    io.out << "\nRename " << count << " entries? [y/N] " << std::flush;

    std::string response;
    if (!std::getline(io.in, response)) {
        io.out << "\nCancelled.\n";
        return false;
    }

    const auto answer = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(response));
    if (answer == "y" || answer == "yes") return true;

    io.out << "Cancelled.\n";
    return false;
}

}

const std::vector<FlagSpec>& renameFlags() {
    static const std::vector<FlagSpec> flags = {
        {"write", {}, false},
        {"yes", {"y"}, false},
        {"replace-char", {}, true},
        {"max-length", {}, true},
        {"follow-symlinks", {}, false},
        {"log-file", {}, true},
        {"verbose", {"v"}, false},
        {"config", {}, true},
        {"help", {"h"}, false},
    };
    return flags;
}

std::string usage(const std::string& prog) {
    return fmt::format(
        "usage: {} PATH [options]\n"
        "\n"
        "Recursively rename files and directories so their names are portable across\n"
        "UNIX, Windows and macOS: restricted characters, trailing dots and spaces,\n"
        "reserved device names and over-long names are fixed. Dry-run unless --write.\n"
        "\n"
        "options:\n"
        "  --write               perform the renames\n"
        "  -y, --yes             do not ask for confirmation with --write\n"
        "  --replace-char C      replace every restricted character with C instead of\n"
        "                        its Unicode look-alike\n"
        "  --max-length N        maximum name length before truncation (default: {})\n"
        "  --follow-symlinks     rename symlinks too (never descends into them)\n"
        "  --log-file FILE       where to write the JSON rename log\n"
        "                        (default: rename_log_<timestamp>.json)\n"
        "  -v, --verbose         show why each name changes\n"
        "  --config FILE         configuration file\n"
        "  -h, --help            show this help\n",
        prog.empty() ? "safename" : prog, sanitize::DEFAULT_MAX_NAME_LENGTH);
}

RenameOptions resolveOptions(const CommandCall& call) {
    if (!call.unknown.empty())
        throw std::invalid_argument("unknown option '" + std::string(call.unknown.front().size() == 1 ? "-" : "--") +
                                    call.unknown.front() + "'");

    for (const auto* flag : BOOLEAN_FLAGS)
        if (call.optVal(flag)) throw std::invalid_argument(fmt::format("--{} does not take a value", flag));

    // "--flag=" parses to an empty value, which counts as missing
    for (const auto& spec : renameFlags()) {
        if (!spec.takes_value || !call.hasFlag(spec.name)) continue;
        const auto value = call.optVal(spec.name);
        if (!value || value->empty()) throw std::invalid_argument("--" + spec.name + " requires a value");
    }

    if (call.positionals.size() != 1)
        throw std::invalid_argument(call.positionals.empty() ? "missing PATH argument"
                                                             : "expected exactly one PATH argument");

    const auto& cfg = ConfigRegistry::get();

    RenameOptions opts;
    opts.root = call.positionals.front();
    opts.write = call.hasFlag("write");
    opts.yes = call.hasFlag("yes");
    opts.verbose = call.hasFlag("verbose");
    if (const auto logFile = call.optVal("log-file")) opts.logFile = *logFile;

    auto sanitizeCfg = cfg.sanitize;
    if (const auto rc = call.optVal("replace-char")) {
        try {
            (void)sanitize::parseReplaceChar(*rc);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(std::string("--replace-char: ") + e.what());
        }
        sanitizeCfg.replace_char = *rc;
    }
    if (const auto ml = call.optVal("max-length")) sanitizeCfg.max_length = parseMaxLength(*ml);

    opts.scan.sanitize = sanitizeCfg.toOptions();
    opts.scan.followSymlinks = cfg.sanitize.follow_symlinks || call.hasFlag("follow-symlinks");

    return opts;
}

int runRename(const CommandCall& call, StreamIO& io) {
    if (call.hasFlag("help")) {
        io.out << usage(call.name);
        return Success;
    }

    RenameOptions opts;
    try {
        opts = resolveOptions(call);
    } catch (const std::invalid_argument& e) {
        LogRegistry::shell()->debug("[rename] Rejected arguments: {}", e.what());
        io.err << "Error: " << e.what() << "\n" << "Try '" << (call.name.empty() ? "safename" : call.name)
               << " --help' for more information.\n";
        return Failure;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(opts.root, ec)) {
        io.err << "Error: '" << opts.root.string() << "' is not a directory.\n";
        return Failure;
    }

    const auto plan = Planner::build(opts.root, opts.scan);

    io.out << formatPlanSummary(plan, opts.verbose);

    if (!plan.hasChanges()) {
        io.out << "\nNo renames needed. All filenames are already portable.\n";
        return Success;
    }

    if (!opts.write) {
        io.out << "\nDry-run mode. Use --write to apply changes.\n";
        return Success;
    }

    if (!opts.yes && !confirmed(io, plan.totalRenamesNeeded)) return Cancelled;

    const auto results = Executor::run(plan);

    const auto logFile = opts.logFile.value_or(ConfigRegistry::get().execution.log_dir / generateLogFilename());

    io.out << "\n" << formatResultCounts(results) << "\n";

    bool failed = false;
    for (const auto& r : results) {
        if (r.success) continue;
        failed = true;
        io.err << "  ERROR: " << r.action.source.string() << " -> " << r.errorMessage.value_or("unknown error") << "\n";
    }

    try {
        AuditLog::fromResults(results, plan.root).write(logFile);
        io.out << "Log written to: " << logFile.string() << "\n";
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[rename] Could not write rename log {}: {}", logFile.string(), e.what());
        io.err << "Error: could not write rename log " << logFile.string() << ": " << e.what() << "\n";
        return Failure;
    }

    return failed ? Failure : Success;
}

}
