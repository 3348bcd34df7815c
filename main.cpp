#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/Parser.hpp"
#include "shell/Token.hpp"
#include "shell/commands/rename.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace sn::config;
using namespace sn::logging;
using namespace sn::shell;
using namespace sn::shell::commands;

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto call = parseTokens(tokenize(args), renameFlags());
    call.name = std::filesystem::path(argv[0]).filename().string();

    try {
        if (const auto explicitConfig = call.optVal("config")) {
            if (!std::filesystem::exists(*explicitConfig)) {
                std::cerr << "Error: config file '" << *explicitConfig << "' does not exist.\n";
                return Failure;
            }
            ConfigRegistry::init(std::filesystem::path(*explicitConfig));
        } else {
            ConfigRegistry::init();
        }

        LogRegistry::init();
        LogRegistry::safename()->debug("[safename] Starting with {} argument(s)", args.size());

        StreamIO io{std::cin, std::cout, std::cerr};
        const int rc = runRename(call, io);

        spdlog::shutdown();
        return rc;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::safename()->error("[safename] Fatal: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return Failure;
    }
}
