#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        // Built-in defaults only; a developer's own config must not leak into the tests
        sn::config::ConfigRegistry::init(sn::config::Config{});
        sn::logging::LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize safename test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
