#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        auto cfg = mh::config::defaultConfig();
        cfg.logging.log_dir = fs::temp_directory_path() / "mirrorhall_test_logs";
        cfg.logging.levels.console_log_level = spdlog::level::off;
        mh::config::ConfigRegistry::init(cfg);
        mh::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize mirrorhall test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
