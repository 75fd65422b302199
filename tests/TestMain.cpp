#include <gtest/gtest.h>
#include <csignal>

#include "System/Logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // console clients that vanish mid-write must not kill the test process
    std::signal(SIGPIPE, SIG_IGN);

    glidex::LogConfig config;
    config.name = "glidex-tests";
    config.level = spdlog::level::warn;
    config.enable_file = false;
    glidex::SafeLogger::initialize(config);

    return RUN_ALL_TESTS();
}
