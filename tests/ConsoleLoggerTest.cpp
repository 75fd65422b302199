#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include "Virtualization/console/ConsoleLogger.hpp"

using namespace glidex;

TEST(ConsoleLogger, AppendsAcrossInstances) {
    test::TempDir dir;
    auto path = dir.path() + "/console.log";
    {
        ConsoleLogger logger(path);
        logger.append("boot 1\n");
    }
    {
        ConsoleLogger logger(path);
        logger.append("boot 2\n");
    }
    EXPECT_EQ(ConsoleLogger::readAll(path), "boot 1\nboot 2\n");
}

TEST(ConsoleLogger, MissingFileReadsEmpty) {
    test::TempDir dir;
    EXPECT_EQ(ConsoleLogger::readAll(dir.path() + "/absent.log"), "");
    EXPECT_EQ(ConsoleLogger::tail(dir.path() + "/absent.log", 10), "");
}

TEST(ConsoleLogger, TailIsBounded) {
    test::TempDir dir;
    auto path = dir.path() + "/console.log";
    ConsoleLogger logger(path);
    logger.append("0123456789");
    EXPECT_EQ(ConsoleLogger::tail(path, 4), "6789");
    EXPECT_EQ(ConsoleLogger::tail(path, 100), "0123456789");
    EXPECT_EQ(ConsoleLogger::tail(path, 0), "");
}

TEST(ConsoleLogger, UnwritableLocationThrows) {
    EXPECT_THROW(ConsoleLogger("/nonexistent-dir/console.log"), ConsoleException);
}
