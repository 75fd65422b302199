#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "System/Settings.hpp"

using namespace glidex;
using namespace std::chrono_literals;

TEST(Settings, EmptyRootKeepsDefaults) {
    auto settings = Settings::parse("<glidex/>");
    ASSERT_TRUE(settings) << settings.error().what();
    EXPECT_EQ(settings->manager.supervisor.hypervisorBinary, "firecracker");
    EXPECT_EQ(settings->manager.supervisor.shutdownGrace, 3000ms);
    EXPECT_EQ(settings->manager.runtimeDir, "/tmp");
    EXPECT_EQ(settings->manager.console.replayBytes, 64u * 1024);
    EXPECT_EQ(settings->api.port, 8080);
    EXPECT_EQ(settings->logging.level, spdlog::level::info);
}

TEST(Settings, EveryElementIsRead) {
    auto settings = Settings::parse(R"(
        <glidex>
          <hypervisor binary="/opt/fc/firecracker" socket-timeout-ms="2000" socket-poll-ms="50"
                      request-timeout-ms="10000" shutdown-grace-ms="0"/>
          <runtime dir="/run/glidex" database="/srv/glidex/db"/>
          <console replay-bytes="4096" client-queue-bytes="65536" io-threads="4"/>
          <api address="127.0.0.1" port="9090" threads="8"/>
          <logging level="debug" file="/var/log/glidex.log" console="false" file-enabled="yes"/>
        </glidex>)");
    ASSERT_TRUE(settings) << settings.error().what();

    const auto& sup = settings->manager.supervisor;
    EXPECT_EQ(sup.hypervisorBinary, "/opt/fc/firecracker");
    EXPECT_EQ(sup.apiSocketTimeout, 2000ms);
    EXPECT_EQ(sup.apiSocketPoll, 50ms);
    EXPECT_EQ(sup.requestTimeout, 10000ms);
    EXPECT_EQ(sup.shutdownGrace, 0ms);
    EXPECT_EQ(settings->manager.runtimeDir, "/run/glidex");
    EXPECT_EQ(settings->databasePath, "/srv/glidex/db");
    EXPECT_EQ(settings->manager.console.replayBytes, 4096u);
    EXPECT_EQ(settings->manager.console.clientQueueBytes, 65536u);
    EXPECT_EQ(settings->manager.consoleThreads, 4u);
    EXPECT_EQ(settings->api.address, "127.0.0.1");
    EXPECT_EQ(settings->api.port, 9090);
    EXPECT_EQ(settings->api.threads, 8u);
    EXPECT_EQ(settings->logging.level, spdlog::level::debug);
    EXPECT_EQ(settings->logging.file_path, "/var/log/glidex.log");
    EXPECT_FALSE(settings->logging.enable_console);
    EXPECT_TRUE(settings->logging.enable_file);
}

TEST(Settings, BadValuesAreInvalidConfig) {
    for (const char* xml : {
             "<glidex><api port=\"70000\"/></glidex>",
             "<glidex><api port=\"http\"/></glidex>",
             "<glidex><hypervisor request-timeout-ms=\"0\"/></glidex>",
             "<glidex><hypervisor binary=\"\"/></glidex>",
             "<glidex><runtime dir=\"/var/run/glidex/a-directory-name-that-is-far-too-long-for-sockets\"/></glidex>",
             "<glidex><logging level=\"chatty\"/></glidex>",
             "<glidex><logging console=\"maybe\"/></glidex>",
             "<glidex><console replay-bytes=\"100\" client-queue-bytes=\"10\"/></glidex>",
             "<settings/>",
             "<glidex>",
         }) {
        auto settings = Settings::parse(xml);
        ASSERT_FALSE(settings) << xml;
        EXPECT_EQ(settings.error().errc(), VmErrc::InvalidConfig) << xml;
    }
}

TEST(Settings, DumpedSettingsLoadBackUnchanged) {
    Settings original;
    original.manager.supervisor.hypervisorBinary = "/usr/local/bin/firecracker";
    original.manager.runtimeDir = "/run/glidex";
    original.api.port = 8181;
    original.logging.level = spdlog::level::warn;

    test::TempDir dir;
    auto path = dir.file("glidex.xml", original.toXml());
    auto loaded = Settings::load(path);
    ASSERT_TRUE(loaded) << loaded.error().what();
    EXPECT_EQ(loaded->manager.supervisor.hypervisorBinary, "/usr/local/bin/firecracker");
    EXPECT_EQ(loaded->manager.runtimeDir, "/run/glidex");
    EXPECT_EQ(loaded->api.port, 8181);
    EXPECT_EQ(loaded->logging.level, spdlog::level::warn);
}

TEST(Settings, MissingFileIsInvalidConfig) {
    auto settings = Settings::load("/nonexistent/glidex.xml");
    ASSERT_FALSE(settings);
    EXPECT_EQ(settings.error().errc(), VmErrc::InvalidConfig);
}
