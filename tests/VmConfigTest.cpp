#include <gtest/gtest.h>

#include "Utils/Result.hpp"
#include "Virtualization/vm/VmRecord.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

using namespace glidex;

namespace {
VmConfig validConfig() {
    VmConfig config;
    config.vcpuCount = 2;
    config.memSizeMib = 512;
    config.kernelImagePath = "/images/vmlinux.bin";
    config.rootfsPath = "/images/rootfs.ext4";
    return config;
}
} // namespace

TEST(VmConfig, ValidConfigPasses) {
    EXPECT_TRUE(validConfig().validate());
}

TEST(VmConfig, RejectsZeroOrOversizedResources) {
    auto config = validConfig();
    config.vcpuCount = 0;
    auto result = config.validate();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().errc(), VmErrc::InvalidConfig);
    EXPECT_NE(result.error().message().find("vcpu_count"), std::string::npos);

    config = validConfig();
    config.vcpuCount = 33;
    EXPECT_FALSE(config.validate());

    config = validConfig();
    config.memSizeMib = 0;
    EXPECT_FALSE(config.validate());
}

TEST(VmConfig, RejectsEmptyPaths) {
    auto config = validConfig();
    config.kernelImagePath.clear();
    EXPECT_FALSE(config.validate());

    config = validConfig();
    config.rootfsPath.clear();
    EXPECT_FALSE(config.validate());
}

TEST(VmConfig, DefaultKernelArgs) {
    auto config = validConfig();
    EXPECT_EQ(config.effectiveKernelArgs(), "console=ttyS0 reboot=k panic=1 pci=off");
    config.kernelArgs = "console=ttyS0 quiet";
    EXPECT_EQ(config.effectiveKernelArgs(), "console=ttyS0 quiet");
}

TEST(ConsolePaths, DerivedFromRuntimeDirAndId) {
    auto paths = ConsolePaths::forVm("/run/glidex/", "abc");
    EXPECT_EQ(paths.apiSocket, "/run/glidex/firecracker-abc.sock");
    EXPECT_EQ(paths.consoleSocket, "/run/glidex/firecracker-abc.console.sock");
    EXPECT_EQ(paths.logFile, "/run/glidex/firecracker-abc.log");
}

TEST(VmError, CodesCarryCategoryAndTag) {
    Error error(VmErrc::NotFound, "vm 'x' not found");
    EXPECT_EQ(error.code().category().name(), std::string("glidex.vm"));
    EXPECT_EQ(error.errc(), VmErrc::NotFound);
    EXPECT_STREQ(errorTag(VmErrc::InvalidTransition), "invalid_state");
    EXPECT_STREQ(errorTag(VmErrc::StorageError), "persistence_error");
    EXPECT_NE(error.what().find("vm 'x' not found"), std::string::npos);
}
