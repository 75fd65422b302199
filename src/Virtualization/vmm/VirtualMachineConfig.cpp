#include "Virtualization/vmm/VirtualMachineConfig.hpp"

#include <fmt/format.h>

namespace glidex {

namespace {
// Firecracker's machine-config limits
constexpr std::int64_t kMaxVcpus = 32;
constexpr std::int64_t kMaxMemMib = 1024 * 1024;
}

Result<void> VmConfig::validate() const {
    if (vcpuCount <= 0 || vcpuCount > kMaxVcpus) {
        return fail(VmErrc::InvalidConfig,
                    fmt::format("vcpu_count must be in 1..{}, got {}", kMaxVcpus, vcpuCount));
    }
    if (memSizeMib <= 0 || memSizeMib > kMaxMemMib) {
        return fail(VmErrc::InvalidConfig,
                    fmt::format("mem_size_mib must be in 1..{}, got {}", kMaxMemMib, memSizeMib));
    }
    if (kernelImagePath.empty()) return fail(VmErrc::InvalidConfig, "kernel_image_path is empty");
    if (rootfsPath.empty()) return fail(VmErrc::InvalidConfig, "rootfs_path is empty");
    return {};
}

} // namespace glidex
