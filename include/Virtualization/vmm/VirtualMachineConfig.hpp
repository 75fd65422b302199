#ifndef GLIDEX_VMCONFIG_H
#define GLIDEX_VMCONFIG_H

#include <cstdint>
#include <optional>
#include <string>

#include "Utils/Result.hpp"

namespace glidex {

/// Boot arguments sent when a VM was created without its own
inline constexpr const char* kDefaultKernelArgs = "console=ttyS0 reboot=k panic=1 pci=off";

struct VmConfig {
    // resources
    std::int64_t vcpuCount{1};
    std::int64_t memSizeMib{128};

    // boot assets, checked for existence only at start
    std::string kernelImagePath;
    std::string rootfsPath;
    std::optional<std::string> kernelArgs;

    [[nodiscard]] std::string effectiveKernelArgs() const {
        return kernelArgs.value_or(kDefaultKernelArgs);
    }

    // validation: positive sizes, non-empty paths
    [[nodiscard]] Result<void> validate() const;

    bool operator==(const VmConfig&) const = default;
};

} // namespace glidex

#endif // GLIDEX_VMCONFIG_H
