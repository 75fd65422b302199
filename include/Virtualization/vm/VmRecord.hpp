#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>

#include "Virtualization/vmm/VirtualMachineConfig.hpp"

namespace glidex {

enum class VmState { Created, Starting, Running, Pausing, Paused, Stopping, Stopped, Deleting };

/// Lowercase wire name ("created", "running", ...)
[[nodiscard]] const char* toString(VmState state) noexcept;
[[nodiscard]] std::optional<VmState> vmStateFromString(std::string_view name) noexcept;

/// Per-VM filesystem endpoints, all derived from the VM id.
struct ConsolePaths {
    std::string apiSocket;
    std::string consoleSocket;
    std::string logFile;

    [[nodiscard]] static ConsolePaths forVm(std::string_view runtimeDir, std::string_view vmId);

    // both socket paths fit in sockaddr_un::sun_path
    [[nodiscard]] bool socketsFit() const noexcept;

    bool operator==(const ConsolePaths&) const = default;
};

/// Snapshot of one VM as seen by callers of the registry.
struct VmRecord {
    std::string id;
    std::string name;
    VmConfig config;
    VmState state{VmState::Created};
    ConsolePaths paths;
    // set only while a hypervisor process is alive
    std::optional<pid_t> pid;
};

} // namespace glidex
