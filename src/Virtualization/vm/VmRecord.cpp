#include "Virtualization/vm/VmRecord.hpp"

#include <array>
#include <utility>
#include <sys/un.h>
#include <fmt/format.h>

namespace glidex {

namespace {
constexpr std::array<std::pair<VmState, const char*>, 8> kStateNames{{
    {VmState::Created, "created"},
    {VmState::Starting, "starting"},
    {VmState::Running, "running"},
    {VmState::Pausing, "pausing"},
    {VmState::Paused, "paused"},
    {VmState::Stopping, "stopping"},
    {VmState::Stopped, "stopped"},
    {VmState::Deleting, "deleting"},
}};
}

const char* toString(VmState state) noexcept {
    for (const auto& [value, name] : kStateNames) {
        if (value == state) return name;
    }
    return "unknown";
}

std::optional<VmState> vmStateFromString(std::string_view name) noexcept {
    for (const auto& [value, text] : kStateNames) {
        if (name == text) return value;
    }
    return std::nullopt;
}

ConsolePaths ConsolePaths::forVm(std::string_view runtimeDir, std::string_view vmId) {
    std::string_view dir = runtimeDir;
    while (dir.size() > 1 && dir.back() == '/') dir.remove_suffix(1);
    return ConsolePaths{
        fmt::format("{}/firecracker-{}.sock", dir, vmId),
        fmt::format("{}/firecracker-{}.console.sock", dir, vmId),
        fmt::format("{}/firecracker-{}.log", dir, vmId),
    };
}

bool ConsolePaths::socketsFit() const noexcept {
    constexpr std::size_t limit = sizeof(sockaddr_un::sun_path);
    return apiSocket.size() < limit && consoleSocket.size() < limit;
}

} // namespace glidex
