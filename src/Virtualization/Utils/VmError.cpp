#include "Virtualization/Utils/VmError.hpp"

namespace glidex {

std::string VmErrorCategory::message(int condition) const {
    switch (static_cast<VmErrc>(condition)) {
        case VmErrc::Success: return "success";
        case VmErrc::NotFound: return "VM not found";
        case VmErrc::DuplicateName: return "VM name already in use";
        case VmErrc::InvalidConfig: return "invalid VM configuration";
        case VmErrc::InvalidTransition: return "invalid state transition";
        case VmErrc::SpawnError: return "failed to spawn hypervisor process";
        case VmErrc::ConfigurationError: return "hypervisor rejected configuration";
        case VmErrc::ControlChannelError: return "hypervisor control call failed";
        case VmErrc::ProcessCrashed: return "hypervisor process exited unexpectedly";
        case VmErrc::ConsoleUnavailable: return "console unavailable";
        case VmErrc::IOError: return "console I/O failure";
        case VmErrc::StorageError: return "record store failure";
    }
    return "unknown error";
}

const std::error_category& vm_category() noexcept {
    static VmErrorCategory category;
    return category;
}

const char* errorTag(VmErrc e) noexcept {
    switch (e) {
        case VmErrc::Success: return "ok";
        case VmErrc::NotFound: return "not_found";
        case VmErrc::DuplicateName: return "conflict";
        case VmErrc::InvalidConfig: return "invalid_config";
        case VmErrc::InvalidTransition: return "invalid_state";
        case VmErrc::SpawnError:
        case VmErrc::ConfigurationError:
        case VmErrc::ControlChannelError:
        case VmErrc::ProcessCrashed: return "firecracker_error";
        case VmErrc::ConsoleUnavailable: return "console_unavailable";
        case VmErrc::IOError: return "io_error";
        case VmErrc::StorageError: return "persistence_error";
    }
    return "internal_error";
}

} // namespace glidex
