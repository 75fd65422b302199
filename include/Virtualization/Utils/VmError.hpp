#pragma once

#include <string>
#include <system_error>

namespace glidex {

/// Error conditions surfaced by the VM registry to its callers
enum class VmErrc {
    Success = 0,
    NotFound,
    DuplicateName,
    InvalidConfig,
    InvalidTransition,
    SpawnError,
    ConfigurationError,
    ControlChannelError,
    ProcessCrashed,
    ConsoleUnavailable,
    IOError,
    StorageError
};

class VmErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "glidex.vm"; }
    std::string message(int condition) const override;
};

[[nodiscard]] const std::error_category& vm_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(VmErrc e) noexcept {
    return {static_cast<int>(e), vm_category()};
}

/// Short machine-readable tag for an error code ("not_found", "conflict", ...)
[[nodiscard]] const char* errorTag(VmErrc e) noexcept;

} // namespace glidex

namespace std {
template <>
struct is_error_code_enum<glidex::VmErrc> : true_type {};
}
