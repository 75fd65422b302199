#pragma once
#include <optional>

#include "Virtualization/vm/VmRecord.hpp"

namespace glidex {

enum class VmRequest { Start, Stop, Pause, Resume, Delete };

[[nodiscard]] const char* toString(VmRequest request) noexcept;

/// What the registry has to do to carry a request out.
enum class VmAction {
    Boot,       // spawn + configure + InstanceStart, attach console
    Resume,     // PATCH vm Resumed
    Pause,      // PATCH vm Paused
    Shutdown,   // detach console, terminate process
    Destroy     // force-stop if alive, remove the record
};

struct VmTransition {
    VmAction action;
    VmState during;    // visible while the transition is in flight
    VmState onSuccess;
    VmState onFailure;
    bool requiresProcess;
};

/// Looks up the lifecycle table. std::nullopt means the request is not
/// allowed from `current`.
[[nodiscard]] std::optional<VmTransition> planTransition(VmState current, VmRequest request) noexcept;

/// Starting, Pausing, Stopping and Deleting are only ever seen mid-transition.
[[nodiscard]] constexpr bool isTransient(VmState state) noexcept {
    return state == VmState::Starting || state == VmState::Pausing ||
           state == VmState::Stopping || state == VmState::Deleting;
}

} // namespace glidex
