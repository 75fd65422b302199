#include "Virtualization/vm/VmStateMachine.hpp"

namespace glidex {

const char* toString(VmRequest request) noexcept {
    switch (request) {
        case VmRequest::Start: return "start";
        case VmRequest::Stop: return "stop";
        case VmRequest::Pause: return "pause";
        case VmRequest::Resume: return "resume";
        case VmRequest::Delete: return "delete";
    }
    return "unknown";
}

std::optional<VmTransition> planTransition(VmState current, VmRequest request) noexcept {
    if (isTransient(current)) return std::nullopt;

    switch (request) {
        case VmRequest::Start:
            if (current == VmState::Created || current == VmState::Stopped) {
                return VmTransition{VmAction::Boot, VmState::Starting, VmState::Running, current, false};
            }
            if (current == VmState::Paused) {
                return VmTransition{VmAction::Resume, VmState::Paused, VmState::Running, VmState::Paused, true};
            }
            return std::nullopt;

        case VmRequest::Resume:
            if (current == VmState::Paused) {
                return VmTransition{VmAction::Resume, VmState::Paused, VmState::Running, VmState::Paused, true};
            }
            return std::nullopt;

        case VmRequest::Stop:
            if (current == VmState::Running) {
                return VmTransition{VmAction::Shutdown, VmState::Stopping, VmState::Stopped, VmState::Running, true};
            }
            return std::nullopt;

        case VmRequest::Pause:
            if (current == VmState::Running) {
                return VmTransition{VmAction::Pause, VmState::Pausing, VmState::Paused, VmState::Running, true};
            }
            return std::nullopt;

        case VmRequest::Delete:
            return VmTransition{VmAction::Destroy, VmState::Deleting, VmState::Deleting, current, false};
    }
    return std::nullopt;
}

} // namespace glidex
