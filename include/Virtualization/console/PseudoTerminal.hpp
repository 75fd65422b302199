#pragma once
#include <string>

namespace glidex {

/// Owns a pseudo-terminal pair. The controlling side is close-on-exec, the
/// subordinate side is meant to become a child's stdio and is dropped from
/// this process once the child holds it.
class PseudoTerminal {
public:
    // @throws ConsoleException
    PseudoTerminal();
    ~PseudoTerminal();

    PseudoTerminal(const PseudoTerminal&) = delete;
    PseudoTerminal& operator=(const PseudoTerminal&) = delete;
    PseudoTerminal(PseudoTerminal&& other) noexcept;
    PseudoTerminal& operator=(PseudoTerminal&& other) noexcept;

    [[nodiscard]] int controller() const noexcept { return controller_; }
    [[nodiscard]] int subordinate() const noexcept { return subordinate_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // Hand the controlling descriptor over to the caller.
    [[nodiscard]] int releaseController() noexcept;
    void closeSubordinate() noexcept;

private:
    int controller_{-1};
    int subordinate_{-1};
    std::string name_;
};

} // namespace glidex
