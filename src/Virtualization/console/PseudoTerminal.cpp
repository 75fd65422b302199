#include "Virtualization/console/PseudoTerminal.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <pty.h>
#include <termios.h>
#include <unistd.h>
#include <utility>

#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

PseudoTerminal::PseudoTerminal() {
    char path[PATH_MAX] = {};
    if (::openpty(&controller_, &subordinate_, path, nullptr, nullptr) < 0) {
        throw ConsoleException(std::string("openpty: ") + std::strerror(errno));
    }
    name_ = path;

    // Raw mode: the guest's serial line does its own echo and line editing.
    termios attrs{};
    if (::tcgetattr(subordinate_, &attrs) == 0) {
        ::cfmakeraw(&attrs);
        ::tcsetattr(subordinate_, TCSANOW, &attrs);
    }

    for (int fd : {controller_, subordinate_}) {
        int flags = ::fcntl(fd, F_GETFD);
        if (flags < 0 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) < 0) {
            int err = errno;
            ::close(controller_);
            ::close(subordinate_);
            throw ConsoleException(std::string("fcntl(FD_CLOEXEC): ") + std::strerror(err));
        }
    }
}

PseudoTerminal::~PseudoTerminal() {
    if (controller_ >= 0) ::close(controller_);
    closeSubordinate();
}

PseudoTerminal::PseudoTerminal(PseudoTerminal&& other) noexcept
    : controller_(std::exchange(other.controller_, -1)),
      subordinate_(std::exchange(other.subordinate_, -1)),
      name_(std::move(other.name_)) {}

PseudoTerminal& PseudoTerminal::operator=(PseudoTerminal&& other) noexcept {
    if (this != &other) {
        if (controller_ >= 0) ::close(controller_);
        closeSubordinate();
        controller_ = std::exchange(other.controller_, -1);
        subordinate_ = std::exchange(other.subordinate_, -1);
        name_ = std::move(other.name_);
    }
    return *this;
}

int PseudoTerminal::releaseController() noexcept {
    return std::exchange(controller_, -1);
}

void PseudoTerminal::closeSubordinate() noexcept {
    if (subordinate_ >= 0) {
        ::close(subordinate_);
        subordinate_ = -1;
    }
}

} // namespace glidex
