#include "Virtualization/vmm/HypervisorProcess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <fmt/format.h>

#include "System/Logger.hpp"

namespace glidex {

std::string describeWaitStatus(int waitStatus) {
    if (WIFEXITED(waitStatus)) return fmt::format("exit status {}", WEXITSTATUS(waitStatus));
    if (WIFSIGNALED(waitStatus)) return fmt::format("killed by signal {}", WTERMSIG(waitStatus));
    return fmt::format("wait status {:#x}", waitStatus);
}

HypervisorProcess::HypervisorProcess(std::string vmId, pid_t pid, std::string apiSocket)
    : vmId_(std::move(vmId)), pid_(pid), apiSocket_(std::move(apiSocket)) {
    reaper_ = std::thread([this] { reap(); });
}

HypervisorProcess::~HypervisorProcess() {
    if (!reaper_.joinable()) return;
    {
        std::scoped_lock lock(mutex_);
        if (!reaped_) {
            terminating_ = true;
            ::kill(pid_, SIGKILL);
        }
    }
    reaper_.join();
}

void HypervisorProcess::reap() {
    // Wait without reaping first: the pid must stay ours until kill() can no
    // longer race with it, which is why the actual reap happens under mutex_.
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) < 0) {
        if (errno != EINTR) break;
    }

    ExitCallback callback;
    int status = 0;
    {
        std::scoped_lock lock(mutex_);
        pid_t rc;
        do {
            rc = ::waitpid(pid_, &status, 0);
        } while (rc < 0 && errno == EINTR);
        if (rc < 0) {
            GXLOG_WARN("vm {}: waitpid({}) failed: {}", vmId_, pid_, std::strerror(errno));
        }
        reaped_ = true;
        status_ = status;
        if (!terminating_ && !notified_ && callback_) {
            notified_ = true;
            callback = callback_;
        }
    }
    exited_.notify_all();

    GXLOG_DEBUG("vm {}: hypervisor pid {} reaped ({})", vmId_, pid_, describeWaitStatus(status));
    if (callback) callback(status);
}

bool HypervisorProcess::hasExited() const {
    std::scoped_lock lock(mutex_);
    return reaped_;
}

std::optional<int> HypervisorProcess::exitStatus() const {
    std::scoped_lock lock(mutex_);
    if (!reaped_) return std::nullopt;
    return status_;
}

bool HypervisorProcess::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return exited_.wait_for(lock, timeout, [this] { return reaped_; });
}

void HypervisorProcess::waitForExit() {
    std::unique_lock lock(mutex_);
    exited_.wait(lock, [this] { return reaped_; });
}

void HypervisorProcess::kill(int signal) {
    std::scoped_lock lock(mutex_);
    if (reaped_) return;
    if (::kill(pid_, signal) < 0 && errno != ESRCH) {
        GXLOG_WARN("vm {}: kill({}, {}) failed: {}", vmId_, pid_, signal, std::strerror(errno));
    }
}

void HypervisorProcess::markTerminating() {
    std::scoped_lock lock(mutex_);
    terminating_ = true;
}

bool HypervisorProcess::terminating() const {
    std::scoped_lock lock(mutex_);
    return terminating_;
}

void HypervisorProcess::onUnexpectedExit(ExitCallback callback) {
    int status = 0;
    {
        std::scoped_lock lock(mutex_);
        if (notified_ || terminating_) return;
        if (!reaped_) {
            callback_ = std::move(callback);
            return;
        }
        notified_ = true;
        status = status_;
    }
    if (callback) callback(status);
}

} // namespace glidex
