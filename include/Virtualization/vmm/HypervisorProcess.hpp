#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <sys/types.h>

namespace glidex {

/**
 * @brief Handle to one live hypervisor child process.
 *
 * A reaper thread waits for the child and collects its exit status, so the
 * pid stays valid (never recycled) until hasExited() turns true. Owned by the
 * registry entry of the VM it runs; destroying a handle whose child is still
 * alive kills and reaps it.
 */
class HypervisorProcess {
public:
    /// Receives the raw wait status of an exit nobody asked for.
    using ExitCallback = std::function<void(int waitStatus)>;

    HypervisorProcess(std::string vmId, pid_t pid, std::string apiSocket);
    ~HypervisorProcess();

    HypervisorProcess(const HypervisorProcess&) = delete;
    HypervisorProcess& operator=(const HypervisorProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& vmId() const noexcept { return vmId_; }
    [[nodiscard]] const std::string& apiSocket() const noexcept { return apiSocket_; }

    [[nodiscard]] bool hasExited() const;
    [[nodiscard]] std::optional<int> exitStatus() const;

    // true once the child has been reaped
    bool waitForExit(std::chrono::milliseconds timeout);
    void waitForExit();

    // No-op once the child has been reaped.
    void kill(int signal);

    // From here on an exit is expected and no longer reported to the watcher.
    void markTerminating();
    [[nodiscard]] bool terminating() const;

    // Fires at most once; immediately when the unexpected exit already happened.
    void onUnexpectedExit(ExitCallback callback);

private:
    void reap();

    std::string vmId_;
    pid_t pid_;
    std::string apiSocket_;

    mutable std::mutex mutex_;
    std::condition_variable exited_;
    bool reaped_{false};
    int status_{0};
    bool terminating_{false};
    bool notified_{false};
    ExitCallback callback_;

    std::thread reaper_;
};

/// "exit status 3", "killed by signal 9"
[[nodiscard]] std::string describeWaitStatus(int waitStatus);

} // namespace glidex
