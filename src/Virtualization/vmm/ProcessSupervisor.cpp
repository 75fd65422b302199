#include "Virtualization/vmm/ProcessSupervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/ioctl.h>
#include <thread>
#include <unistd.h>
#include <vector>
#include <boost/beast/http/verb.hpp>
#include <fmt/format.h>

#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace fs = std::filesystem;

namespace {

void requireFile(const std::string& vmId, const char* what, const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw SpawnException(fmt::format("vm {}: {} not found: {}", vmId, what, path));
    }
}

// Child side of fork(): async-signal-safe calls only.
[[noreturn]] void execHypervisor(char* const argv[], int consoleFd, int errorFd, long maxFd) {
    ::setsid();
    if (consoleFd >= 0) {
        ::ioctl(consoleFd, TIOCSCTTY, 0);
        ::dup2(consoleFd, STDIN_FILENO);
        ::dup2(consoleFd, STDOUT_FILENO);
        ::dup2(consoleFd, STDERR_FILENO);
        if (consoleFd > STDERR_FILENO) ::close(consoleFd);
    }

    if (::close_range(3, ~0U, CLOSE_RANGE_CLOEXEC) < 0) {
        for (long fd = 3; fd < maxFd; ++fd) {
            if (fd == errorFd) continue;
            int flags = ::fcntl(static_cast<int>(fd), F_GETFD);
            if (flags >= 0) ::fcntl(static_cast<int>(fd), F_SETFD, flags | FD_CLOEXEC);
        }
    }

    sigset_t none;
    ::sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    ::execv(argv[0], argv);

    int err = errno;
    [[maybe_unused]] auto n = ::write(errorFd, &err, sizeof(err));
    ::_exit(127);
}

} // namespace

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options) : options_(std::move(options)) {}

std::string ProcessSupervisor::resolveBinary() const {
    const auto& binary = options_.hypervisorBinary;
    if (binary.empty()) throw SpawnException("no hypervisor binary configured");

    if (binary.find('/') != std::string::npos) {
        if (::access(binary.c_str(), X_OK) != 0) {
            throw SpawnException(fmt::format("hypervisor binary {} is not executable: {}", binary,
                                             std::strerror(errno)));
        }
        return binary;
    }

    const char* path = std::getenv("PATH");
    std::string_view dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);
        if (dir.empty()) continue;
        auto candidate = fmt::format("{}/{}", dir, binary);
        if (::access(candidate.c_str(), X_OK) == 0) return candidate;
    }
    throw SpawnException(fmt::format("hypervisor binary {} not found in PATH", binary));
}

void ProcessSupervisor::track(const std::string& vmId, int delta) {
    std::scoped_lock lock(mutex_);
    auto& count = live_[vmId];
    count += delta;
    if (count <= 0) live_.erase(vmId);
}

int ProcessSupervisor::liveProcessCount(const std::string& vmId) const {
    std::scoped_lock lock(mutex_);
    auto it = live_.find(vmId);
    return it == live_.end() ? 0 : it->second;
}

std::unique_ptr<HypervisorProcess> ProcessSupervisor::spawn(const std::string& vmId, const VmConfig& config,
                                                            const ConsolePaths& paths, int consoleFd) {
    auto binary = resolveBinary();
    requireFile(vmId, "kernel image", config.kernelImagePath);
    requireFile(vmId, "root filesystem", config.rootfsPath);

    std::error_code ec;
    fs::remove(paths.apiSocket, ec);

    std::vector<std::string> args{binary, "--api-sock", paths.apiSocket};
    std::vector<char*> argv;
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);
    const long maxFd = ::sysconf(_SC_OPEN_MAX) > 0 ? ::sysconf(_SC_OPEN_MAX) : 1024;

    int errorPipe[2];
    if (::pipe2(errorPipe, O_CLOEXEC) < 0) {
        throw SpawnException(fmt::format("vm {}: pipe: {}", vmId, std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        throw SpawnException(fmt::format("vm {}: fork: {}", vmId, std::strerror(err)));
    }
    if (pid == 0) {
        ::close(errorPipe[0]);
        execHypervisor(argv.data(), consoleFd, errorPipe[1], maxFd);
    }

    ::close(errorPipe[1]);
    auto process = std::make_unique<HypervisorProcess>(vmId, pid, paths.apiSocket);
    track(vmId, 1);

    int execError = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &execError, sizeof(execError));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n > 0) {
        terminate(*process);
        throw SpawnException(fmt::format("vm {}: exec {}: {}", vmId, binary, std::strerror(execError)));
    }

    GXLOG_INFO("vm {}: hypervisor started, pid {}", vmId, pid);

    auto deadline = std::chrono::steady_clock::now() + options_.apiSocketTimeout;
    while (!fs::exists(paths.apiSocket, ec)) {
        if (auto status = process->exitStatus()) {
            terminate(*process);
            throw SpawnException(fmt::format("vm {}: hypervisor exited during startup ({})", vmId,
                                             describeWaitStatus(*status)));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            terminate(*process);
            throw SpawnException(fmt::format("vm {}: control socket {} did not appear within {} ms", vmId,
                                             paths.apiSocket, options_.apiSocketTimeout.count()));
        }
        std::this_thread::sleep_for(options_.apiSocketPoll);
    }
    return process;
}

HypervisorConnector ProcessSupervisor::connectorFor(const HypervisorProcess& process) const {
    return HypervisorConnector(process.apiSocket(), options_.requestTimeout);
}

void ProcessSupervisor::expectSuccess(const HypervisorProcess& process, const char* what,
                                      const ControlResponse& response) const {
    if (response.ok()) return;
    throw ControlChannelException(fmt::format("vm {}: {} rejected with HTTP {}: {}", process.vmId(), what,
                                              response.status, response.faultMessage()),
                                  response.status, response.body);
}

void ProcessSupervisor::configure(HypervisorProcess& process, const VmConfig& config) {
    auto connector = connectorFor(process);

    auto step = [&](const char* name, auto&& call) {
        ControlResponse response;
        try {
            response = call();
        } catch (const ControlChannelException& e) {
            throw ConfigurationException(name, e.what());
        }
        if (!response.ok()) {
            throw ConfigurationException(name, fmt::format("HTTP {}: {}", response.status, response.faultMessage()));
        }
        GXLOG_DEBUG("vm {}: {} applied", process.vmId(), name);
    };

    step("machine-config", [&] { return connector.putMachineConfig(config.vcpuCount, config.memSizeMib); });
    step("boot-source", [&] { return connector.putBootSource(config.kernelImagePath, config.effectiveKernelArgs()); });
    step("drives/rootfs", [&] { return connector.putDrive("rootfs", config.rootfsPath, true, false); });
}

void ProcessSupervisor::startInstance(HypervisorProcess& process) {
    auto connector = connectorFor(process);
    expectSuccess(process, "InstanceStart", connector.putAction("InstanceStart"));
}

void ProcessSupervisor::pause(HypervisorProcess& process) {
    auto connector = connectorFor(process);
    expectSuccess(process, "pause", connector.patchVmState("Paused"));
}

void ProcessSupervisor::resume(HypervisorProcess& process) {
    auto connector = connectorFor(process);
    expectSuccess(process, "resume", connector.patchVmState("Resumed"));
}

void ProcessSupervisor::terminate(HypervisorProcess& process) noexcept {
    if (process.terminating()) {
        process.waitForExit();
        return;
    }
    process.markTerminating();

    if (!process.hasExited()) {
        try {
            auto connector = HypervisorConnector(process.apiSocket(), std::min(options_.requestTimeout,
                                                                                options_.shutdownGrace));
            auto response = connector.putAction("SendCtrlAltDel");
            if (!response.ok()) {
                GXLOG_DEBUG("vm {}: SendCtrlAltDel answered HTTP {}", process.vmId(), response.status);
            }
        } catch (const VmException& e) {
            GXLOG_DEBUG("vm {}: graceful shutdown request failed: {}", process.vmId(), e.what());
        } catch (const std::exception& e) {
            GXLOG_WARN("vm {}: graceful shutdown request failed: {}", process.vmId(), e.what());
        }

        if (!process.waitForExit(options_.shutdownGrace)) {
            GXLOG_WARN("vm {}: hypervisor pid {} still alive after {} ms, killing", process.vmId(),
                       process.pid(), options_.shutdownGrace.count());
            process.kill(SIGKILL);
        }
    }
    process.waitForExit();

    std::error_code ec;
    fs::remove(process.apiSocket(), ec);
    track(process.vmId(), -1);
    GXLOG_INFO("vm {}: hypervisor pid {} terminated", process.vmId(), process.pid());
}

void ProcessSupervisor::watch(HypervisorProcess& process, HypervisorProcess::ExitCallback callback) {
    process.onUnexpectedExit(std::move(callback));
}

} // namespace glidex
