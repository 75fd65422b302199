#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "Virtualization/vm/VmRecord.hpp"
#include "Virtualization/vmm/HypervisorConnector.hpp"
#include "Virtualization/vmm/HypervisorProcess.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

namespace glidex {

struct SupervisorOptions {
    // absolute path, or a name looked up in PATH
    std::string hypervisorBinary = "firecracker";
    std::chrono::milliseconds apiSocketTimeout{5000};
    std::chrono::milliseconds apiSocketPoll{100};
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds shutdownGrace{3000};
};

/**
 * @brief Spawns, drives and tears down hypervisor processes.
 *
 * Stateless apart from the live-process bookkeeping: every call takes the
 * HypervisorProcess it acts on. Failures surface as VmException subclasses.
 *
 * @code
 * ProcessSupervisor supervisor(options);
 * auto process = supervisor.spawn(id, config, paths, pty.subordinate());
 * supervisor.configure(*process, config);
 * supervisor.startInstance(*process);
 * ...
 * supervisor.terminate(*process);
 * @endcode
 */
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief Launch `<binary> --api-sock <paths.apiSocket>` for a VM.
     *
     * The child gets a new session, @p consoleFd as stdin/stdout/stderr and
     * controlling terminal, and no other inherited descriptors. Returns once
     * the control socket exists.
     *
     * @throws SpawnException missing binary or images, fork/exec failure,
     *         control socket not up in time. Any forked child is reaped first.
     */
    [[nodiscard]] std::unique_ptr<HypervisorProcess> spawn(const std::string& vmId, const VmConfig& config,
                                                           const ConsolePaths& paths, int consoleFd);

    /// machine-config, boot-source, rootfs drive, in that order.
    /// @throws ConfigurationException naming the failing step
    void configure(HypervisorProcess& process, const VmConfig& config);

    // @throws ControlChannelException
    void startInstance(HypervisorProcess& process);
    void pause(HypervisorProcess& process);
    void resume(HypervisorProcess& process);

    /// Graceful stop, SIGKILL after the grace period, reap, remove the
    /// control socket. Never throws.
    void terminate(HypervisorProcess& process) noexcept;

    /// Report an exit not caused by terminate(), exactly once.
    void watch(HypervisorProcess& process, HypervisorProcess::ExitCallback callback);

    // spawned and not yet terminated
    [[nodiscard]] int liveProcessCount(const std::string& vmId) const;

    [[nodiscard]] const SupervisorOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] std::string resolveBinary() const;
    [[nodiscard]] HypervisorConnector connectorFor(const HypervisorProcess& process) const;
    void expectSuccess(const HypervisorProcess& process, const char* what, const ControlResponse& response) const;
    void track(const std::string& vmId, int delta);

    SupervisorOptions options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, int> live_;
};

} // namespace glidex
