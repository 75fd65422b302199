#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <sys/types.h>

#include "Core/concurrency/EventDispatcher.hpp"
#include "Core/interfaces/IVmStore.hpp"
#include "Utils/Result.hpp"
#include "Virtualization/console/ConsoleProxy.hpp"
#include "Virtualization/console/ConsoleStream.hpp"
#include "Virtualization/vm/VirtualMachinePool.hpp"
#include "Virtualization/vm/VmStateMachine.hpp"
#include "Virtualization/vmm/ProcessSupervisor.hpp"
#include "Virtualization/vmm/VirtualMachineConfig.hpp"

namespace glidex {

struct ManagerOptions {
    // where control sockets, console sockets and console logs live
    std::string runtimeDir = "/tmp";
    SupervisorOptions supervisor;
    ConsoleOptions console;
    std::size_t consoleThreads = 2;
};

struct ConsoleInfo {
    std::string vmId;
    std::string consoleSocketPath;
    std::string logPath;
    // a client can attach right now
    bool available{false};
};

/// A hypervisor process went away without being asked to.
struct VmCrashEvent {
    std::string vmId;
    std::string name;
    pid_t pid{0};
    int waitStatus{0};
    std::string reason;
};

/**
 * @brief The VM registry.
 *
 * Owns every VM record and drives it through the lifecycle table in
 * VmStateMachine. One lock guards the pool; it is held while a request is
 * validated and marked in flight and while the outcome is committed, never
 * while a process is spawned, spoken to or torn down. A second request for a
 * VM that has a transition in flight is rejected, so transitions of one VM
 * are serialized while different VMs proceed independently.
 *
 * Hypervisor exits nobody asked for are picked up by a single notification
 * thread, which moves the VM to Stopped and reports a VmCrashEvent.
 */
class VirtualMachineManager {
public:
    using CrashCallback = std::function<void(const VmCrashEvent&)>;

    VirtualMachineManager(ManagerOptions options, std::shared_ptr<IVmStore> store);
    ~VirtualMachineManager();

    VirtualMachineManager(const VirtualMachineManager&) = delete;
    VirtualMachineManager& operator=(const VirtualMachineManager&) = delete;

    /// Load stored records; ones left mid-flight by a previous run become Stopped.
    [[nodiscard]] Result<void> initialize();

    /// Refuse new requests, let transitions in flight finish, then stop
    /// every VM that still has a hypervisor process.
    void shutdown();

    [[nodiscard]] Result<VmRecord> create(std::string name, VmConfig config);
    [[nodiscard]] std::vector<VmRecord> list() const;
    [[nodiscard]] Result<VmRecord> get(std::string_view idOrName) const;

    [[nodiscard]] Result<VmRecord> start(std::string_view idOrName);
    [[nodiscard]] Result<VmRecord> stop(std::string_view idOrName);
    [[nodiscard]] Result<VmRecord> pause(std::string_view idOrName);
    [[nodiscard]] Result<VmRecord> resume(std::string_view idOrName);
    [[nodiscard]] Result<void> remove(std::string_view idOrName);

    [[nodiscard]] Result<ConsoleStream> consoleConnect(std::string_view idOrName);
    [[nodiscard]] Result<std::string> consoleLog(std::string_view idOrName) const;
    [[nodiscard]] Result<ConsoleInfo> consoleInfo(std::string_view idOrName) const;

    [[nodiscard]] bool health() const noexcept { return !shutDown_.load(); }

    void setCrashCallback(CrashCallback callback);

    [[nodiscard]] const ProcessSupervisor& supervisor() const noexcept { return supervisor_; }
    [[nodiscard]] const ManagerOptions& options() const noexcept { return options_; }

private:
    // A request that passed validation and now owns the VM until committed.
    struct Claim {
        std::string id;
        VmRequest request;
        VmTransition transition;
        VmRecord record;
        HypervisorProcess* process{nullptr};
    };

    [[nodiscard]] Result<Claim> claim(std::string_view idOrName, VmRequest request);
    [[nodiscard]] Result<VmRecord> run(Claim claim);

    [[nodiscard]] Result<VmRecord> boot(const Claim& claim);
    [[nodiscard]] Result<VmRecord> abortBoot(const Claim& claim, std::unique_ptr<HypervisorProcess> process,
                                             std::shared_ptr<ConsoleProxy> console, VmErrc code,
                                             const std::string& what);
    [[nodiscard]] Result<VmRecord> control(const Claim& claim);
    [[nodiscard]] Result<VmRecord> halt(const Claim& claim);
    [[nodiscard]] Result<void> destroy(const Claim& claim);

    // Detach the console and terminate the process of a claimed VM.
    void releaseRuntime(const std::string& id);
    VmRecord commit(const std::string& id, VmState state);
    void persist(const VmRecord& record);

    void watchProcess(VmEntry& entry);
    void onProcessExit(const std::string& id, pid_t pid, int waitStatus);

    ManagerOptions options_;
    std::shared_ptr<IVmStore> store_;
    ProcessSupervisor supervisor_;

    std::unique_ptr<CONCURRENCY::EventDispatcher> consoleIo_;
    std::unique_ptr<CONCURRENCY::EventDispatcher> events_;

    mutable std::mutex mutex_;
    // signalled whenever a VM stops being busy
    std::condition_variable idle_;
    VirtualMachinePool pool_;
    CrashCallback onCrash_;
    std::atomic<bool> shutDown_{false};
};

} // namespace glidex
