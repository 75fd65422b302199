#include "Virtualization/vmm/VirtualMachineManager.hpp"

#include <filesystem>
#include <utility>
#include <fmt/format.h>

#include "System/Logger.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace fs = std::filesystem;

namespace {

void removeFile(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) GXLOG_WARN("could not remove {}: {}", path, ec.message());
}

// same length as every allocated id
constexpr std::string_view kSampleId = "00000000-0000-0000-0000-000000000000";

std::string describe(const VmRecord& record) {
    return fmt::format("vm '{}' ({})", record.name, record.id);
}

} // namespace

VirtualMachineManager::VirtualMachineManager(ManagerOptions options, std::shared_ptr<IVmStore> store)
    : options_(std::move(options)),
      store_(std::move(store)),
      supervisor_(options_.supervisor),
      consoleIo_(std::make_unique<CONCURRENCY::EventDispatcher>(options_.consoleThreads, "console-io")),
      events_(std::make_unique<CONCURRENCY::EventDispatcher>(1, "vm-events"))
{
    GXLOG_INFO("VirtualMachineManager initialized (runtime dir {})", options_.runtimeDir);
}

VirtualMachineManager::~VirtualMachineManager() {
    shutdown();
    // exit notifications still queued refer to this object
    events_->stop();
    consoleIo_->stop();
    GXLOG_INFO("VirtualMachineManager destroyed");
}

Result<void> VirtualMachineManager::initialize() {
    std::error_code ec;
    fs::create_directories(options_.runtimeDir, ec);
    if (ec) {
        return fail(VmErrc::IOError, fmt::format("runtime directory {}: {}", options_.runtimeDir, ec.message()));
    }

    if (!ConsolePaths::forVm(options_.runtimeDir, kSampleId).socketsFit()) {
        return fail(VmErrc::InvalidConfig,
                    fmt::format("runtime directory {} is too long for a unix socket path", options_.runtimeDir));
    }

    auto loaded = store_->loadAll();
    if (!loaded) return std::unexpected(loaded.error());

    std::scoped_lock lock(mutex_);
    for (auto& record : *loaded) {
        record.paths = ConsolePaths::forVm(options_.runtimeDir, record.id);
        record.pid.reset();
        if (record.state != VmState::Created && record.state != VmState::Stopped) {
            GXLOG_WARN("{} was {} when the previous run ended, marking it stopped", describe(record),
                       toString(record.state));
            removeFile(record.paths.apiSocket);
            removeFile(record.paths.consoleSocket);
            record.state = VmState::Stopped;
            persist(record);
        }
        pool_.insert(std::move(record));
    }
    GXLOG_INFO("loaded {} vm record(s)", pool_.size());
    return {};
}

void VirtualMachineManager::shutdown() {
    if (shutDown_.exchange(true)) return;

    std::vector<std::string> live;
    {
        std::unique_lock lock(mutex_);
        idle_.wait(lock, [this] {
            bool busy = false;
            pool_.forEach([&](VmEntry& entry) { busy = busy || entry.busy; });
            return !busy;
        });
        pool_.forEach([&](VmEntry& entry) {
            if (!entry.process) return;
            entry.busy = true;
            entry.record.state = VmState::Stopping;
            live.push_back(entry.record.id);
        });
    }
    for (const auto& id : live) {
        releaseRuntime(id);
        commit(id, VmState::Stopped);
    }
    if (!live.empty()) GXLOG_INFO("shutdown: stopped {} vm(s)", live.size());
}

void VirtualMachineManager::setCrashCallback(CrashCallback callback) {
    std::scoped_lock lock(mutex_);
    onCrash_ = std::move(callback);
}

Result<VmRecord> VirtualMachineManager::create(std::string name, VmConfig config) {
    if (name.empty()) return fail(VmErrc::InvalidConfig, "vm name must not be empty");
    if (auto valid = config.validate(); !valid) {
        return fail(VmErrc::InvalidConfig, fmt::format("vm '{}': {}", name, valid.error().message()));
    }

    std::scoped_lock lock(mutex_);
    if (shutDown_) return fail(VmErrc::InvalidTransition, "registry is shutting down");
    if (pool_.nameInUse(name)) {
        return fail(VmErrc::DuplicateName, fmt::format("a vm named '{}' already exists", name));
    }

    VmRecord record;
    record.id = pool_.allocateId();
    record.name = std::move(name);
    record.config = std::move(config);
    record.state = VmState::Created;
    record.paths = ConsolePaths::forVm(options_.runtimeDir, record.id);

    if (auto saved = store_->save(record); !saved) {
        GXLOG_ERROR("{}: not created: {}", describe(record), saved.error().message());
        return std::unexpected(saved.error());
    }
    pool_.insert(record);
    GXLOG_INFO("{} created ({} vcpu, {} MiB)", describe(record), record.config.vcpuCount,
               record.config.memSizeMib);
    return record;
}

std::vector<VmRecord> VirtualMachineManager::list() const {
    std::scoped_lock lock(mutex_);
    return pool_.snapshot();
}

Result<VmRecord> VirtualMachineManager::get(std::string_view idOrName) const {
    std::scoped_lock lock(mutex_);
    const auto* entry = pool_.find(idOrName);
    if (!entry) return fail(VmErrc::NotFound, fmt::format("vm '{}' not found", idOrName));
    return entry->snapshot();
}

Result<VmRecord> VirtualMachineManager::start(std::string_view idOrName) {
    auto claimed = claim(idOrName, VmRequest::Start);
    if (!claimed) return std::unexpected(claimed.error());
    return run(std::move(*claimed));
}

Result<VmRecord> VirtualMachineManager::stop(std::string_view idOrName) {
    auto claimed = claim(idOrName, VmRequest::Stop);
    if (!claimed) return std::unexpected(claimed.error());
    return run(std::move(*claimed));
}

Result<VmRecord> VirtualMachineManager::pause(std::string_view idOrName) {
    auto claimed = claim(idOrName, VmRequest::Pause);
    if (!claimed) return std::unexpected(claimed.error());
    return run(std::move(*claimed));
}

Result<VmRecord> VirtualMachineManager::resume(std::string_view idOrName) {
    auto claimed = claim(idOrName, VmRequest::Resume);
    if (!claimed) return std::unexpected(claimed.error());
    return run(std::move(*claimed));
}

Result<void> VirtualMachineManager::remove(std::string_view idOrName) {
    auto claimed = claim(idOrName, VmRequest::Delete);
    if (!claimed) return std::unexpected(claimed.error());
    return destroy(*claimed);
}

Result<VirtualMachineManager::Claim> VirtualMachineManager::claim(std::string_view idOrName, VmRequest request) {
    std::scoped_lock lock(mutex_);
    auto* entry = pool_.find(idOrName);
    if (!entry) return fail(VmErrc::NotFound, fmt::format("vm '{}' not found", idOrName));
    if (shutDown_) {
        return fail(VmErrc::InvalidTransition,
                    fmt::format("registry is shutting down: cannot {} vm '{}'", toString(request), idOrName));
    }

    const auto& record = entry->record;
    if (entry->busy) {
        return fail(VmErrc::InvalidTransition,
                    fmt::format("{} is {} with a transition in progress: cannot {}", describe(record),
                                toString(record.state), toString(request)));
    }

    auto transition = planTransition(record.state, request);
    if (!transition) {
        return fail(VmErrc::InvalidTransition,
                    fmt::format("{} is {}: cannot {}", describe(record), toString(record.state), toString(request)));
    }
    if (transition->requiresProcess && (!entry->process || entry->process->hasExited())) {
        return fail(VmErrc::InvalidTransition,
                    fmt::format("{} is {} but has no live hypervisor process: cannot {}", describe(record),
                                toString(record.state), toString(request)));
    }

    entry->busy = true;
    entry->exitedDuringTransition = false;
    entry->record.state = transition->during;
    GXLOG_DEBUG("{}: {} -> {}", describe(record), toString(request), toString(transition->during));

    return Claim{entry->record.id, request, *transition, entry->record, entry->process.get()};
}

Result<VmRecord> VirtualMachineManager::run(Claim claim) {
    switch (claim.transition.action) {
        case VmAction::Boot: return boot(claim);
        case VmAction::Resume:
        case VmAction::Pause: return control(claim);
        case VmAction::Shutdown: return halt(claim);
        case VmAction::Destroy: break;
    }
    commit(claim.id, claim.transition.onFailure);
    return fail(VmErrc::InvalidTransition, fmt::format("vm {}: unexpected {}", claim.id, toString(claim.request)));
}

Result<VmRecord> VirtualMachineManager::boot(const Claim& claim) {
    const auto& record = claim.record;
    std::shared_ptr<ConsoleProxy> console;
    std::unique_ptr<HypervisorProcess> process;
    try {
        console = ConsoleProxy::create(consoleIo_->get_executor(), record.id, record.paths, options_.console);
        process = supervisor_.spawn(record.id, record.config, record.paths, console->subordinateFd());
        console->releaseSubordinate();
        console->start();
        supervisor_.configure(*process, record.config);
        supervisor_.startInstance(*process);
    } catch (const VmException& e) {
        return abortBoot(claim, std::move(process), std::move(console), e.code(), e.what());
    } catch (const std::exception& e) {
        return abortBoot(claim, std::move(process), std::move(console), VmErrc::IOError, e.what());
    }

    std::scoped_lock lock(mutex_);
    auto* entry = pool_.findById(claim.id);
    entry->process = std::move(process);
    entry->console = std::move(console);
    entry->record.state = claim.transition.onSuccess;
    entry->busy = false;
    entry->exitedDuringTransition = false;
    persist(entry->record);
    watchProcess(*entry);
    idle_.notify_all();

    auto snapshot = entry->snapshot();
    GXLOG_INFO("{} running, hypervisor pid {}", describe(snapshot), entry->process->pid());
    return snapshot;
}

Result<VmRecord> VirtualMachineManager::abortBoot(const Claim& claim, std::unique_ptr<HypervisorProcess> process,
                                                  std::shared_ptr<ConsoleProxy> console, VmErrc code,
                                                  const std::string& what) {
    // the process goes first: closing its controlling terminal would hang it up
    if (process) supervisor_.terminate(*process);
    if (console) console->stop();
    commit(claim.id, claim.transition.onFailure);
    GXLOG_ERROR("{}: start failed: {}", describe(claim.record), what);
    return fail(code, fmt::format("{}: start failed: {}", describe(claim.record), what));
}

Result<VmRecord> VirtualMachineManager::control(const Claim& claim) {
    try {
        if (claim.transition.action == VmAction::Pause) {
            supervisor_.pause(*claim.process);
        } else {
            supervisor_.resume(*claim.process);
        }
    } catch (const VmException& e) {
        commit(claim.id, claim.transition.onFailure);
        GXLOG_ERROR("{}: {} failed: {}", describe(claim.record), toString(claim.request), e.what());
        return fail(VmErrc::ControlChannelError,
                    fmt::format("{}: {} failed: {}", describe(claim.record), toString(claim.request), e.what()));
    }
    auto snapshot = commit(claim.id, claim.transition.onSuccess);
    GXLOG_INFO("{} {}", describe(snapshot), toString(snapshot.state));
    return snapshot;
}

Result<VmRecord> VirtualMachineManager::halt(const Claim& claim) {
    releaseRuntime(claim.id);
    auto snapshot = commit(claim.id, claim.transition.onSuccess);
    GXLOG_INFO("{} stopped", describe(snapshot));
    return snapshot;
}

Result<void> VirtualMachineManager::destroy(const Claim& claim) {
    releaseRuntime(claim.id);
    removeFile(claim.record.paths.consoleSocket);
    removeFile(claim.record.paths.apiSocket);

    std::scoped_lock lock(mutex_);
    auto* entry = pool_.findById(claim.id);
    if (auto removed = store_->remove(claim.id); !removed) {
        entry->record.state = VmState::Stopped;
        entry->busy = false;
        idle_.notify_all();
        GXLOG_ERROR("{}: delete failed: {}", describe(entry->record), removed.error().message());
        return fail(VmErrc::StorageError,
                    fmt::format("{}: delete failed: {}", describe(entry->record), removed.error().message()));
    }
    pool_.erase(claim.id);
    idle_.notify_all();
    GXLOG_INFO("{} deleted, console log kept at {}", describe(claim.record), claim.record.paths.logFile);
    return {};
}

void VirtualMachineManager::releaseRuntime(const std::string& id) {
    std::unique_ptr<HypervisorProcess> process;
    std::shared_ptr<ConsoleProxy> console;
    {
        std::scoped_lock lock(mutex_);
        auto* entry = pool_.findById(id);
        if (!entry) return;
        process = std::move(entry->process);
        console = std::move(entry->console);
    }
    // Graceful stop while the guest still has its terminal, then drain what
    // it printed on the way down.
    if (process) supervisor_.terminate(*process);
    if (console) console->stop();
}

VmRecord VirtualMachineManager::commit(const std::string& id, VmState state) {
    std::scoped_lock lock(mutex_);
    auto* entry = pool_.findById(id);
    entry->record.state = state;
    entry->busy = false;
    persist(entry->record);
    idle_.notify_all();

    bool recover = std::exchange(entry->exitedDuringTransition, false);
    if (recover && entry->process) {
        if (auto status = entry->process->exitStatus()) {
            auto pid = entry->process->pid();
            events_->dispatch([this, id, pid, status = *status] { onProcessExit(id, pid, status); });
        }
    }
    return entry->snapshot();
}

void VirtualMachineManager::persist(const VmRecord& record) {
    if (auto saved = store_->save(record); !saved) {
        GXLOG_WARN("{}: state {} not persisted: {}", describe(record), toString(record.state),
                   saved.error().message());
    }
}

void VirtualMachineManager::watchProcess(VmEntry& entry) {
    auto id = entry.record.id;
    auto pid = entry.process->pid();
    supervisor_.watch(*entry.process, [this, id, pid](int waitStatus) {
        events_->dispatch([this, id, pid, waitStatus] { onProcessExit(id, pid, waitStatus); });
    });
}

void VirtualMachineManager::onProcessExit(const std::string& id, pid_t pid, int waitStatus) {
    {
        std::scoped_lock lock(mutex_);
        auto* entry = pool_.findById(id);
        if (!entry || !entry->process || entry->process->pid() != pid) return;
        if (entry->busy) {
            entry->exitedDuringTransition = true;
            return;
        }
        entry->busy = true;
        entry->record.state = VmState::Stopping;
    }

    releaseRuntime(id);
    auto snapshot = commit(id, VmState::Stopped);

    VmCrashEvent event{id, snapshot.name, pid, waitStatus, describeWaitStatus(waitStatus)};
    GXLOG_WARN("{}: hypervisor pid {} exited unexpectedly ({}), vm stopped", describe(snapshot), pid,
               event.reason);

    CrashCallback callback;
    {
        std::scoped_lock lock(mutex_);
        callback = onCrash_;
    }
    if (callback) callback(event);
}

Result<ConsoleStream> VirtualMachineManager::consoleConnect(std::string_view idOrName) {
    std::string path;
    {
        std::scoped_lock lock(mutex_);
        const auto* entry = pool_.find(idOrName);
        if (!entry) return fail(VmErrc::NotFound, fmt::format("vm '{}' not found", idOrName));
        if (entry->record.state != VmState::Running || !entry->console) {
            return fail(VmErrc::ConsoleUnavailable,
                        fmt::format("{} is {}: console is only available while running", describe(entry->record),
                                    toString(entry->record.state)));
        }
        path = entry->record.paths.consoleSocket;
    }
    try {
        return ConsoleStream::connect(path);
    } catch (const ConsoleException& e) {
        return fail(VmErrc::ConsoleUnavailable, fmt::format("vm '{}': {}", idOrName, e.what()));
    }
}

Result<std::string> VirtualMachineManager::consoleLog(std::string_view idOrName) const {
    std::string path;
    {
        std::scoped_lock lock(mutex_);
        const auto* entry = pool_.find(idOrName);
        if (!entry) return fail(VmErrc::NotFound, fmt::format("vm '{}' not found", idOrName));
        path = entry->record.paths.logFile;
    }
    try {
        return ConsoleLogger::readAll(path);
    } catch (const ConsoleException& e) {
        return fail(VmErrc::IOError, fmt::format("vm '{}': {}", idOrName, e.what()));
    }
}

Result<ConsoleInfo> VirtualMachineManager::consoleInfo(std::string_view idOrName) const {
    std::scoped_lock lock(mutex_);
    const auto* entry = pool_.find(idOrName);
    if (!entry) return fail(VmErrc::NotFound, fmt::format("vm '{}' not found", idOrName));
    return ConsoleInfo{entry->record.id, entry->record.paths.consoleSocket, entry->record.paths.logFile,
                       entry->record.state == VmState::Running && entry->console != nullptr};
}

} // namespace glidex
