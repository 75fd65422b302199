#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <latch>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "Virtualization/Storage/MemoryVmStore.hpp"

using namespace glidex;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

std::string slurp(const std::string& path) {
    std::ifstream in(path);
    std::stringstream out;
    out << in.rdbuf();
    return out.str();
}

// Runs @p request from @p threads threads released at the same moment.
template <typename Request>
auto racing(std::size_t threads, Request request) {
    using Outcome = decltype(request(std::size_t{0}));
    std::vector<std::optional<Outcome>> outcomes(threads);
    std::latch gate(static_cast<std::ptrdiff_t>(threads));
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
        workers.emplace_back([&, i] {
            gate.arrive_and_wait();
            outcomes[i].emplace(request(i));
        });
    }
    for (auto& worker : workers) worker.join();
    std::vector<Outcome> out;
    for (auto& outcome : outcomes) out.push_back(std::move(*outcome));
    return out;
}

class VirtualMachineManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_shared<MemoryVmStore>();
        manager = std::make_unique<VirtualMachineManager>(test::fakeManagerOptions(dir), store);
        ASSERT_TRUE(manager->initialize());
    }

    VmRecord created(const std::string& name) {
        auto record = manager->create(name, test::fakeVmConfig(dir));
        EXPECT_TRUE(record) << record.error().what();
        return *record;
    }

    test::TempDir dir;
    std::shared_ptr<MemoryVmStore> store;
    std::unique_ptr<VirtualMachineManager> manager;
};

} // namespace

TEST_F(VirtualMachineManagerTest, CreateAssignsIdAndPersists) {
    auto record = created("web");
    EXPECT_FALSE(record.id.empty());
    EXPECT_EQ(record.name, "web");
    EXPECT_EQ(record.state, VmState::Created);
    EXPECT_FALSE(record.pid);
    EXPECT_EQ(record.paths, ConsolePaths::forVm(dir.path(), record.id));
    EXPECT_EQ(store->size(), 1u);

    auto byName = manager->get("web");
    ASSERT_TRUE(byName);
    EXPECT_EQ(byName->id, record.id);
}

TEST_F(VirtualMachineManagerTest, DuplicateNameIsRejected) {
    created("web");
    auto again = manager->create("web", test::fakeVmConfig(dir));
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().errc(), VmErrc::DuplicateName);
    EXPECT_EQ(manager->list().size(), 1u);
}

TEST_F(VirtualMachineManagerTest, InvalidConfigIsRejected) {
    auto config = test::fakeVmConfig(dir);
    config.vcpuCount = 0;
    auto bad = manager->create("web", config);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().errc(), VmErrc::InvalidConfig);

    auto unnamed = manager->create("", test::fakeVmConfig(dir));
    ASSERT_FALSE(unnamed);
    EXPECT_EQ(unnamed.error().errc(), VmErrc::InvalidConfig);
    EXPECT_TRUE(manager->list().empty());
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(VirtualMachineManagerTest, StoreFailureLeavesNoRecord) {
    store->setFailing(true);
    auto record = manager->create("web", test::fakeVmConfig(dir));
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().errc(), VmErrc::StorageError);
    EXPECT_TRUE(manager->list().empty());
}

TEST_F(VirtualMachineManagerTest, ListKeepsCreationOrder) {
    created("a");
    created("b");
    created("c");
    auto all = manager->list();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].name, "a");
    EXPECT_EQ(all[1].name, "b");
    EXPECT_EQ(all[2].name, "c");
}

TEST_F(VirtualMachineManagerTest, UnknownVmIsNotFound) {
    EXPECT_EQ(manager->get("ghost").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->start("ghost").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->stop("ghost").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->remove("ghost").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->consoleLog("ghost").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->consoleInfo("ghost").error().errc(), VmErrc::NotFound);
}

TEST_F(VirtualMachineManagerTest, FullLifecycle) {
    auto vm = created("web");

    auto running = manager->start("web");
    ASSERT_TRUE(running) << running.error().what();
    EXPECT_EQ(running->state, VmState::Running);
    ASSERT_TRUE(running->pid);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 1);
    EXPECT_TRUE(fs::exists(vm.paths.consoleSocket));

    auto again = manager->start("web");
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().errc(), VmErrc::InvalidTransition);

    auto paused = manager->pause(vm.id);
    ASSERT_TRUE(paused) << paused.error().what();
    EXPECT_EQ(paused->state, VmState::Paused);
    EXPECT_EQ(paused->pid, running->pid);

    auto stopWhilePaused = manager->stop("web");
    ASSERT_FALSE(stopWhilePaused);
    EXPECT_EQ(stopWhilePaused.error().errc(), VmErrc::InvalidTransition);
    EXPECT_EQ(manager->get("web")->state, VmState::Paused);

    auto resumed = manager->resume("web");
    ASSERT_TRUE(resumed) << resumed.error().what();
    EXPECT_EQ(resumed->state, VmState::Running);

    auto stopped = manager->stop("web");
    ASSERT_TRUE(stopped) << stopped.error().what();
    EXPECT_EQ(stopped->state, VmState::Stopped);
    EXPECT_FALSE(stopped->pid);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
    EXPECT_FALSE(fs::exists(vm.paths.apiSocket));

    auto restarted = manager->start("web");
    ASSERT_TRUE(restarted) << restarted.error().what();
    EXPECT_NE(restarted->pid, running->pid);

    ASSERT_TRUE(manager->remove("web"));
    EXPECT_EQ(manager->get("web").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(VirtualMachineManagerTest, StartOnPausedVmResumes) {
    created("web");
    ASSERT_TRUE(manager->start("web"));
    ASSERT_TRUE(manager->pause("web"));
    auto running = manager->start("web");
    ASSERT_TRUE(running) << running.error().what();
    EXPECT_EQ(running->state, VmState::Running);
}

TEST_F(VirtualMachineManagerTest, RequestsThatDoNotFitTheStateAreRejected) {
    created("web");
    EXPECT_EQ(manager->stop("web").error().errc(), VmErrc::InvalidTransition);
    EXPECT_EQ(manager->pause("web").error().errc(), VmErrc::InvalidTransition);
    EXPECT_EQ(manager->resume("web").error().errc(), VmErrc::InvalidTransition);
    EXPECT_EQ(manager->get("web")->state, VmState::Created);
}

TEST_F(VirtualMachineManagerTest, FailedStartRestoresPreviousState) {
    auto config = test::fakeVmConfig(dir);
    auto vm = manager->create("web", config);
    ASSERT_TRUE(vm);
    fs::remove(config.kernelImagePath);

    auto started = manager->start("web");
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().errc(), VmErrc::SpawnError);
    EXPECT_EQ(manager->get("web")->state, VmState::Created);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm->id), 0);
    EXPECT_FALSE(fs::exists(vm->paths.consoleSocket));
}

TEST_F(VirtualMachineManagerTest, RejectedConfigurationLeavesNoProcess) {
    test::ScopedEnv env("GLIDEX_FAKE_FAIL_PATH", "/machine-config");
    auto vm = created("web");
    auto started = manager->start("web");
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().errc(), VmErrc::ConfigurationError);
    EXPECT_NE(started.error().message().find("machine-config"), std::string::npos);
    EXPECT_EQ(manager->get("web")->state, VmState::Created);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
}

TEST_F(VirtualMachineManagerTest, DeleteRunningVmStopsItAndKeepsTheLog) {
    auto vm = created("web");
    ASSERT_TRUE(manager->start("web"));
    ASSERT_TRUE(test::eventually([&] {
        auto log = manager->consoleLog("web");
        return log && log->find("fake guest booted") != std::string::npos;
    }));

    ASSERT_TRUE(manager->remove("web"));
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
    EXPECT_FALSE(fs::exists(vm.paths.consoleSocket));
    EXPECT_FALSE(fs::exists(vm.paths.apiSocket));
    ASSERT_TRUE(fs::exists(vm.paths.logFile));
    EXPECT_NE(ConsoleLogger::readAll(vm.paths.logFile).find("fake guest booted"), std::string::npos);
}

TEST_F(VirtualMachineManagerTest, DeleteThatCannotBePersistedKeepsTheVm) {
    created("web");
    ASSERT_TRUE(manager->start("web"));
    store->setFailing(true);

    auto removed = manager->remove("web");
    ASSERT_FALSE(removed);
    EXPECT_EQ(removed.error().errc(), VmErrc::StorageError);
    auto record = manager->get("web");
    ASSERT_TRUE(record);
    EXPECT_EQ(record->state, VmState::Stopped);
    EXPECT_FALSE(record->pid);

    store->setFailing(false);
    EXPECT_TRUE(manager->remove("web"));
}

TEST_F(VirtualMachineManagerTest, ConsoleInfoFollowsTheState) {
    auto vm = created("web");
    auto info = manager->consoleInfo("web");
    ASSERT_TRUE(info);
    EXPECT_EQ(info->vmId, vm.id);
    EXPECT_EQ(info->consoleSocketPath, vm.paths.consoleSocket);
    EXPECT_EQ(info->logPath, vm.paths.logFile);
    EXPECT_FALSE(info->available);

    auto notRunning = manager->consoleConnect("web");
    ASSERT_FALSE(notRunning);
    EXPECT_EQ(notRunning.error().errc(), VmErrc::ConsoleUnavailable);

    ASSERT_TRUE(manager->start("web"));
    EXPECT_TRUE(manager->consoleInfo("web")->available);
    ASSERT_TRUE(manager->pause("web"));
    EXPECT_FALSE(manager->consoleInfo("web")->available);
    EXPECT_EQ(manager->consoleConnect("web").error().errc(), VmErrc::ConsoleUnavailable);
}

TEST_F(VirtualMachineManagerTest, LogOfANeverStartedVmIsEmpty) {
    created("web");
    auto log = manager->consoleLog("web");
    ASSERT_TRUE(log);
    EXPECT_TRUE(log->empty());
}

TEST_F(VirtualMachineManagerTest, ShutdownStopsEveryRunningVm) {
    auto a = created("a");
    auto b = created("b");
    ASSERT_TRUE(manager->start("a"));
    ASSERT_TRUE(manager->start("b"));

    manager->shutdown();
    EXPECT_FALSE(manager->health());
    EXPECT_EQ(manager->supervisor().liveProcessCount(a.id), 0);
    EXPECT_EQ(manager->supervisor().liveProcessCount(b.id), 0);
    EXPECT_EQ(manager->get("a")->state, VmState::Stopped);
    EXPECT_EQ(manager->get("b")->state, VmState::Stopped);
}

TEST(VirtualMachineManagerRecovery, RecordsLeftMidFlightBecomeStopped) {
    test::TempDir dir;
    auto store = std::make_shared<MemoryVmStore>();

    VmRecord running;
    running.id = "11111111-1111-1111-1111-111111111111";
    running.name = "was-running";
    running.config = test::fakeVmConfig(dir);
    running.state = VmState::Running;
    ASSERT_TRUE(store->save(running));

    VmRecord created = running;
    created.id = "22222222-2222-2222-2222-222222222222";
    created.name = "never-started";
    created.state = VmState::Created;
    ASSERT_TRUE(store->save(created));

    auto stale = ConsolePaths::forVm(dir.path(), running.id);
    dir.file(fs::path(stale.apiSocket).filename().string());

    VirtualMachineManager manager(test::fakeManagerOptions(dir), store);
    ASSERT_TRUE(manager.initialize());

    EXPECT_EQ(manager.get("was-running")->state, VmState::Stopped);
    EXPECT_EQ(manager.get("never-started")->state, VmState::Created);
    EXPECT_FALSE(fs::exists(stale.apiSocket));

    auto reloaded = store->loadAll();
    ASSERT_TRUE(reloaded);
    for (const auto& record : *reloaded) {
        if (record.id == running.id) EXPECT_EQ(record.state, VmState::Stopped);
    }

    // names stay unique across restarts
    EXPECT_EQ(manager.create("was-running", test::fakeVmConfig(dir)).error().errc(), VmErrc::DuplicateName);
    ASSERT_TRUE(manager.start("was-running"));
}

TEST(VirtualMachineManagerRecovery, UnreadableStoreFailsInitialization) {
    test::TempDir dir;
    auto store = std::make_shared<MemoryVmStore>();
    store->setFailing(true);
    VirtualMachineManager manager(test::fakeManagerOptions(dir), store);
    auto ready = manager.initialize();
    ASSERT_FALSE(ready);
    EXPECT_EQ(ready.error().errc(), VmErrc::StorageError);
}

TEST_F(VirtualMachineManagerTest, StopAsksTheGuestToShutDownFirst) {
    auto record = dir.path() + "/requests.log";
    test::ScopedEnv env("GLIDEX_FAKE_RECORD", record);
    std::atomic<int> crashes{0};
    manager->setCrashCallback([&](const VmCrashEvent&) { ++crashes; });

    created("web");
    ASSERT_TRUE(manager->start("web"));
    auto stopped = manager->stop("web");
    ASSERT_TRUE(stopped) << stopped.error().what();

    auto requests = slurp(record);
    auto boot = requests.find("InstanceStart");
    auto shutdown = requests.find("SendCtrlAltDel");
    ASSERT_NE(boot, std::string::npos) << requests;
    ASSERT_NE(shutdown, std::string::npos) << requests;
    EXPECT_LT(boot, shutdown);

    auto log = manager->consoleLog("web");
    ASSERT_TRUE(log);
    EXPECT_NE(log->find("fake guest booted"), std::string::npos);
    EXPECT_NE(log->find("reboot: Restarting system"), std::string::npos) << *log;

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(crashes.load(), 0);
}

TEST_F(VirtualMachineManagerTest, EchoReachesEveryConsoleClientAndTheLog) {
    created("web");
    ASSERT_TRUE(manager->start("web"));

    auto first = manager->consoleConnect("web");
    auto second = manager->consoleConnect("web");
    ASSERT_TRUE(first) << first.error().what();
    ASSERT_TRUE(second) << second.error().what();

    first->write("echo hi\n");
    EXPECT_NE(first->readUntil("hi\n", 5s).find("hi\n"), std::string::npos);
    EXPECT_NE(second->readUntil("hi\n", 5s).find("hi\n"), std::string::npos);
    ASSERT_TRUE(test::eventually([&] {
        auto log = manager->consoleLog("web");
        return log && log->find("hi\n") != std::string::npos;
    }));

    first->close();
    second->write("echo still here\n");
    EXPECT_NE(second->readUntil("still here", 5s).find("still here"), std::string::npos);
}

TEST_F(VirtualMachineManagerTest, ConcurrentStartsOfOneVmHaveOneWinner) {
    auto vm = created("web");
    auto outcomes = racing(4, [&](std::size_t) { return manager->start("web"); });

    int won = 0;
    for (const auto& outcome : outcomes) {
        if (outcome) {
            ++won;
        } else {
            EXPECT_EQ(outcome.error().errc(), VmErrc::InvalidTransition) << outcome.error().what();
        }
    }
    EXPECT_EQ(won, 1);
    EXPECT_EQ(manager->get("web")->state, VmState::Running);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 1);
}

TEST_F(VirtualMachineManagerTest, ConcurrentStopsOfOneVmHaveOneWinner) {
    auto vm = created("web");
    ASSERT_TRUE(manager->start("web"));
    auto outcomes = racing(4, [&](std::size_t) { return manager->stop("web"); });

    int won = 0;
    for (const auto& outcome : outcomes) {
        if (outcome) {
            ++won;
        } else {
            EXPECT_EQ(outcome.error().errc(), VmErrc::InvalidTransition) << outcome.error().what();
        }
    }
    EXPECT_EQ(won, 1);
    EXPECT_EQ(manager->get("web")->state, VmState::Stopped);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
}

TEST_F(VirtualMachineManagerTest, ConcurrentDeletesOfOneVmHaveOneWinner) {
    auto vm = created("web");
    ASSERT_TRUE(manager->start("web"));
    auto outcomes = racing(4, [&](std::size_t) { return manager->remove("web"); });

    int won = 0;
    for (const auto& outcome : outcomes) {
        if (outcome) {
            ++won;
        } else {
            auto errc = outcome.error().errc();
            EXPECT_TRUE(errc == VmErrc::InvalidTransition || errc == VmErrc::NotFound) << outcome.error().what();
        }
    }
    EXPECT_EQ(won, 1);
    EXPECT_EQ(manager->get("web").error().errc(), VmErrc::NotFound);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
}

TEST_F(VirtualMachineManagerTest, DifferentVmsStartAndStopInParallel) {
    std::vector<VmRecord> vms;
    for (int i = 0; i < 4; ++i) vms.push_back(created("vm-" + std::to_string(i)));

    auto started = racing(vms.size(), [&](std::size_t i) { return manager->start(vms[i].id); });
    for (std::size_t i = 0; i < vms.size(); ++i) {
        ASSERT_TRUE(started[i]) << started[i].error().what();
        EXPECT_EQ(started[i]->state, VmState::Running);
        EXPECT_EQ(manager->supervisor().liveProcessCount(vms[i].id), 1);
    }

    auto stopped = racing(vms.size(), [&](std::size_t i) { return manager->stop(vms[i].id); });
    for (std::size_t i = 0; i < vms.size(); ++i) {
        ASSERT_TRUE(stopped[i]) << stopped[i].error().what();
        EXPECT_EQ(manager->supervisor().liveProcessCount(vms[i].id), 0);
    }
}

TEST_F(VirtualMachineManagerTest, ShutdownWaitsForAStartInFlight) {
    auto vm = created("web");
    std::optional<Result<VmRecord>> started;
    std::thread starter([&] { started.emplace(manager->start("web")); });
    std::this_thread::sleep_for(20ms);

    manager->shutdown();
    starter.join();

    ASSERT_TRUE(started);
    EXPECT_EQ(manager->supervisor().liveProcessCount(vm.id), 0);
    auto state = manager->get("web")->state;
    if (*started) {
        EXPECT_EQ(state, VmState::Stopped);
    } else {
        EXPECT_EQ(started->error().errc(), VmErrc::InvalidTransition);
        EXPECT_EQ(state, VmState::Created);
    }

    EXPECT_EQ(manager->start("web").error().errc(), VmErrc::InvalidTransition);
    EXPECT_EQ(manager->create("late", test::fakeVmConfig(dir)).error().errc(), VmErrc::InvalidTransition);
}

namespace {

// A runtime directory where the control socket path still fits in
// sockaddr_un but the console socket path does not.
std::string borderlineRuntimeDir(const test::TempDir& dir) {
    auto path = dir.path() + "/";
    path += std::string(50 - path.size(), 'r');
    fs::create_directories(path);
    return path;
}

} // namespace

TEST(VirtualMachineManagerRuntimeDir, TooLongForSocketsIsInvalidConfig) {
    test::TempDir dir;
    auto options = test::fakeManagerOptions(dir);
    options.runtimeDir = borderlineRuntimeDir(dir);
    VirtualMachineManager manager(options, std::make_shared<MemoryVmStore>());

    auto ready = manager.initialize();
    ASSERT_FALSE(ready);
    EXPECT_EQ(ready.error().errc(), VmErrc::InvalidConfig);
}

TEST(VirtualMachineManagerRuntimeDir, ConsoleFailureAfterSpawnLeavesNoProcess) {
    test::TempDir dir;
    auto options = test::fakeManagerOptions(dir);
    options.runtimeDir = borderlineRuntimeDir(dir);
    VirtualMachineManager manager(options, std::make_shared<MemoryVmStore>());

    auto vm = manager.create("web", test::fakeVmConfig(dir));
    ASSERT_TRUE(vm);
    ASSERT_LT(vm->paths.apiSocket.size(), 108u);
    ASSERT_GE(vm->paths.consoleSocket.size(), 108u);

    for (int attempt = 0; attempt < 2; ++attempt) {
        auto started = manager.start("web");
        ASSERT_FALSE(started);
        EXPECT_EQ(started.error().errc(), VmErrc::IOError) << started.error().what();
        EXPECT_EQ(manager.get("web")->state, VmState::Created);
        EXPECT_FALSE(manager.get("web")->pid);
        EXPECT_EQ(manager.supervisor().liveProcessCount(vm->id), 0);
    }
}
