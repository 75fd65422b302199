#include <gtest/gtest.h>

#include "Virtualization/Storage/MemoryVmStore.hpp"
#include "Virtualization/Storage/VmRecordCodec.hpp"

using namespace glidex;

namespace {
VmRecord sampleRecord(const std::string& id, const std::string& name) {
    VmRecord record;
    record.id = id;
    record.name = name;
    record.state = VmState::Paused;
    record.config.vcpuCount = 4;
    record.config.memSizeMib = 1024;
    record.config.kernelImagePath = "/images/vmlinux.bin";
    record.config.rootfsPath = "/images/rootfs.ext4";
    record.config.kernelArgs = "console=ttyS0";
    record.paths = ConsolePaths::forVm("/tmp", id);
    record.pid = 4242;
    return record;
}
} // namespace

TEST(VmRecordCodec, KeepsPersistentFieldsOnly) {
    auto decoded = VmRecordCodec::decode(VmRecordCodec::encode(sampleRecord("id-1", "web")));
    ASSERT_TRUE(decoded) << decoded.error().what();
    EXPECT_EQ(decoded->id, "id-1");
    EXPECT_EQ(decoded->name, "web");
    EXPECT_EQ(decoded->state, VmState::Paused);
    EXPECT_EQ(decoded->config, sampleRecord("id-1", "web").config);
    EXPECT_FALSE(decoded->pid);
    EXPECT_TRUE(decoded->paths.logFile.empty());
}

TEST(VmRecordCodec, AbsentKernelArgsStayAbsent) {
    auto record = sampleRecord("id-2", "db");
    record.config.kernelArgs.reset();
    auto decoded = VmRecordCodec::decode(VmRecordCodec::encode(record));
    ASSERT_TRUE(decoded);
    EXPECT_FALSE(decoded->config.kernelArgs);
}

TEST(VmRecordCodec, MalformedInputIsAStorageError) {
    for (const char* bad : {"not json", "[]", R"({"id":"x"})",
                            R"({"id":"x","name":"n","state":"exploded","config":{}})",
                            R"({"id":"x","name":"n","state":"created","config":{"vcpu_count":"two"}})"}) {
        auto decoded = VmRecordCodec::decode(bad);
        ASSERT_FALSE(decoded) << bad;
        EXPECT_EQ(decoded.error().errc(), VmErrc::StorageError);
    }
}

TEST(MemoryVmStore, SaveOverwritesAndRemoveForgets) {
    MemoryVmStore store;
    auto record = sampleRecord("id-1", "web");
    ASSERT_TRUE(store.save(record));
    record.state = VmState::Stopped;
    ASSERT_TRUE(store.save(record));
    ASSERT_TRUE(store.save(sampleRecord("id-2", "db")));

    auto all = store.loadAll();
    ASSERT_TRUE(all);
    ASSERT_EQ(all->size(), 2u);
    EXPECT_EQ((*all)[0].state, VmState::Stopped);

    ASSERT_TRUE(store.remove("id-1"));
    ASSERT_TRUE(store.remove("never-existed"));
    EXPECT_EQ(store.size(), 1u);
}

TEST(MemoryVmStore, FailingStoreReportsStorageError) {
    MemoryVmStore store;
    store.setFailing(true);
    auto saved = store.save(sampleRecord("id-1", "web"));
    ASSERT_FALSE(saved);
    EXPECT_EQ(saved.error().errc(), VmErrc::StorageError);
    EXPECT_FALSE(store.loadAll());
}
