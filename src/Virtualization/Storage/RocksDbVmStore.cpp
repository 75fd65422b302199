#include "Virtualization/Storage/RocksDbVmStore.hpp"

#include <rocksdb/iterator.h>
#include <rocksdb/slice.h>
#include <fmt/format.h>

#include "System/Logger.hpp"
#include "Virtualization/Storage/VmRecordCodec.hpp"
#include "Virtualization/Utils/VmException.hpp"

namespace glidex {

namespace {
constexpr std::string_view kKeyPrefix = "vm/";

std::string keyFor(std::string_view id) {
    std::string key(kKeyPrefix);
    key.append(id);
    return key;
}
} // namespace

RocksDbVmStore::RocksDbVmStore(const std::string& path) {
    rocksdb::Options options;
    options.create_if_missing = true;

    rocksdb::DB* raw = nullptr;
    auto status = rocksdb::DB::Open(options, path, &raw);
    if (!status.ok()) {
        throw StorageException(fmt::format("open {}: {}", path, status.ToString()));
    }
    db_.reset(raw);
    writeOptions_.sync = true;
    GXLOG_INFO("record store opened at {}", path);
}

RocksDbVmStore::~RocksDbVmStore() noexcept {
    if (db_) {
        auto status = db_->Close();
        if (!status.ok()) GXLOG_WARN("record store close: {}", status.ToString());
    }
}

Result<void> RocksDbVmStore::save(const VmRecord& record) {
    auto status = db_->Put(writeOptions_, keyFor(record.id), VmRecordCodec::encode(record));
    if (!status.ok()) {
        return fail(VmErrc::StorageError, fmt::format("vm {}: save: {}", record.id, status.ToString()));
    }
    return {};
}

Result<void> RocksDbVmStore::remove(std::string_view id) {
    auto status = db_->Delete(writeOptions_, keyFor(id));
    if (!status.ok()) {
        return fail(VmErrc::StorageError, fmt::format("vm {}: delete: {}", id, status.ToString()));
    }
    return {};
}

Result<std::vector<VmRecord>> RocksDbVmStore::loadAll() {
    std::vector<VmRecord> out;
    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(rocksdb::ReadOptions()));
    rocksdb::Slice prefix(kKeyPrefix.data(), kKeyPrefix.size());
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        auto record = VmRecordCodec::decode(std::string_view(it->value().data(), it->value().size()));
        if (!record) {
            GXLOG_ERROR("record store: skipping {}: {}", it->key().ToString(), record.error().message());
            continue;
        }
        out.push_back(std::move(*record));
    }
    if (!it->status().ok()) {
        return fail(VmErrc::StorageError, "load: " + it->status().ToString());
    }
    return out;
}

} // namespace glidex
