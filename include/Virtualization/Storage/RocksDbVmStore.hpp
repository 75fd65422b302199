#pragma once

#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <memory>
#include <string>

#include "Core/interfaces/IVmStore.hpp"

namespace glidex {

/**
 * @brief IVmStore on a RocksDB database.
 *
 * Keys are "vm/<id>", values the JSON from VmRecordCodec. Writes are synced
 * so a record survives a crash of the daemon right after the call returns.
 */
class RocksDbVmStore : public IVmStore {
public:
    // @throws StorageException when the database cannot be opened
    explicit RocksDbVmStore(const std::string& path);
    ~RocksDbVmStore() noexcept override;

    RocksDbVmStore(const RocksDbVmStore&) = delete;
    RocksDbVmStore& operator=(const RocksDbVmStore&) = delete;

    [[nodiscard]] Result<void> save(const VmRecord& record) override;
    [[nodiscard]] Result<void> remove(std::string_view id) override;
    [[nodiscard]] Result<std::vector<VmRecord>> loadAll() override;

private:
    std::unique_ptr<rocksdb::DB> db_;
    rocksdb::WriteOptions writeOptions_;
};

} // namespace glidex
