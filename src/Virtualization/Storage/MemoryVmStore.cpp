#include "Virtualization/Storage/MemoryVmStore.hpp"

#include "Virtualization/Storage/VmRecordCodec.hpp"

namespace glidex {

Result<void> MemoryVmStore::save(const VmRecord& record) {
    std::scoped_lock lock(mutex_);
    if (failing_) return fail(VmErrc::StorageError, "vm " + record.id + ": store unavailable");
    records_[record.id] = VmRecordCodec::encode(record);
    return {};
}

Result<void> MemoryVmStore::remove(std::string_view id) {
    std::scoped_lock lock(mutex_);
    if (failing_) return fail(VmErrc::StorageError, "vm " + std::string(id) + ": store unavailable");
    if (auto it = records_.find(id); it != records_.end()) records_.erase(it);
    return {};
}

Result<std::vector<VmRecord>> MemoryVmStore::loadAll() {
    std::scoped_lock lock(mutex_);
    if (failing_) return fail(VmErrc::StorageError, "store unavailable");
    std::vector<VmRecord> out;
    out.reserve(records_.size());
    for (const auto& [id, json] : records_) {
        auto record = VmRecordCodec::decode(json);
        if (!record) return std::unexpected(record.error());
        out.push_back(std::move(*record));
    }
    return out;
}

void MemoryVmStore::setFailing(bool failing) {
    std::scoped_lock lock(mutex_);
    failing_ = failing;
}

std::size_t MemoryVmStore::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

} // namespace glidex
