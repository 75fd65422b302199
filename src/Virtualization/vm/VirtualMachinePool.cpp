#include "Virtualization/vm/VirtualMachinePool.hpp"

#include <algorithm>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace glidex {

VmRecord VmEntry::snapshot() const {
    VmRecord copy = record;
    if (process && !process->hasExited()) {
        copy.pid = process->pid();
    } else {
        copy.pid.reset();
    }
    return copy;
}

std::string VirtualMachinePool::allocateId() {
    boost::uuids::random_generator gen;
    for (;;) {
        auto id = boost::uuids::to_string(gen());
        if (issuedIds_.insert(id).second) return id;
    }
}

VmEntry& VirtualMachinePool::insert(VmRecord record) {
    auto id = record.id;
    issuedIds_.insert(id);
    auto [it, inserted] = entries_.try_emplace(id);
    it->second.record = std::move(record);
    if (inserted) order_.push_back(id);
    return it->second;
}

VmEntry* VirtualMachinePool::findById(std::string_view id) {
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

VmEntry* VirtualMachinePool::find(std::string_view idOrName) {
    return const_cast<VmEntry*>(std::as_const(*this).find(idOrName));
}

const VmEntry* VirtualMachinePool::find(std::string_view idOrName) const {
    if (auto it = entries_.find(idOrName); it != entries_.end()) return &it->second;
    for (const auto& [id, entry] : entries_) {
        if (entry.record.name == idOrName) return &entry;
    }
    return nullptr;
}

bool VirtualMachinePool::nameInUse(std::string_view name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&](const auto& kv) { return kv.second.record.name == name; });
}

void VirtualMachinePool::erase(std::string_view id) {
    auto it = entries_.find(id);
    if (it == entries_.end()) return;
    entries_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
}

std::vector<VmRecord> VirtualMachinePool::snapshot() const {
    std::vector<VmRecord> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        if (auto it = entries_.find(id); it != entries_.end()) out.push_back(it->second.snapshot());
    }
    return out;
}

void VirtualMachinePool::forEach(const std::function<void(VmEntry&)>& fn) {
    for (const auto& id : order_) {
        if (auto it = entries_.find(id); it != entries_.end()) fn(it->second);
    }
}

} // namespace glidex
