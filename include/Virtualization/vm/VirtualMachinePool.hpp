#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "Virtualization/console/ConsoleProxy.hpp"
#include "Virtualization/vm/VmRecord.hpp"
#include "Virtualization/vmm/HypervisorProcess.hpp"

namespace glidex {

/// Registry slot of one VM: the record plus the runtime objects it owns.
struct VmEntry {
    VmRecord record;
    std::unique_ptr<HypervisorProcess> process;
    std::shared_ptr<ConsoleProxy> console;
    // a lifecycle transition is in flight
    bool busy{false};
    // the process exited while busy; recover once the transition commits
    bool exitedDuringTransition{false};

    [[nodiscard]] VmRecord snapshot() const;
};

/**
 * @brief The collection of VM entries.
 *
 * Not synchronized: VirtualMachineManager guards it with its own lock.
 * Entries are node-based, so references stay valid until erase().
 */
class VirtualMachinePool {
public:
    VirtualMachinePool() = default;
    VirtualMachinePool(const VirtualMachinePool&) = delete;
    VirtualMachinePool& operator=(const VirtualMachinePool&) = delete;

    /// Fresh random UUID, never handed out twice by this pool.
    [[nodiscard]] std::string allocateId();

    VmEntry& insert(VmRecord record);

    /// Exact id match first, then name.
    [[nodiscard]] VmEntry* find(std::string_view idOrName);
    [[nodiscard]] const VmEntry* find(std::string_view idOrName) const;
    [[nodiscard]] VmEntry* findById(std::string_view id);

    [[nodiscard]] bool nameInUse(std::string_view name) const;

    void erase(std::string_view id);

    /// Snapshots in creation order.
    [[nodiscard]] std::vector<VmRecord> snapshot() const;

    void forEach(const std::function<void(VmEntry&)>& fn);

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    std::map<std::string, VmEntry, std::less<>> entries_;
    std::vector<std::string> order_;
    std::unordered_set<std::string> issuedIds_;
};

} // namespace glidex
