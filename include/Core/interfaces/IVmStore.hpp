#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "Utils/Result.hpp"
#include "Virtualization/vm/VmRecord.hpp"

namespace glidex {

/**
 * @brief Durable copy of the VM records, keyed by VM id.
 *
 * Implementations must be safe to call from several threads. Only the
 * persistent part of a record is kept (id, name, config, state); paths and
 * pid are runtime data.
 */
class IVmStore {
public:
    virtual ~IVmStore() noexcept = default;

    /// Insert or overwrite the record with this id.
    [[nodiscard]] virtual Result<void> save(const VmRecord& record) = 0;

    /// Removing an unknown id succeeds.
    [[nodiscard]] virtual Result<void> remove(std::string_view id) = 0;

    [[nodiscard]] virtual Result<std::vector<VmRecord>> loadAll() = 0;
};

} // namespace glidex
