#pragma once
#include <map>
#include <mutex>
#include <string>

#include "Core/interfaces/IVmStore.hpp"

namespace glidex {

/// Keeps encoded records in a map. Used with --ephemeral and in tests.
class MemoryVmStore : public IVmStore {
public:
    [[nodiscard]] Result<void> save(const VmRecord& record) override;
    [[nodiscard]] Result<void> remove(std::string_view id) override;
    [[nodiscard]] Result<std::vector<VmRecord>> loadAll() override;

    // Make the next calls fail with StorageError.
    void setFailing(bool failing);
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string, std::less<>> records_;
    bool failing_{false};
};

} // namespace glidex
