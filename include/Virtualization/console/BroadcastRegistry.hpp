#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "Virtualization/console/ConsoleSession.hpp"

namespace glidex {

/// The set of clients attached to one VM's console.
class BroadcastRegistry {
public:
    BroadcastRegistry() = default;
    BroadcastRegistry(const BroadcastRegistry&) = delete;
    BroadcastRegistry& operator=(const BroadcastRegistry&) = delete;

    void add(std::shared_ptr<ConsoleSession> session);
    void remove(ConsoleSession::Id id);

    /// Queue @p chunk on every client, in registration order. Clients that
    /// are gone or overflowing are dropped. Returns how many accepted it.
    std::size_t deliver(const std::shared_ptr<const std::string>& chunk);

    void closeAll();

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<ConsoleSession::Id, std::shared_ptr<ConsoleSession>> sessions_;
};

} // namespace glidex
