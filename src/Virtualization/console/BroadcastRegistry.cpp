#include "Virtualization/console/BroadcastRegistry.hpp"

#include "System/Logger.hpp"

namespace glidex {

void BroadcastRegistry::add(std::shared_ptr<ConsoleSession> session) {
    std::scoped_lock lock(mutex_);
    auto id = session->id();
    sessions_.emplace(id, std::move(session));
}

void BroadcastRegistry::remove(ConsoleSession::Id id) {
    std::scoped_lock lock(mutex_);
    sessions_.erase(id);
}

std::size_t BroadcastRegistry::deliver(const std::shared_ptr<const std::string>& chunk) {
    std::scoped_lock lock(mutex_);
    std::size_t reached = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second->enqueue(chunk)) {
            ++reached;
            ++it;
        } else {
            GXLOG_DEBUG("console client {} removed", it->first);
            it = sessions_.erase(it);
        }
    }
    return reached;
}

void BroadcastRegistry::closeAll() {
    std::map<ConsoleSession::Id, std::shared_ptr<ConsoleSession>> sessions;
    {
        std::scoped_lock lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) session->close();
}

std::size_t BroadcastRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return sessions_.size();
}

} // namespace glidex
