#include "ConnectionRegistry.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace warden::core {

ConnectionId ConnectionRegistry::NextId() noexcept {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

void ConnectionRegistry::Add(Connection connection) {
    const auto id = connection.id;
    std::size_t size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections_.insert_or_assign(id, std::move(connection));
        size = connections_.size();
    }
    spdlog::debug("[Registry] Connection {} registered ({} open)", id, size);
}

bool ConnectionRegistry::Remove(ConnectionId id) {
    std::size_t size = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connections_.erase(id) == 0) {
            return false;
        }
        size = connections_.size();
        if (size == 0) {
            drained_.notify_all();
        }
    }
    spdlog::debug("[Registry] Connection {} removed ({} open)", id, size);
    return true;
}

std::size_t ConnectionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::ForEach(const std::function<void(const Connection&)>& fn) const {
    std::vector<Connection> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(connections_.size());
        for (const auto& [id, connection] : connections_) {
            snapshot.push_back(connection);
        }
    }

    for (const auto& connection : snapshot) {
        fn(connection);
    }
}

bool ConnectionRegistry::WaitUntilEmpty(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_.wait_until(lock, deadline, [this] { return connections_.empty(); });
}

}  // namespace warden::core
