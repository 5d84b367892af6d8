#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <unordered_map>

#include "Connection.hpp"
#include "IConnectionObserver.hpp"

namespace warden::core {

/**
 * @brief The set of currently open transport connections, keyed by identity.
 *
 * @details
 * The only mutable state shared between connection handlers and the
 * shutdown task. All mutation goes through Add/Remove. ForEach iterates a
 * snapshot taken under the lock, so callbacks may call back into the
 * registry (e.g. Remove) without deadlocking.
 *
 * Every Remove that empties the registry wakes WaitUntilEmpty callers.
 */
class ConnectionRegistry : public IConnectionObserver {
   public:
    ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Allocates a fresh identity for a newly accepted connection.
    ConnectionId NextId() noexcept;

    // Caller must not add the same identity twice.
    void Add(Connection connection);

    // Returns false when the identity was already gone.
    bool Remove(ConnectionId id);

    std::size_t Size() const;

    void ForEach(const std::function<void(const Connection&)>& fn) const;

    /**
     * @brief Blocks until the registry is empty or the deadline passes.
     * @return true if the registry was empty on return.
     */
    bool WaitUntilEmpty(std::chrono::steady_clock::time_point deadline) const;

    // IConnectionObserver
    void OnOpen(Connection connection) override { Add(std::move(connection)); }
    void OnClose(ConnectionId id) override { Remove(id); }

   private:
    // mutable allows locking in const methods (like Size/ForEach)
    mutable std::mutex mutex_;
    mutable std::condition_variable drained_;

    std::atomic<ConnectionId> next_id_{1};
    std::unordered_map<ConnectionId, Connection> connections_;
};

}  // namespace warden::core
