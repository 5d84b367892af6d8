#pragma once

#include <spdlog/spdlog.h>

#include "Connection.hpp"
#include "IConnectionObserver.hpp"

namespace warden::core {

/**
 * @brief RAII guard. Reports the connection closed on destruction.
 *
 * Lives in the session coroutine frame so that every exit path (EOF,
 * transport error, timeout, forced close, exception) deregisters exactly once.
 */
class ConnectionGuard {
   public:
    ConnectionGuard(IConnectionObserver& observer, Connection connection)
        : observer_(observer), id_(connection.id) {
        observer_.OnOpen(std::move(connection));
    }

    ~ConnectionGuard() {
        try {
            observer_.OnClose(id_);
        } catch (const std::exception& e) {
            spdlog::error("[Connection {}] Failed to report close: {}", id_, e.what());
        }
    }

    ConnectionId id() const noexcept { return id_; }

    ConnectionGuard(const ConnectionGuard&) = delete;
    ConnectionGuard& operator=(const ConnectionGuard&) = delete;
    ConnectionGuard(ConnectionGuard&&) = delete;
    ConnectionGuard& operator=(ConnectionGuard&&) = delete;

   private:
    IConnectionObserver& observer_;
    ConnectionId id_;
};

}  // namespace warden::core
