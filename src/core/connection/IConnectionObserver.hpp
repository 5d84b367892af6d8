#pragma once

#include "Connection.hpp"

namespace warden::core {

/**
 * @brief Contract for receiving transport lifecycle events.
 *
 * @details
 * **Pattern:** Observer / Listener.
 * **Thread Safety:** Called directly from the I/O worker threads, possibly
 * several at once. Implementations must be short and must not block on
 * network I/O.
 */
struct IConnectionObserver {
    virtual ~IConnectionObserver() = default;

    //    Called once, before the first read on the connection
    virtual void OnOpen(Connection connection) = 0;

    //    Called when the transport reports closure; may arrive late or twice
    virtual void OnClose(ConnectionId id) = 0;
};

}  // namespace warden::core
