#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

namespace warden::core {

using ConnectionId = std::uint64_t;

/**
 * @brief Control surface a transport connection exposes to the registry.
 *
 * **Thread Safety:** All methods are called from the shutdown thread.
 * CloseIfIdle and ForceClose hand the work over to the connection's own
 * executor. Sever is the one exception: it acts on the transport directly,
 * for when that executor is stuck in a handler.
 */
struct IConnectionHandle {
    virtual ~IConnectionHandle() = default;

    // Close now if no request is in flight, otherwise close after the response.
    virtual void CloseIfIdle() = 0;

    // Close without waiting for in-flight work. Ready once the socket is closed.
    virtual std::shared_future<void> ForceClose() = 0;

    // Shut the transport down from the calling thread. The peer sees EOF and
    // pending I/O on the connection fails.
    virtual void Sever() = 0;
};

/**
 * @brief One open transport-layer link, as tracked by the ConnectionRegistry.
 */
struct Connection {
    ConnectionId id = 0;
    std::string remote_address;
    std::chrono::system_clock::time_point opened_at;

    // Non-owning: the session owns itself through its coroutine frame.
    std::weak_ptr<IConnectionHandle> handle;
};

}  // namespace warden::core
