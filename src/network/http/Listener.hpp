#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include "IoContextPool.hpp"
#include "SessionContext.hpp"
#include "Types.hpp"

namespace warden::network {

/**
 * @brief The listener could not open, bind or listen. Fatal at startup.
 */
class BindError : public std::runtime_error {
   public:
    BindError(const std::string& what, beast::error_code ec)
        : std::runtime_error(what + ": " + ec.message()), code_(ec) {}

    beast::error_code code() const noexcept { return code_; }

   private:
    beast::error_code code_;
};

/**
 * @brief The TCP Connection Acceptor.
 * * @details
 * **Architecture: One Acceptor, Many Workers**
 * - Runs on the `main_ioc` (Main Thread) to accept incoming TCP connections.
 * - **Load Balancing:** Upon acceptance, it requests a worker `io_context`
 * from the `IoContextPool`.
 * - **Handover:** It moves the connected socket to that worker context
 * (creating an `HttpSession`), so parsing and routing happen on the worker
 * threads, not the acceptor thread.
 * - **Shutdown:** `stop()` closes the acceptor; pending and future connection
 * attempts are refused by the kernel rather than queued.
 */
class listener : public std::enable_shared_from_this<listener> {
   public:
    // Binds immediately. Throws BindError on failure.
    listener(asio::io_context& ioc, infra::IoContextPool& pool, const tcp::endpoint& endpoint,
             std::shared_ptr<const SessionContext> context);

    // Start accepting incoming connections
    void run();

    // Thread-safe: closes the acceptor on its own executor.
    void stop();

    // Bound port; differs from the requested one when binding port 0.
    std::uint16_t port() const noexcept { return port_; }

   private:
    // Accept a new connection
    asio::awaitable<void> do_accept();

    // Member variables

    tcp::acceptor acceptor_;
    infra::IoContextPool& pool_;
    std::shared_ptr<const SessionContext> context_;
    std::uint16_t port_ = 0;
};

}  // namespace warden::network
