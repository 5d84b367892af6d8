#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>

#include "IRequestRouter.hpp"
#include "ServerState.hpp"
#include "ShutdownCoordinator.hpp"
#include "config.hpp"

namespace warden::network {

/**
 * @brief High-level Server Facade.
 * Orchestrates the thread pool, listener, connection registry, lifecycle
 * state and shutdown coordinator of one server instance. Several instances
 * may live in one process.
 */
class Server {
public:
    // Throws core::ConfigError if the hostname is not a loopback name.
    // Port 0 binds an ephemeral port.
    Server(boost::asio::io_context& io, core::AppConfig config,
           std::shared_ptr<IRequestRouter> router = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Binds and starts accepting. Throws BindError; the server stays in Starting.
    void Start();

    // Start() if needed, then run the main loop until shutdown completes.
    void Run();

    std::shared_future<core::ShutdownOutcome> Shutdown(const std::string& reason);

    std::uint16_t port() const;
    core::ServerState state() const;
    std::size_t active_connections() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

}  // namespace warden::network
