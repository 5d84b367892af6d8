#include "Listener.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include "HttpSession.hpp"
#include "IoContextPool.hpp"
#include "spdlog/spdlog.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace warden::network {

namespace {

// Report a failure
void fail(beast::error_code ec, const char* what) {
    if (ec != beast::errc::not_connected && ec != asio::error::eof &&
        ec != asio::error::connection_reset) {
        spdlog::error(("[Listener] {} : {}"), what, ec.message());
    }
}

}  // namespace

listener::listener(asio::io_context& main_ioc, infra::IoContextPool& pool,
                   const tcp::endpoint& endpoint, std::shared_ptr<const SessionContext> context)
    : acceptor_(main_ioc), pool_(pool), context_(std::move(context)) {
    beast::error_code ec;

    // Open the acceptor
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw BindError("open", ec);
    }
    // Set SO_REUSEADDR to allow immediate reuse of the port after the server stops.
    // This prevents the "Address already in use" error caused by the OS keeping the port
    // in a TIME_WAIT state for a few minutes after the process exits.
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        throw BindError("set_option(reuse_address)", ec);
    }

    // Bind to the server address
    acceptor_.bind(endpoint, ec);
    if (ec) {
        if (ec == asio::error::address_in_use) {
            spdlog::critical("[Listener] Port {} is already in use", endpoint.port());
        } else if (ec == asio::error::access_denied) {
            spdlog::critical("[Listener] Permission denied binding port {}", endpoint.port());
        }
        throw BindError("bind " + endpoint.address().to_string() + ":" +
                            std::to_string(endpoint.port()),
                        ec);
    }

    // Start listening for connections with backlog queue with the max size
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        throw BindError("listen", ec);
    }

    port_ = acceptor_.local_endpoint(ec).port();
    spdlog::debug(("Listener successfully bound to {} {} "), endpoint.address().to_string(),
                  port_);
}

void listener::run() {
    spdlog::debug(("Starting to accept connections.. "));

    // fire and forget corutine and continune listening
    asio::co_spawn(
        acceptor_.get_executor(), [self = shared_from_this()]() { return self->do_accept(); },
        asio::detached);
}

void listener::stop() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
        beast::error_code ec;
        self->acceptor_.close(ec);
        if (ec) {
            fail(ec, "close");
        }
        spdlog::info("[Listener] Stopped accepting connections on port {}", self->port_);
    });
}

asio::awaitable<void> listener::do_accept() {
    for (;;) {
        // get an io_context from the pool for the future sessions socket
        auto& pool_ioc = pool_.get_io_context();

        // suspends until a connection attempt has been detected, upon a connection a new
        // socket that is connected to the client would be returned
        auto [ec, socket] =
            co_await acceptor_.async_accept(pool_ioc, asio::as_tuple(asio::use_awaitable));

        if (ec) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                break;
            }
            fail(ec, "accept");
            continue;
        }

        if (!context_->state.IsAccepting()) {
            spdlog::debug("[Listener] Refusing connection: server is {}",
                          core::to_string(context_->state.Current()));
            beast::error_code ignored;
            socket.close(ignored);
            continue;
        }

        spdlog::debug("New connection accepted ");

        std::make_shared<HttpSession>(std::move(socket), context_)->run();
    }
    spdlog::debug("[Listener] Accept loop finished");
}

}  // namespace warden::network
