#include "HttpSession.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "ConnectionGuard.hpp"
#include "RequestValidator.hpp"
#include "response_builder.hpp"

namespace {

using ResponseBuilder = warden::models::ResponseBuilder;

constexpr std::size_t READ_CHUNK_SIZE = 4096;
constexpr std::size_t HEADER_LIMIT_BYTES = 16 * 1024;  // admission enforces the real bound
constexpr std::size_t DRAIN_BUFFER_SIZE = 1024;        // Drain unread TCP data during close
constexpr int DRAIN_TIMEOUT_SECONDS = 1;

bool is_benign(beast::error_code ec) {
    return ec == beast::errc::not_connected || ec == asio::error::eof ||
           ec == asio::error::connection_reset || ec == asio::error::operation_aborted ||
           ec == asio::error::broken_pipe ||
           ec == asio::error::bad_descriptor || ec == beast::error::timeout ||
           ec == http::error::end_of_stream || ec == http::error::partial_message;
}

// Framing errors the parser raises for a malformed request.
bool is_parse_error(beast::error_code ec) {
    return ec.category() == http::make_error_code(http::error::bad_method).category() &&
           ec != http::error::end_of_stream && ec != http::error::partial_message;
}

void fail(beast::error_code ec, const char* what) {
    if (!is_benign(ec)) {
        spdlog::error("[HttpSession] {} error: {}", what, ec.message());
    }
}

}  // namespace

namespace warden::network {

HttpSession::HttpSession(tcp::socket&& socket, std::shared_ptr<const SessionContext> context)
    : stream_(std::move(socket)),
      context_(std::move(context)),
      request_timer_(stream_.get_executor()) {
    beast::error_code ec;
    auto remote = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_ = remote.address().to_string() + ":" + std::to_string(remote.port());
    }

    // Own descriptor for Sever(): stays valid whichever thread closes the socket.
    sever_fd_ = ::dup(stream_.socket().native_handle());
    if (sever_fd_ < 0) {
        spdlog::warn("[HttpSession] dup() failed for {}: {}", remote_,
                     std::error_code(errno, std::generic_category()).message());
    }
    spdlog::debug("New HTTP connection: {}", remote_);
}

HttpSession::~HttpSession() {
    if (sever_fd_ >= 0) {
        ::close(sever_fd_);
    }
}

void HttpSession::run() {
    asio::co_spawn(
        stream_.get_executor(), [self = shared_from_this()]() { return self->do_session(); },
        [context = context_](std::exception_ptr e) {
            if (!e) {
                return;
            }
            std::string what;
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                what = ex.what();
            } catch (...) {
                what = "non-standard exception";
            }
            spdlog::critical("[HttpSession] Unhandled exception: {}", what);
            if (context->on_fault) {
                context->on_fault(what);
            }
        });
}

void HttpSession::CloseIfIdle() {
    asio::post(stream_.get_executor(), [self = shared_from_this()]() {
        self->close_requested_ = true;
        if (!self->in_flight_) {
            spdlog::debug("[HttpSession] Closing idle connection {}", self->remote_);
            self->do_close();
        }
    });
}

std::shared_future<void> HttpSession::ForceClose() {
    auto closed = std::make_shared<std::promise<void>>();
    auto future = closed->get_future().share();
    asio::post(stream_.get_executor(), [self = shared_from_this(), closed]() {
        self->close_requested_ = true;
        self->request_timer_.cancel();
        spdlog::debug("[HttpSession] Force closing connection {}", self->remote_);
        self->do_close();
        closed->set_value();
    });
    return future;
}

void HttpSession::Sever() {
    if (sever_fd_ < 0) {
        throw std::runtime_error("no descriptor to sever " + remote_);
    }
    if (::shutdown(sever_fd_, SHUT_RDWR) != 0 && errno != ENOTCONN) {
        throw std::system_error(errno, std::generic_category(), "shutdown " + remote_);
    }
    spdlog::debug("[HttpSession] Severed connection {}", remote_);
}

asio::awaitable<void> HttpSession::do_session() {
    core::ConnectionGuard guard(
        context_->registry,
        core::Connection{context_->registry.NextId(), remote_, std::chrono::system_clock::now(),
                         weak_from_this()});

    // Accepted on the edge of a shutdown: never serve it.
    if (!context_->state.IsAccepting()) {
        spdlog::debug("[HttpSession] Server no longer running; dropping {}", remote_);
        do_close();
        co_return;
    }

    try {
        for (;;) {
            auto ec_wait = co_await do_wait_for_request();
            if (ec_wait) {
                fail(ec_wait, "idle read");
                do_close();
                co_return;
            }

            in_flight_ = true;
            auto ec_read = co_await do_read_request();
            if (ec_read) {
                if (request_timed_out_) {
                    spdlog::warn("[HttpSession] Request from {} timed out", remote_);
                    co_await do_reject_and_close(http::status::request_timeout);
                } else if (ec_read == http::error::bad_method) {
                    spdlog::warn("[HttpSession] Invalid method token from {}", remote_);
                    co_await do_reject_and_close(http::status::method_not_allowed);
                } else if (is_parse_error(ec_read)) {
                    spdlog::warn("[HttpSession] Malformed request from {}: {}", remote_,
                                 ec_read.message());
                    co_await do_reject_and_close(http::status::bad_request);
                } else {
                    fail(ec_read, "read");
                    do_close();
                }
                co_return;
            }

            const bool head_only = parser_->get().method() == http::verb::head;
            auto res = do_build_response();
            if (close_requested_) {
                res.keep_alive(false);
            }

            auto ec_write = co_await do_write_response(res, head_only);
            if (ec_write) {
                fail(ec_write, "write");
                do_close();
                co_return;
            }

            if (!res.keep_alive()) {
                co_await do_graceful_close();
                co_return;
            }
        }
    } catch (const boost::system::system_error& e) {
        // Transport failure: contained to this connection.
        spdlog::error("[HttpSession] Session {} died: {}", remote_, e.what());
        do_close();
    }
}

asio::awaitable<beast::error_code> HttpSession::do_wait_for_request() {
    in_flight_ = false;

    // Pipelined bytes of the next request are already buffered.
    if (buffer_.size() > 0) {
        co_return beast::error_code{};
    }
    if (close_requested_) {
        co_return beast::error_code{asio::error::operation_aborted};
    }

    stream_.expires_after(context_->timeouts.keep_alive);
    auto [ec, bytes] = co_await stream_.async_read_some(buffer_.prepare(READ_CHUNK_SIZE),
                                                        asio::as_tuple(asio::use_awaitable));
    if (!ec) {
        buffer_.commit(bytes);
    }
    co_return ec;
}

asio::awaitable<beast::error_code> HttpSession::do_read_request() {
    // Reset parser per request (required for HTTP keep-alive)
    parser_.emplace();
    parser_->header_limit(HEADER_LIMIT_BYTES);
    parser_->body_limit(context_->max_body_bytes);

    stream_.expires_never();
    arm_request_timer();

    auto [ec, _] = co_await http::async_read(stream_, buffer_, *parser_,
                                             asio::as_tuple(asio::use_awaitable));
    // An expiry already queued behind this completion must not touch the socket.
    reading_request_ = false;
    request_timer_.cancel();
    co_return ec;
}

void HttpSession::arm_request_timer() {
    request_timed_out_ = false;
    reading_request_ = true;
    request_timer_.expires_after(context_->timeouts.request);
    request_timer_.async_wait([self = shared_from_this()](beast::error_code ec) {
        if (ec == asio::error::operation_aborted || !self->reading_request_) {
            return;
        }
        self->request_timed_out_ = true;
        beast::error_code ignored;
        self->stream_.socket().cancel(ignored);
    });
}

res_t HttpSession::do_build_response() {
    const auto& req = parser_->get();

    core::HeaderList headers;
    for (const auto& field : req) {
        headers.emplace_back(std::string(field.name_string()), std::string(field.value()));
    }

    const std::string method(req.method_string());
    const std::string target(req.target());

    auto verdict = core::Validate(method, target, headers);
    if (!verdict.admitted()) {
        const auto& rejection = verdict.rejection();
        spdlog::warn("[Admission] Rejected {} {} from {}: {} ({})", method, target, remote_,
                     static_cast<unsigned>(rejection.status), rejection.reason);

        res_t res;
        if (rejection.allow) {
            ResponseBuilder::build_method_not_allowed(res, *rejection.allow, req.version(),
                                                      req.keep_alive());
        } else {
            ResponseBuilder::build_text_response(res, rejection.status, rejection.body,
                                                 req.version(), req.keep_alive());
        }
        return res;
    }

    try {
        return context_->router->RouteRequest(req);
    } catch (const std::exception& e) {
        spdlog::error("Routing Error: {}", e.what());
        res_t res;
        ResponseBuilder::build_error_response(res, http::status::internal_server_error,
                                              req.version(), req.keep_alive());
        return res;
    }
}

asio::awaitable<beast::error_code> HttpSession::do_write_response(res_t& res, bool head_only) {
    ResponseBuilder::apply_standard_headers(res);
    res.prepare_payload();
    if (head_only) {
        // Content-Length stays as computed; HEAD carries no body.
        res.body().clear();
    }

    // Disable Nagle (TCP_NODELAY) for lower latency
    beast::error_code ec;
    stream_.socket().set_option(tcp::no_delay(true), ec);

    stream_.expires_after(context_->timeouts.request);
    auto [ec_write, bytes] =
        co_await http::async_write(stream_, res, asio::as_tuple(asio::use_awaitable));

    if (!ec_write) {
        spdlog::debug("Sent response: {} {} bytes", res.result_int(), bytes);
    }
    co_return ec_write;
}

asio::awaitable<void> HttpSession::do_reject_and_close(http::status status) {
    res_t res;
    if (status == http::status::method_not_allowed) {
        ResponseBuilder::build_method_not_allowed(res, core::AllowHeaderValue(), 11, false);
    } else {
        ResponseBuilder::build_error_response(res, status, 11, false);
    }
    auto ec = co_await do_write_response(res, false);
    if (ec) {
        fail(ec, "write");
        do_close();
        co_return;
    }
    co_await do_graceful_close();
}

asio::awaitable<void> HttpSession::do_graceful_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);

    if (ec && ec != beast::errc::not_connected) {
        fail(ec, "shutdown");
    }

    // Drain remaining data until the client closes or the timeout fires
    beast::flat_buffer drain;
    stream_.expires_after(std::chrono::seconds(DRAIN_TIMEOUT_SECONDS));
    auto [ec_drain, _] = co_await stream_.async_read_some(drain.prepare(DRAIN_BUFFER_SIZE),
                                                          asio::as_tuple(asio::use_awaitable));
    fail(ec_drain, "drain");
    do_close();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream_.socket().close(ec);
}

}  // namespace warden::network
