#pragma once

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "Connection.hpp"
#include "SessionContext.hpp"
#include "Types.hpp"

namespace warden::network {

/**
 * @brief Handles a single HTTP connection.
 *
 * @details
 * Registers itself with the ConnectionRegistry for exactly as long as its
 * coroutine runs. A connection is *idle* while waiting for the first byte of
 * the next request and *in flight* from that byte until the response has
 * been written; the shutdown path uses this to decide between closing now
 * and closing after the response.
 *
 * Every request passes the admission check before it can reach the router.
 */
class HttpSession : public core::IConnectionHandle,
                    public std::enable_shared_from_this<HttpSession> {
   public:
    HttpSession(tcp::socket&& socket, std::shared_ptr<const SessionContext> context);
    ~HttpSession() override;

    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    // Entry point: launches the session coroutine
    void run();

    // core::IConnectionHandle, safe to call from any thread
    void CloseIfIdle() override;
    std::shared_future<void> ForceClose() override;
    void Sever() override;

   private:
    // Core Logic
    asio::awaitable<void> do_session();
    asio::awaitable<void> do_graceful_close();

    // I/O Helpers
    asio::awaitable<beast::error_code> do_wait_for_request();
    asio::awaitable<beast::error_code> do_read_request();
    asio::awaitable<beast::error_code> do_write_response(res_t& res, bool head_only);
    asio::awaitable<void> do_reject_and_close(http::status status);

    // Logic Helpers
    res_t do_build_response();
    void arm_request_timer();
    void do_close();

    beast::tcp_stream stream_;
    std::shared_ptr<const SessionContext> context_;
    beast::flat_buffer buffer_;
    asio::steady_timer request_timer_;
    std::string remote_;
    int sever_fd_ = -1;

    // Use optional to reuse parser memory
    std::optional<http::request_parser<http::string_body>> parser_;

    // Only touched on the session's executor.
    bool in_flight_ = false;
    bool close_requested_ = false;
    bool request_timed_out_ = false;
    bool reading_request_ = false;
};

}  // namespace warden::network
