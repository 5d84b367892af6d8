#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "IRequestRouter.hpp"
#include "Types.hpp"
#include "response_builder.hpp"

namespace warden::network {

using ResponseBuilder = warden::models::ResponseBuilder;

/**
 * @brief Fixed route table of the server.
 *
 * | Path              | GET / HEAD                  | other admitted methods |
 * |-------------------|-----------------------------|------------------------|
 * | `/`, `/hello`     | 200 `Hello, World!\n`       | 405 + Allow            |
 * | `/health`         | 200 JSON status             | 405 + Allow            |
 * | anything else     | 404                         | 404                    |
 */
class Router : public IRequestRouter {
public:
    Router();

    res_t RouteRequest(const req_t& req) override;

private:
    // Handlers
    void handle_hello(const req_t& req, res_t& res);
    void handle_health(const req_t& req, res_t& res);
    void handle_method_not_allowed(const req_t& req, res_t& res);

    std::chrono::steady_clock::time_point started_at_;
};

}  // namespace warden::network
