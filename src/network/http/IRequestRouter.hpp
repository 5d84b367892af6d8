#pragma once

#include "Types.hpp"

namespace warden::network {

/**
 * @brief Application logic behind the admission layer.
 *
 * Only admitted requests reach an implementation. It may throw; the session
 * turns any exception into a 500.
 */
struct IRequestRouter {
    virtual ~IRequestRouter() = default;

    virtual res_t RouteRequest(const req_t& req) = 0;
};

}  // namespace warden::network
