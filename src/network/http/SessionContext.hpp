#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "ConnectionRegistry.hpp"
#include "IRequestRouter.hpp"
#include "ServerState.hpp"
#include "config.hpp"

namespace warden::network {

/**
 * @brief Everything a session needs from its server, shared by all sessions.
 * Outlives every session: the server destroys its I/O pool first.
 */
struct SessionContext {
    core::ConnectionRegistry& registry;
    const core::ServerStateMachine& state;
    std::shared_ptr<IRequestRouter> router;
    core::TimeoutConfig timeouts;
    std::size_t max_body_bytes = core::DEFAULT_MAX_BODY_BYTES;

    // Programming faults escaping a session coroutine end up here.
    std::function<void(const std::string&)> on_fault;
};

}  // namespace warden::network
