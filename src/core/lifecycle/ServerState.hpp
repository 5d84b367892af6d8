#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

namespace warden::core {

/**
 * @brief Lifecycle phase of one server instance.
 *
 * Legal cycle: Stopped -> Starting -> Running -> Stopping -> Stopped.
 */
enum class ServerState : uint8_t { Stopped, Starting, Running, Stopping };

std::string_view to_string(ServerState state) noexcept;

/**
 * @brief Guards lifecycle transitions of the server.
 *
 * @details
 * The current phase lives in a single atomic so that connection handlers
 * asking "are we still accepting?" never race with the shutdown task that
 * flips Running -> Stopping. Every transition is a compare-and-swap
 * against the expected source phase; a transition outside the legal table
 * or from a stale source phase fails without touching the state.
 */
class ServerStateMachine {
   public:
    ServerStateMachine() = default;

    ServerStateMachine(const ServerStateMachine&) = delete;
    ServerStateMachine& operator=(const ServerStateMachine&) = delete;

    // Returns false (and logs) when the edge is illegal or `from` is stale.
    [[nodiscard]] bool TryTransition(ServerState from, ServerState to);

    [[nodiscard]] ServerState Current() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] bool IsAccepting() const noexcept { return Current() == ServerState::Running; }

    static bool IsLegal(ServerState from, ServerState to) noexcept;

   private:
    std::atomic<ServerState> state_{ServerState::Stopped};
};

}  // namespace warden::core
