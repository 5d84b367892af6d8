#include "ServerState.hpp"

#include <spdlog/spdlog.h>

namespace warden::core {

std::string_view to_string(ServerState state) noexcept {
    switch (state) {
        case ServerState::Stopped:
            return "Stopped";
        case ServerState::Starting:
            return "Starting";
        case ServerState::Running:
            return "Running";
        case ServerState::Stopping:
            return "Stopping";
    }
    return "Unknown";
}

bool ServerStateMachine::IsLegal(ServerState from, ServerState to) noexcept {
    switch (from) {
        case ServerState::Stopped:
            return to == ServerState::Starting;
        case ServerState::Starting:
            return to == ServerState::Running;
        case ServerState::Running:
            return to == ServerState::Stopping;
        case ServerState::Stopping:
            // Resets the cycle; never back to Starting directly.
            return to == ServerState::Stopped;
    }
    return false;
}

bool ServerStateMachine::TryTransition(ServerState from, ServerState to) {
    if (!IsLegal(from, to)) {
        spdlog::warn("[State] Illegal transition {} -> {} rejected", to_string(from),
                     to_string(to));
        return false;
    }

    ServerState expected = from;
    if (!state_.compare_exchange_strong(expected, to, std::memory_order_acq_rel,
                                        std::memory_order_acquire)) {
        spdlog::debug("[State] Transition {} -> {} lost: current state is {}", to_string(from),
                      to_string(to), to_string(expected));
        return false;
    }

    spdlog::info("[State] {} -> {}", to_string(from), to_string(to));
    return true;
}

}  // namespace warden::core
