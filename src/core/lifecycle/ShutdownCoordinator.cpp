#include "ShutdownCoordinator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

namespace warden::core {

using Clock = std::chrono::steady_clock;

ShutdownPlan ShutdownPlan::Make(std::string reason, const ShutdownPolicy& policy,
                                Clock::time_point now) {
    ShutdownPlan plan;
    plan.reason = std::move(reason);
    plan.started_at = now;
    plan.grace_deadline = now + policy.grace_period;
    plan.force_deadline = plan.grace_deadline + policy.force_close_timeout;
    return plan;
}

ShutdownCoordinator::ShutdownCoordinator(ServerStateMachine& state, ConnectionRegistry& registry,
                                         ShutdownPolicy policy, ShutdownHooks hooks)
    : state_(state), registry_(registry), policy_(policy), hooks_(std::move(hooks)) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

std::shared_future<ShutdownOutcome> ShutdownCoordinator::Shutdown(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!state_.TryTransition(ServerState::Running, ServerState::Stopping)) {
        spdlog::info("[Shutdown] {} received while {}; shutdown already handled", reason,
                     to_string(state_.Current()));
        if (last_.valid()) {
            return last_;
        }
        std::promise<ShutdownOutcome> ready;
        ready.set_value(ShutdownOutcome{reason, false, false, 0, std::chrono::milliseconds{0}});
        return ready.get_future().share();
    }

    auto plan = ShutdownPlan::Make(reason, policy_, Clock::now());
    spdlog::info("[Shutdown] Graceful shutdown triggered by {} (grace {} ms)", plan.reason,
                 policy_.grace_period.count());

    std::promise<ShutdownOutcome> promise;
    last_ = promise.get_future().share();

    if (hooks_.stop_accepting) {
        try {
            hooks_.stop_accepting();
        } catch (const std::exception& e) {
            spdlog::error("[Shutdown] Failed to stop listener: {}", e.what());
        }
    }

    // Assigning over a finished worker joins it first.
    worker_ = std::jthread([this, plan = std::move(plan), promise = std::move(promise)]() mutable {
        Complete(plan, std::move(promise));
    });

    return last_;
}

void ShutdownCoordinator::Complete(const ShutdownPlan& plan,
                                   std::promise<ShutdownOutcome> promise) {
    try {
        auto outcome = Drain(plan);

        if (!state_.TryTransition(ServerState::Stopping, ServerState::Stopped)) {
            spdlog::critical("[Shutdown] Could not enter Stopped from {}",
                             to_string(state_.Current()));
        }

        if (hooks_.on_complete) {
            try {
                hooks_.on_complete(outcome);
            } catch (const std::exception& e) {
                spdlog::error("[Shutdown] Completion hook failed: {}", e.what());
            }
        }

        promise.set_value(std::move(outcome));
    } catch (const std::exception& e) {
        spdlog::critical("[Shutdown] Shutdown cycle failed: {}", e.what());
        promise.set_exception(std::current_exception());
    }
}

ShutdownOutcome ShutdownCoordinator::Drain(const ShutdownPlan& plan) {
    ShutdownOutcome outcome;
    outcome.reason = plan.reason;
    outcome.performed = true;

    CloseIdleConnections();

    bool drained = false;
    for (;;) {
        const auto wake = std::min(Clock::now() + policy_.drain_poll_interval, plan.grace_deadline);
        if (registry_.WaitUntilEmpty(wake)) {
            drained = true;
            break;
        }
        if (Clock::now() >= plan.grace_deadline) {
            break;
        }
        spdlog::info("[Shutdown] Waiting for {} connections to close...", registry_.Size());
    }

    if (!drained) {
        spdlog::warn("[Shutdown] Grace period of {} ms exceeded; terminating remaining connections",
                     policy_.grace_period.count());
        outcome.forced = true;
        outcome.force_closed = ForceCloseRemaining(plan.force_deadline);
    }

    const auto left = registry_.Size();
    if (left != 0) {
        spdlog::critical("[Shutdown] {} connections still registered on entering Stopped", left);
    }

    outcome.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - plan.started_at);

    if (outcome.forced) {
        spdlog::warn("[Shutdown] Forced shutdown completed in {} ms ({} connections severed)",
                     outcome.elapsed.count(), outcome.force_closed);
    } else {
        spdlog::info("[Shutdown] Graceful shutdown completed in {} ms", outcome.elapsed.count());
    }
    return outcome;
}

void ShutdownCoordinator::CloseIdleConnections() {
    registry_.ForEach([](const Connection& connection) {
        auto handle = connection.handle.lock();
        if (!handle) {
            return;
        }
        try {
            handle->CloseIfIdle();
        } catch (const std::exception& e) {
            spdlog::error("[Shutdown] Close request for connection {} failed: {}", connection.id,
                          e.what());
        }
    });
}

std::size_t ShutdownCoordinator::ForceCloseRemaining(Clock::time_point deadline) {
    struct PendingClose {
        Connection connection;
        std::shared_ptr<IConnectionHandle> handle;
        std::shared_future<void> closed;
    };

    std::size_t severed = 0;
    do {
        // 1. Ask every remaining connection to close on its own executor
        std::vector<PendingClose> pending;
        registry_.ForEach([&pending](const Connection& connection) {
            PendingClose entry{connection, connection.handle.lock(), {}};
            if (entry.handle) {
                try {
                    entry.closed = entry.handle->ForceClose();
                } catch (const std::exception& e) {
                    spdlog::error("[Shutdown] Force close of connection {} ({}) failed: {}",
                                  connection.id, connection.remote_address, e.what());
                }
            }
            pending.push_back(std::move(entry));
        });

        // 2. Wait for each close until the deadline; sever the ones still stuck
        for (auto& entry : pending) {
            const auto& connection = entry.connection;
            if (entry.handle) {
                const bool closed = entry.closed.valid() &&
                                    entry.closed.wait_until(deadline) == std::future_status::ready;
                if (!closed) {
                    spdlog::warn("[Shutdown] Connection {} ({}) did not close by the deadline; "
                                 "severing",
                                 connection.id, connection.remote_address);
                    try {
                        entry.handle->Sever();
                    } catch (const std::exception& e) {
                        spdlog::error("[Shutdown] Severing connection {} failed: {}",
                                      connection.id, e.what());
                    }
                }
            }
            // Deregister even if the transport refused to close. The session
            // may already have removed itself once its socket closed.
            registry_.Remove(connection.id);
            ++severed;
        }
    } while (registry_.Size() != 0 && Clock::now() < deadline);
    return severed;
}

}  // namespace warden::core
