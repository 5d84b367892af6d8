#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "ConnectionRegistry.hpp"
#include "ServerState.hpp"

namespace warden::core {

struct ShutdownPolicy {
    std::chrono::milliseconds grace_period{10000};
    std::chrono::milliseconds drain_poll_interval{1000};
    // Upper bound on the force-close phase once the grace period is over.
    std::chrono::milliseconds force_close_timeout{1000};
};

/**
 * @brief Parameters captured once when a shutdown starts. Never mutated.
 */
struct ShutdownPlan {
    std::string reason;
    std::chrono::steady_clock::time_point started_at;
    std::chrono::steady_clock::time_point grace_deadline;
    std::chrono::steady_clock::time_point force_deadline;

    static ShutdownPlan Make(std::string reason, const ShutdownPolicy& policy,
                             std::chrono::steady_clock::time_point now);
};

struct ShutdownOutcome {
    std::string reason;
    bool performed = false;  // false when the server was not Running
    bool forced = false;     // grace period expired before the registry drained
    std::size_t force_closed = 0;  // still registered when the grace period ended
    std::chrono::milliseconds elapsed{0};
};

struct ShutdownHooks {
    // Invoked once, right after Running -> Stopping. Must stop new accepts.
    std::function<void()> stop_accepting;

    // Invoked after Stopping -> Stopped, before the future is fulfilled.
    std::function<void(const ShutdownOutcome&)> on_complete;
};

/**
 * @brief Orchestrates graceful drain versus forced termination.
 *
 * @details
 * **Algorithm**
 * 1. Not Running: return the last cycle's future (or a ready "not performed"
 *    one). A second call during a drain therefore gets the same pending future.
 * 2. Running -> Stopping, then stop the listener.
 * 3. Ask every idle connection to close.
 * 4. Wait on the registry until it is empty, waking every poll interval to
 *    log progress, but never beyond the grace deadline.
 * 5. If the grace deadline passes first, force-close whatever is left on
 *    each connection's executor. A connection whose executor has not closed
 *    it by the force deadline is severed from this thread. Each one is
 *    deregistered only after that.
 * 6. Stopping -> Stopped with an empty registry; fulfil the future.
 *
 * The drain runs on a worker thread owned by the coordinator, so Shutdown()
 * never blocks the caller (signal handlers, I/O threads).
 */
class ShutdownCoordinator {
   public:
    ShutdownCoordinator(ServerStateMachine& state, ConnectionRegistry& registry,
                        ShutdownPolicy policy, ShutdownHooks hooks = {});

    // Joins a drain that is still running.
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    std::shared_future<ShutdownOutcome> Shutdown(const std::string& reason);

    const ShutdownPolicy& policy() const noexcept { return policy_; }

   private:
    ShutdownOutcome Drain(const ShutdownPlan& plan);
    void CloseIdleConnections();
    std::size_t ForceCloseRemaining(std::chrono::steady_clock::time_point deadline);
    void Complete(const ShutdownPlan& plan, std::promise<ShutdownOutcome> promise);

    ServerStateMachine& state_;
    ConnectionRegistry& registry_;
    const ShutdownPolicy policy_;
    ShutdownHooks hooks_;

    std::mutex mutex_;
    std::shared_future<ShutdownOutcome> last_;
    std::jthread worker_;
};

}  // namespace warden::core
