#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "Types.hpp"

namespace warden::infra {

/**
 * @brief Manages a pool of `io_context` instances, each pinning a thread.
 * Thread pool with one io_context per thread.
 * Assigns contexts via round-robin.
 */
class IoContextPool {
   public:
    // Receives the message of any exception escaping io_context::run().
    using FaultHandler = std::function<void(const std::string&)>;

    explicit IoContextPool(std::size_t pool_size, FaultHandler on_fault = {});

    // Destructor. Stops and joins all threads.
    ~IoContextPool();

    // Disable copying
    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void run();

    // Stops all io_context objects. Threads are joined on destruction.
    void stop();

    //@brief Get an io_context from the pool in a round-robin fashion.
    asio::io_context& get_io_context();

    std::size_t size() const noexcept { return io_contexts_.size(); }

   private:
    std::vector<std::shared_ptr<asio::io_context>> io_contexts_;

    using work_guard_type = asio::executor_work_guard<asio::io_context::executor_type>;
    std::vector<work_guard_type> work_guards_;

    std::vector<std::jthread> threads_;

    std::atomic<std::size_t> next_io_context_{0};
    std::atomic<bool> stopped_{false};
    FaultHandler on_fault_;
};

}  // namespace warden::infra
