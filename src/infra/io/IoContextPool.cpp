#include "IoContextPool.hpp"

#include <stdexcept>

#include "spdlog/spdlog.h"

namespace warden::infra {

IoContextPool::IoContextPool(std::size_t pool_size, FaultHandler on_fault)
    : on_fault_(std::move(on_fault)) {
  if (pool_size == 0) {
    throw std::runtime_error("IoContextPool size must be > 0");
  }

  for (std::size_t i = 0; i < pool_size; ++i) {
    auto ioc = std::make_shared<asio::io_context>(1);
    io_contexts_.push_back(ioc);
    work_guards_.emplace_back(asio::make_work_guard(*ioc));
  }
}

IoContextPool::~IoContextPool() {
  stop();
  threads_.clear();  // jthread joins
}

void IoContextPool::run() {
  if (!threads_.empty()) {
    return;
  }

  spdlog::info("Starting I/O pool with {} threads.", io_contexts_.size());

  for (const auto& ioc : io_contexts_) {
    threads_.emplace_back([this, ioc]() {
      // Keep serving after a fault so that the shutdown cycle it triggers
      // can still drain connections living on this context.
      while (!ioc->stopped()) {
        try {
          ioc->run();
        } catch (const std::exception& e) {
          spdlog::critical("io_context thread exception: {}", e.what());
          if (on_fault_) {
            on_fault_(e.what());
          }
        }
      }
    });
  }
}

void IoContextPool::stop() {
  if (stopped_.exchange(true)) {
    return;
  }

  work_guards_.clear();

  for (const auto& ioc : io_contexts_) {
    if (ioc && !ioc->stopped()) {
      ioc->stop();
    }
  }
}

asio::io_context& IoContextPool::get_io_context() {
  // Thread safe Round-robin selection
  std::size_t idx = next_io_context_.fetch_add(1, std::memory_order_relaxed) %
                    io_contexts_.size();

  auto& ptr = io_contexts_[idx];
  if (!ptr) {
    spdlog::critical("io_context is null at index {}", idx);
    throw std::runtime_error("null io_context in pool");
  }

  return *ptr;
}

}  // namespace warden::infra
