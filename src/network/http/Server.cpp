#include "Server.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <optional>

#include "ConnectionRegistry.hpp"
#include "IoContextPool.hpp"
#include "Listener.hpp"
#include "Router.hpp"
#include "SessionContext.hpp"
#include "Types.hpp"

namespace warden::network {

struct Server::Impl {
    asio::io_context& main_io_;
    core::AppConfig config_;
    tcp::endpoint endpoint_;

    // Shared state; declared first so that sessions torn down with the pool
    // can still deregister.
    core::ServerStateMachine state_;
    core::ConnectionRegistry registry_;
    std::atomic<bool> closing_{false};

    // Components
    std::shared_ptr<SessionContext> context_;
    std::unique_ptr<infra::IoContextPool> pool_;
    std::shared_ptr<listener> listener_;
    std::unique_ptr<core::ShutdownCoordinator> coordinator_;

    using work_guard_type = asio::executor_work_guard<asio::io_context::executor_type>;
    std::optional<work_guard_type> main_guard_;

    Impl(asio::io_context& io, core::AppConfig config, std::shared_ptr<IRequestRouter> router)
        : main_io_(io), config_(std::move(config))
    {
        // 1. Bind target (loopback only, decided before any socket exists)
        config_.server.hostname = core::NormalizeLoopbackHost(config_.server.hostname);
        endpoint_ = tcp::endpoint{asio::ip::make_address(config_.server.hostname),
                                  config_.server.port};

        // 2. Request Routing
        if (!router) {
            router = std::make_shared<Router>();
        }
        context_ = std::make_shared<SessionContext>(SessionContext{
            registry_, state_, std::move(router), config_.timeouts,
            config_.limits.max_body_bytes,
            [this](const std::string& what) { OnFault(what); }});

        // 3. Thread Pool
        pool_ = std::make_unique<infra::IoContextPool>(
            std::max(1U, config_.server.threads),
            [this](const std::string& what) { OnFault(what); });

        // 4. Shutdown Coordination
        core::ShutdownPolicy policy;
        policy.grace_period = config_.timeouts.shutdown_grace;
        policy.drain_poll_interval = config_.timeouts.drain_poll_interval;
        policy.force_close_timeout = config_.timeouts.force_close;

        core::ShutdownHooks hooks;
        hooks.stop_accepting = [this]() {
            if (listener_) {
                listener_->stop();
            }
        };
        hooks.on_complete = [this](const core::ShutdownOutcome&) {
            pool_->stop();
            // Queued behind the acceptor close posted by stop_accepting.
            asio::post(main_io_, [this]() {
                main_guard_.reset();
                main_io_.stop();
            });
        };
        coordinator_ = std::make_unique<core::ShutdownCoordinator>(state_, registry_, policy,
                                                                   std::move(hooks));

        spdlog::info("Server initialized on {}:{} (Threads: {})", config_.server.hostname,
                     config_.server.port, pool_->size());
    }

    ~Impl() {
        closing_.store(true);
        pool_->stop();
        coordinator_.reset();  // joins a drain still in progress
    }

    void Start() {
        if (!state_.TryTransition(core::ServerState::Stopped, core::ServerState::Starting)) {
            throw std::logic_error("Server::Start called while " +
                                   std::string(core::to_string(state_.Current())));
        }

        listener_ = std::make_shared<listener>(main_io_, *pool_, endpoint_, context_);
        main_guard_.emplace(asio::make_work_guard(main_io_));

        pool_->run();     // Start worker threads
        if (!state_.TryTransition(core::ServerState::Starting, core::ServerState::Running)) {
            throw std::logic_error("Server could not enter Running");
        }
        listener_->run(); // Start accepting connections

        spdlog::info("Server running at http://{}:{}/", config_.server.hostname,
                     listener_->port());
    }

    void Run() {
        if (state_.Current() == core::ServerState::Stopped) {
            Start();
        }
        // Start main thread loop; a fault triggers one shutdown cycle and the
        // loop keeps serving it until the coordinator stops the context.
        while (!main_io_.stopped()) {
            try {
                main_io_.run();
            } catch (const std::exception& e) {
                OnFault(e.what());
            }
        }
    }

    void OnFault(const std::string& what) {
        if (closing_.load()) {
            return;
        }
        spdlog::critical("Programming fault, starting shutdown: {}", what);
        coordinator_->Shutdown("UNCAUGHT_EXCEPTION");
    }
};

Server::Server(asio::io_context& io, core::AppConfig config,
               std::shared_ptr<IRequestRouter> router)
    : pImpl_(std::make_unique<Impl>(io, std::move(config), std::move(router)))
{}

Server::~Server() = default;

void Server::Start() { pImpl_->Start(); }
void Server::Run()   { pImpl_->Run(); }

std::shared_future<core::ShutdownOutcome> Server::Shutdown(const std::string& reason) {
    return pImpl_->coordinator_->Shutdown(reason);
}

std::uint16_t Server::port() const {
    return pImpl_->listener_ ? pImpl_->listener_->port() : pImpl_->config_.server.port;
}

core::ServerState Server::state() const { return pImpl_->state_.Current(); }

std::size_t Server::active_connections() const { return pImpl_->registry_.Size(); }

}  // namespace warden::network
