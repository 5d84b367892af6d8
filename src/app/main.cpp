// 1. Standard Library
#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "Listener.hpp"
#include "Server.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace {

void setup_logging() {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(spdlog::level::info);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr size_t MAX_FILES = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/server.log", MAX_SIZE, MAX_FILES);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::trace);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::info);
}

const char* signal_name(int signal_number) {
    switch (signal_number) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "SIGNAL";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace warden;

    try {
        setup_logging();

        // 1. Argument Validation
        if (argc > 2) {
            spdlog::critical("Usage: warden_server [config.toml]");
            return EXIT_FAILURE;
        }

        // 2. Configuration
        const std::string config_path = argc == 2 ? argv[1] : "config.toml";
        auto config = core::LoadConfig(config_path);

        // 3. Server Setup
        asio::io_context main_ioc;
        network::Server server(main_ioc, config);

        // 4. Graceful Shutdown Signal
        asio::signal_set signals(main_ioc, SIGINT, SIGTERM);
        std::function<void(const boost::system::error_code&, int)> on_signal;
        on_signal = [&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Stop signal ({}) received. Shutting down...", signal_name(signal_number));
            server.Shutdown(signal_name(signal_number));
            // Keep listening: a second signal must reach the same pending shutdown.
            signals.async_wait(on_signal);
        };
        signals.async_wait(on_signal);

        // 5. Run
        server.Run();

        auto outcome = server.Shutdown("EXIT").get();
        if (outcome.forced) {
            spdlog::warn("Server shutdown complete after forcing {} connections closed.",
                         outcome.force_closed);
        } else {
            spdlog::info("Server shutdown complete.");
        }

    } catch (const core::ConfigError& e) {
        spdlog::critical("Configuration Error: {}", e.what());
        return EXIT_FAILURE;
    } catch (const network::BindError& e) {
        spdlog::critical("Failed to start listener: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
