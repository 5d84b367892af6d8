#include "config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <toml++/toml.hpp>

namespace warden::core {

namespace {

constexpr std::int64_t MAX_PORT = 65535;

std::chrono::milliseconds read_millis(const toml::node_view<toml::node>& table,
                                      std::string_view key, std::chrono::milliseconds fallback) {
    return std::chrono::milliseconds{table[key].value_or<std::int64_t>(fallback.count())};
}

void require_positive(std::chrono::milliseconds value, std::string_view name) {
    if (value.count() <= 0) {
        throw ConfigError(std::string(name) + " must be a positive number of milliseconds");
    }
}

}  // namespace

std::string NormalizeLoopbackHost(std::string_view hostname) {
    std::string host(hostname);
    host.erase(host.begin(), std::find_if(host.begin(), host.end(),
                                          [](unsigned char c) { return !std::isspace(c); }));
    host.erase(std::find_if(host.rbegin(), host.rend(),
                            [](unsigned char c) { return !std::isspace(c); })
                   .base(),
               host.end());
    std::transform(host.begin(), host.end(), host.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (host == "127.0.0.1" || host == "localhost") {
        return "127.0.0.1";
    }
    throw ConfigError("Invalid hostname '" + std::string(hostname) +
                      "': only 127.0.0.1 or localhost may be bound");
}

void ValidateConfig(AppConfig& config) {
    config.server.hostname = NormalizeLoopbackHost(config.server.hostname);

    if (config.server.port == 0) {
        throw ConfigError("Port must be between 1 and 65535");
    }
    config.server.requires_privilege = config.server.port < FIRST_UNPRIVILEGED_PORT;
    if (config.server.requires_privilege) {
        spdlog::warn("Port {} is privileged and requires elevated permissions to bind",
                     config.server.port);
    }

    if (config.server.threads == 0) {
        throw ConfigError("server.threads must be at least 1");
    }

    require_positive(config.timeouts.request, "timeouts.request_ms");
    require_positive(config.timeouts.keep_alive, "timeouts.keep_alive_ms");
    require_positive(config.timeouts.shutdown_grace, "timeouts.shutdown_grace_ms");
    require_positive(config.timeouts.drain_poll_interval, "timeouts.drain_poll_interval_ms");
    require_positive(config.timeouts.force_close, "timeouts.force_close_ms");

    if (config.limits.max_body_bytes == 0) {
        throw ConfigError("limits.max_body_bytes must be positive");
    }
}

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        ValidateConfig(config);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw ConfigError("Config parse error: " + std::string(err.description()));
    }

    // 1. Server Settings
    if (auto server = tbl["server"]) {
        config.server.hostname = server["hostname"].value_or(config.server.hostname);

        const auto port = server["port"].value_or<std::int64_t>(DEFAULT_PORT);
        if (port < 1 || port > MAX_PORT) {
            throw ConfigError("Port " + std::to_string(port) + " out of range 1-65535");
        }
        config.server.port = static_cast<std::uint16_t>(port);

        const auto threads = server["threads"].value_or<std::int64_t>(1);
        if (threads < 1) {
            throw ConfigError("server.threads must be at least 1");
        }
        config.server.threads = static_cast<unsigned int>(threads);
    }

    // 2. Timeouts
    if (auto timeouts = tbl["timeouts"]) {
        auto& t = config.timeouts;
        t.request = read_millis(timeouts, "request_ms", t.request);
        t.keep_alive = read_millis(timeouts, "keep_alive_ms", t.keep_alive);
        t.shutdown_grace = read_millis(timeouts, "shutdown_grace_ms", t.shutdown_grace);
        t.drain_poll_interval =
            read_millis(timeouts, "drain_poll_interval_ms", t.drain_poll_interval);
        t.force_close = read_millis(timeouts, "force_close_ms", t.force_close);
    }

    // 3. Limits
    if (auto limits = tbl["limits"]) {
        const auto body = limits["max_body_bytes"].value_or<std::int64_t>(
            static_cast<std::int64_t>(config.limits.max_body_bytes));
        if (body < 1) {
            throw ConfigError("limits.max_body_bytes must be positive");
        }
        config.limits.max_body_bytes = static_cast<std::size_t>(body);
    }

    ValidateConfig(config);
    spdlog::info("Loaded configuration from {}", path);
    return config;
}

}  // namespace warden::core
