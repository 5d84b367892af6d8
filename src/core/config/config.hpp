#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace warden::core {

static constexpr std::uint16_t DEFAULT_PORT = 3000;
static constexpr std::uint16_t FIRST_UNPRIVILEGED_PORT = 1024;
static constexpr std::size_t DEFAULT_MAX_BODY_BYTES = 1024 * 1024;

struct ServerConfig {
    std::string hostname = "127.0.0.1";
    std::uint16_t port = DEFAULT_PORT;
    unsigned int threads = 1;

    // Set by ValidateConfig for ports below 1024.
    bool requires_privilege = false;
};

struct TimeoutConfig {
    std::chrono::milliseconds request{30000};
    std::chrono::milliseconds keep_alive{5000};
    std::chrono::milliseconds shutdown_grace{10000};
    std::chrono::milliseconds drain_poll_interval{1000};
    std::chrono::milliseconds force_close{1000};
};

struct LimitsConfig {
    std::size_t max_body_bytes = DEFAULT_MAX_BODY_BYTES;
};

struct AppConfig {
    ServerConfig server;
    TimeoutConfig timeouts;
    LimitsConfig limits;
};

class ConfigError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Maps an accepted loopback hostname to the address to bind.
 * @return "127.0.0.1" for "127.0.0.1" and "localhost" (case-insensitive, trimmed).
 * @throws ConfigError for any other interface.
 */
std::string NormalizeLoopbackHost(std::string_view hostname);

/**
 * @brief Checks and normalises a configuration in place.
 *
 * Enforces loopback-only binding, port 1-65535, positive timeouts and at
 * least one I/O thread. Ports below 1024 are accepted but flagged.
 * @throws ConfigError on the first violated rule.
 */
void ValidateConfig(AppConfig& config);

/**
 * @brief Loads configuration from a TOML file, then validates it.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object; defaults if the file does not exist.
 * @throws ConfigError if the file cannot be parsed or fails validation.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

}  // namespace warden::core
