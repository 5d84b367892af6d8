#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "config.hpp"

using namespace std::chrono_literals;
using warden::core::AppConfig;
using warden::core::ConfigError;
using warden::core::LoadConfig;
using warden::core::NormalizeLoopbackHost;
using warden::core::ValidateConfig;

namespace {

class ConfigFileTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = std::filesystem::temp_directory_path() /
                (std::string("warden_") + info->name() + ".toml");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string Write(std::string_view contents) {
        std::ofstream out(path_, std::ios::trunc);
        out << contents;
        return path_.string();
    }

    std::filesystem::path path_;
};

}  // namespace

TEST(ConfigHost, AcceptsLoopbackSpellings) {
    EXPECT_EQ(NormalizeLoopbackHost("127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(NormalizeLoopbackHost("localhost"), "127.0.0.1");
    EXPECT_EQ(NormalizeLoopbackHost("  LocalHost\t"), "127.0.0.1");
}

TEST(ConfigHost, RejectsEverythingElse) {
    for (std::string_view host : {"0.0.0.0", "192.168.1.10", "::1", "example.com", "", "127.0.0.2"}) {
        EXPECT_THROW(NormalizeLoopbackHost(host), ConfigError) << host;
    }
}

TEST(ConfigValidate, DefaultsAreValid) {
    AppConfig config;
    EXPECT_NO_THROW(ValidateConfig(config));
    EXPECT_EQ(config.server.hostname, "127.0.0.1");
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_FALSE(config.server.requires_privilege);
    EXPECT_EQ(config.timeouts.keep_alive, 5000ms);
    EXPECT_EQ(config.timeouts.shutdown_grace, 10000ms);
    EXPECT_EQ(config.timeouts.drain_poll_interval, 1000ms);
}

TEST(ConfigValidate, PrivilegedPortFlagged) {
    AppConfig config;
    config.server.port = 80;
    ValidateConfig(config);
    EXPECT_TRUE(config.server.requires_privilege);

    config.server.port = 1024;
    ValidateConfig(config);
    EXPECT_FALSE(config.server.requires_privilege);
}

TEST(ConfigValidate, RejectsBadValues) {
    {
        AppConfig config;
        config.server.port = 0;
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
    {
        AppConfig config;
        config.server.threads = 0;
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
    {
        AppConfig config;
        config.timeouts.shutdown_grace = 0ms;
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
    {
        AppConfig config;
        config.timeouts.drain_poll_interval = -5ms;
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
    {
        AppConfig config;
        config.limits.max_body_bytes = 0;
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
    {
        AppConfig config;
        config.server.hostname = "10.0.0.1";
        EXPECT_THROW(ValidateConfig(config), ConfigError);
    }
}

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    auto config = LoadConfig(path_.string());
    EXPECT_EQ(config.server.port, 3000);
    EXPECT_EQ(config.server.hostname, "127.0.0.1");
    EXPECT_EQ(config.limits.max_body_bytes, warden::core::DEFAULT_MAX_BODY_BYTES);
}

TEST_F(ConfigFileTest, ReadsAllSections) {
    auto path = Write(R"(
[server]
hostname = "localhost"
port = 8081
threads = 4

[timeouts]
request_ms = 1500
keep_alive_ms = 2000
shutdown_grace_ms = 3000
drain_poll_interval_ms = 250
force_close_ms = 400

[limits]
max_body_bytes = 4096
)");

    auto config = LoadConfig(path);
    EXPECT_EQ(config.server.hostname, "127.0.0.1");
    EXPECT_EQ(config.server.port, 8081);
    EXPECT_EQ(config.server.threads, 4U);
    EXPECT_EQ(config.timeouts.request, 1500ms);
    EXPECT_EQ(config.timeouts.keep_alive, 2000ms);
    EXPECT_EQ(config.timeouts.shutdown_grace, 3000ms);
    EXPECT_EQ(config.timeouts.drain_poll_interval, 250ms);
    EXPECT_EQ(config.timeouts.force_close, 400ms);
    EXPECT_EQ(config.limits.max_body_bytes, 4096U);
}

TEST_F(ConfigFileTest, PartialFileKeepsOtherDefaults) {
    auto path = Write("[timeouts]\nshutdown_grace_ms = 500\n");

    auto config = LoadConfig(path);
    EXPECT_EQ(config.timeouts.shutdown_grace, 500ms);
    EXPECT_EQ(config.timeouts.keep_alive, 5000ms);
    EXPECT_EQ(config.server.port, 3000);
}

TEST_F(ConfigFileTest, NonLoopbackHostRejected) {
    auto path = Write("[server]\nhostname = \"0.0.0.0\"\n");
    EXPECT_THROW(LoadConfig(path), ConfigError);
}

TEST_F(ConfigFileTest, PortOutOfRangeRejected) {
    EXPECT_THROW(LoadConfig(Write("[server]\nport = 70000\n")), ConfigError);
    EXPECT_THROW(LoadConfig(Write("[server]\nport = 0\n")), ConfigError);
    EXPECT_THROW(LoadConfig(Write("[server]\nport = -1\n")), ConfigError);
}

TEST_F(ConfigFileTest, NonPositiveTimeoutRejected) {
    EXPECT_THROW(LoadConfig(Write("[timeouts]\nkeep_alive_ms = 0\n")), ConfigError);
}

TEST_F(ConfigFileTest, MalformedTomlRejected) {
    EXPECT_THROW(LoadConfig(Write("[server\nport = \n")), ConfigError);
}
