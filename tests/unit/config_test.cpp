#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace fs = std::filesystem;
using namespace pixoogate;
using namespace pixoogate::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "pixoogate_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    static EnvLookup env(const std::map<std::string, std::string> &values) {
        return [values](const std::string &name) -> std::optional<std::string> {
            auto it = values.find(name);
            if (it == values.end()) {
                return std::nullopt;
            }
            return it->second;
        };
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    GatewayConfig config;
    std::string error;
    EXPECT_TRUE(validate_config(config, error)) << error;
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 5000);
    EXPECT_EQ(config.devices.screen_size, 64);
    EXPECT_EQ(config.devices.connection_retries, 10);
    EXPECT_EQ(config.devices.device_type, device::DeviceType::AUTO);
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_path = create_config_file("full.yaml", R"(
http:
  bind: 127.0.0.1
  port: 8080
  thread_pool_size: 4
  cors_allowed_origins:
    - http://localhost:3000
    - https://*.example.com

logging:
  level: debug

devices:
  host: 192.168.1.20
  device_type: time-gate
  screen_size: 128
  debug: true
  connection_retries: 2
)");

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;

    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.http.port, 8080);
    EXPECT_EQ(config.http.thread_pool_size, 4);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 2u);
    EXPECT_EQ(config.http.cors_allowed_origins[1], "https://*.example.com");
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.devices.host, "192.168.1.20");
    EXPECT_EQ(config.devices.device_type, device::DeviceType::TIME_GATE);
    EXPECT_EQ(config.devices.screen_size, 128);
    EXPECT_TRUE(config.devices.debug);
    EXPECT_EQ(config.devices.connection_retries, 2);
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST_F(ConfigTest, ScalarCorsOrigin) {
    std::string config_path = create_config_file("cors.yaml", R"(
http:
  cors_allowed_origins: http://localhost:3000
)");

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "http://localhost:3000");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    std::string config_path = create_config_file("unknown.yaml", R"(
telemetry:
  enabled: true
http:
  port: 6000
)");

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ(config.http.port, 6000);
}

TEST_F(ConfigTest, MissingFile) {
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load_config((temp_dir / "missing.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos) << error;
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("bad.yaml", "http: [port: 1\n");
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

TEST_F(ConfigTest, WrongTypeFails) {
    std::string config_path = create_config_file("type.yaml", R"(
http:
  port: not-a-number
)");
    GatewayConfig config;
    std::string error;
    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos) << error;
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
    std::string error;

    GatewayConfig config;
    config.http.port = 0;
    EXPECT_FALSE(validate_config(config, error));

    config = GatewayConfig{};
    config.http.thread_pool_size = 0;
    EXPECT_FALSE(validate_config(config, error));

    config = GatewayConfig{};
    config.logging.level = "verbose";
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_EQ(error, "Invalid log level: verbose");

    config = GatewayConfig{};
    config.devices.connection_retries = -1;
    EXPECT_FALSE(validate_config(config, error));
}

TEST_F(ConfigTest, EnvironmentOverlay) {
    GatewayConfig config;
    apply_environment(config, env({{"PIXOO_HOST", "10.0.0.5"},
                                   {"PIXOO_DEVICE_TYPE", "TimeGate"},
                                   {"PIXOO_SCREEN_SIZE", "128"},
                                   {"PIXOO_DEBUG", "yes"},
                                   {"PIXOO_CONNECTION_RETRIES", "3"},
                                   {"PIXOO_REST_HOST", "127.0.0.1"},
                                   {"PIXOO_REST_PORT", "8000"},
                                   {"PIXOO_DEVICES_JSON", "[]"}}));

    EXPECT_EQ(config.devices.host, "10.0.0.5");
    EXPECT_EQ(config.devices.device_type, device::DeviceType::TIME_GATE);
    EXPECT_EQ(config.devices.screen_size, 128);
    EXPECT_TRUE(config.devices.debug);
    EXPECT_EQ(config.devices.connection_retries, 3);
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.http.port, 8000);
    ASSERT_TRUE(config.devices_json.has_value());
    EXPECT_EQ(*config.devices_json, "[]");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, EnvironmentMalformedScalarsKeepCurrentValues) {
    GatewayConfig config;
    config.devices.screen_size = 32;
    apply_environment(config, env({{"PIXOO_SCREEN_SIZE", "big"},
                                   {"PIXOO_CONNECTION_RETRIES", "-4"},
                                   {"PIXOO_REST_PORT", "http"}}));

    EXPECT_EQ(config.devices.screen_size, 32);
    EXPECT_EQ(config.devices.connection_retries, 10);
    EXPECT_EQ(config.http.port, 5000);
    EXPECT_FALSE(config.devices_json.has_value());
}

TEST_F(ConfigTest, RestDebugForcesDebugLevel) {
    GatewayConfig config;
    apply_environment(config, env({{"PIXOO_REST_DEBUG", "true"}}));
    EXPECT_EQ(config.logging.level, "debug");

    GatewayConfig quiet;
    apply_environment(quiet, env({{"PIXOO_REST_DEBUG", "false"}}));
    EXPECT_EQ(quiet.logging.level, "info");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    std::string config_path = create_config_file("env.yaml", R"(
devices:
  host: 192.168.1.20
  screen_size: 32
)");

    GatewayConfig config;
    std::string error;
    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    apply_environment(config, env({{"PIXOO_HOST", "10.1.1.1"}}));

    EXPECT_EQ(config.devices.host, "10.1.1.1");
    EXPECT_EQ(config.devices.screen_size, 32);
}
