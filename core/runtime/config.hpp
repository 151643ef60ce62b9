#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../device/device_config_loader.hpp"

namespace pixoogate {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 5000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct GatewayConfig {
    HttpConfig http;
    LoggingConfig logging;
    device::DeviceDefaults devices;           // Single-host settings and per-device fallbacks
    std::optional<std::string> devices_json;  // PIXOO_DEVICES_JSON, environment only
};

// Returns the variable's value, or nullopt when unset
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error);

/**
 * Overlays PIXOO_* environment variables onto config. Scalars use the same
 * lenient coercion as device descriptors: a malformed value keeps the current
 * setting.
 */
void apply_environment(GatewayConfig &config, const EnvLookup &lookup);
void apply_environment(GatewayConfig &config);

// Validates the configuration
bool validate_config(const GatewayConfig &config, std::string &error);

}  // namespace runtime
}  // namespace pixoogate
