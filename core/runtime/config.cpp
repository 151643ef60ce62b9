#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"

namespace pixoogate {
namespace runtime {

bool validate_config(const GatewayConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "HTTP bind address must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate device defaults
    if (config.devices.screen_size < 1) {
        error = "devices.screen_size must be >= 1";
        return false;
    }
    if (config.devices.connection_retries < 0) {
        error = "devices.connection_retries must be >= 0";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, GatewayConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "logging", "devices"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }

                if (config.http.cors_allowed_origins.empty()) {
                    config.http.cors_allowed_origins.push_back("*");
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"] && yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }

        // Load device defaults
        if (yaml["devices"]) {
            const auto &devices = yaml["devices"];
            if (devices["host"]) {
                config.devices.host = devices["host"].as<std::string>();
            }
            if (devices["device_type"]) {
                config.devices.device_type = device::normalize_device_type(devices["device_type"].as<std::string>());
            }
            if (devices["screen_size"]) {
                config.devices.screen_size = devices["screen_size"].as<int>();
            }
            if (devices["debug"]) {
                config.devices.debug = devices["debug"].as<bool>();
            }
            if (devices["connection_retries"]) {
                config.devices.connection_retries = devices["connection_retries"].as<int>();
            }
        }

        LOG_INFO("[Config] Loaded " << config_path);
        LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (" << config.http.thread_pool_size
                                   << " workers)");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

void apply_environment(GatewayConfig &config, const EnvLookup &lookup) {
    if (auto value = lookup("PIXOO_DEVICES_JSON")) {
        config.devices_json = *value;
    }
    if (auto value = lookup("PIXOO_HOST")) {
        config.devices.host = *value;
    }
    if (auto value = lookup("PIXOO_DEVICE_TYPE")) {
        config.devices.device_type = device::normalize_device_type(*value);
    }
    if (auto value = lookup("PIXOO_SCREEN_SIZE")) {
        int size = device::coerce_int(*value, config.devices.screen_size);
        if (size > 0) {
            config.devices.screen_size = size;
        }
    }
    if (auto value = lookup("PIXOO_DEBUG")) {
        config.devices.debug = device::coerce_bool(*value, config.devices.debug);
    }
    if (auto value = lookup("PIXOO_CONNECTION_RETRIES")) {
        int retries = device::coerce_int(*value, config.devices.connection_retries);
        if (retries >= 0) {
            config.devices.connection_retries = retries;
        }
    }
    if (auto value = lookup("PIXOO_REST_DEBUG")) {
        if (device::coerce_bool(*value, false)) {
            config.logging.level = "debug";
        }
    }
    if (auto value = lookup("PIXOO_REST_HOST")) {
        if (!value->empty()) {
            config.http.bind = *value;
        }
    }
    if (auto value = lookup("PIXOO_REST_PORT")) {
        config.http.port = device::coerce_int(*value, config.http.port);
    }
}

void apply_environment(GatewayConfig &config) {
    apply_environment(config, [](const std::string &name) -> std::optional<std::string> {
        const char *value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

}  // namespace runtime
}  // namespace pixoogate
