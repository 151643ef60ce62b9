#ifndef PIXOOGATE_DEVICE_DEVICE_CONFIG_LOADER_HPP
#define PIXOOGATE_DEVICE_DEVICE_CONFIG_LOADER_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "device_context.hpp"

namespace pixoogate {
namespace device {

// Process-wide fallbacks for fields a descriptor leaves out (or gets wrong)
struct DeviceDefaults {
    std::string host;
    DeviceType device_type = DeviceType::AUTO;
    int screen_size = kDefaultScreenSize;
    bool debug = false;
    int connection_retries = kDefaultConnectionRetries;
};

/**
 * @brief Build device seeds from the PIXOO_DEVICES_JSON value
 *
 * Elements without a non-empty host (or that are not objects) are dropped.
 * Malformed optional fields silently take the default. When the JSON is absent,
 * blank, or yields no usable element, a single device is built from defaults.
 *
 * Fails when the JSON is present but unparsable or not an array, or when
 * single-host mode is reached without a host.
 *
 * @param devices_json Raw JSON text (std::nullopt when the variable is unset)
 * @param defaults Fallback values
 * @param devices Output, in configuration order with unique keys
 * @param error Populated on failure
 */
bool load_devices(const std::optional<std::string> &devices_json, const DeviceDefaults &defaults,
                  std::vector<DeviceContext> &devices, std::string &error);

// Descriptor list -> seeds (the array branch of load_devices)
std::vector<DeviceContext> load_devices_from_list(const nlohmann::json &raw_devices, const DeviceDefaults &defaults);

// Lenient scalar coercion used for descriptors and scalar environment values
int coerce_int(const nlohmann::json &value, int fallback);
bool coerce_bool(const nlohmann::json &value, bool fallback);
int coerce_int(const std::string &value, int fallback);
bool coerce_bool(const std::string &value, bool fallback);

}  // namespace device
}  // namespace pixoogate

#endif  // PIXOOGATE_DEVICE_DEVICE_CONFIG_LOADER_HPP
