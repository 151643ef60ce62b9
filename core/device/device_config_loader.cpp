#include "device_config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <unordered_set>

#include "logging/logger.hpp"

namespace pixoogate {
namespace device {

namespace {
std::string trim(const std::string &s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Falsy JSON values (null, false, 0, "", [], {}) read as empty text
std::string as_text(const nlohmann::json &value) {
    if (value.is_string()) {
        return trim(value.get<std::string>());
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "";
    }
    if (value.is_number()) {
        return value == 0 ? "" : value.dump();
    }
    if ((value.is_array() || value.is_object()) && !value.empty()) {
        return value.dump();
    }
    return "";
}

const nlohmann::json &field(const nlohmann::json &object, const char *name) {
    static const nlohmann::json null_value;
    auto it = object.find(name);
    return it == object.end() ? null_value : *it;
}

// Collisions get "-2", "-3", ... (first free suffix), compared case-insensitively
std::string ensure_unique_key(const std::string &key, std::unordered_set<std::string> &used) {
    if (used.insert(to_lower(key)).second) {
        return key;
    }
    int suffix = 2;
    while (used.count(to_lower(key + "-" + std::to_string(suffix))) > 0) {
        ++suffix;
    }
    std::string unique = key + "-" + std::to_string(suffix);
    used.insert(to_lower(unique));
    return unique;
}
}  // namespace

int coerce_int(const std::string &value, int fallback) {
    std::string s = trim(value);
    if (s.empty()) {
        return fallback;
    }

    size_t pos = 0;
    bool negative = false;
    if (s[0] == '+' || s[0] == '-') {
        negative = s[0] == '-';
        pos = 1;
    }
    if (pos >= s.size()) {
        return fallback;
    }

    long long parsed = 0;
    for (; pos < s.size(); ++pos) {
        if (!std::isdigit(static_cast<unsigned char>(s[pos]))) {
            return fallback;
        }
        parsed = parsed * 10 + (s[pos] - '0');
        if (parsed > std::numeric_limits<int>::max()) {
            return fallback;
        }
    }
    return static_cast<int>(negative ? -parsed : parsed);
}

int coerce_int(const nlohmann::json &value, int fallback) {
    if (value.is_boolean()) {
        return value.get<bool>() ? 1 : 0;
    }
    if (value.is_number_integer()) {
        auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return fallback;
        }
        return static_cast<int>(v);
    }
    if (value.is_number_unsigned()) {
        auto v = value.get<unsigned long long>();
        return v > static_cast<unsigned long long>(std::numeric_limits<int>::max()) ? fallback : static_cast<int>(v);
    }
    if (value.is_number_float()) {
        double v = std::trunc(value.get<double>());
        if (!std::isfinite(v) || v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
            return fallback;
        }
        return static_cast<int>(v);
    }
    if (value.is_string()) {
        return coerce_int(value.get<std::string>(), fallback);
    }
    return fallback;
}

bool coerce_bool(const std::string &value, bool) {
    const std::string s = to_lower(trim(value));
    return s == "1" || s == "true" || s == "yes" || s == "y" || s == "on";
}

bool coerce_bool(const nlohmann::json &value, bool fallback) {
    if (value.is_null()) {
        return fallback;
    }
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        return coerce_bool(value.get<std::string>(), fallback);
    }
    if (value.is_number()) {
        return value != 0;
    }
    return !value.empty();
}

std::vector<DeviceContext> load_devices_from_list(const nlohmann::json &raw_devices, const DeviceDefaults &defaults) {
    std::vector<DeviceContext> devices;
    std::unordered_set<std::string> used_keys;

    size_t index = 0;
    for (const auto &raw : raw_devices) {
        ++index;
        if (!raw.is_object()) {
            LOG_WARN("[Devices] Entry " << index << " is not an object (ignored)");
            continue;
        }

        DeviceContext device;
        device.host = as_text(field(raw, "host"));
        if (device.host.empty()) {
            LOG_WARN("[Devices] Entry " << index << " has no host (ignored)");
            continue;
        }

        std::string name = as_text(field(raw, "name"));
        if (!name.empty()) {
            device.name = name;
        }

        std::string key = as_text(field(raw, "key"));
        if (key.empty()) {
            key = name.empty() ? device.host : name;
        }
        device.key = ensure_unique_key(key, used_keys);

        const auto &type_value = field(raw, "device_type");
        device.device_type = type_value.is_string() ? normalize_device_type(type_value.get<std::string>())
                                                    : normalize_device_type(defaults.device_type);

        device.screen_size = coerce_int(field(raw, "screen_size"), defaults.screen_size);
        if (device.screen_size <= 0) {
            device.screen_size = defaults.screen_size;
        }

        device.debug = coerce_bool(field(raw, "debug"), defaults.debug);

        device.connection_retries = coerce_int(field(raw, "connection_retries"), defaults.connection_retries);
        if (device.connection_retries < 0) {
            device.connection_retries = defaults.connection_retries;
        }

        LOG_DEBUG("[Devices] Parsed '" << device.key << "' -> " << device.host << " ("
                                      << device_type_to_string(device.device_type) << ")");
        devices.push_back(std::move(device));
    }

    return devices;
}

bool load_devices(const std::optional<std::string> &devices_json, const DeviceDefaults &defaults,
                  std::vector<DeviceContext> &devices, std::string &error) {
    devices.clear();

    if (devices_json.has_value() && !trim(*devices_json).empty()) {
        nlohmann::json raw_devices;
        try {
            raw_devices = nlohmann::json::parse(*devices_json);
        } catch (const nlohmann::json::parse_error &e) {
            error = std::string("PIXOO_DEVICES_JSON is not valid JSON: ") + e.what();
            return false;
        }

        if (!raw_devices.is_array()) {
            error = "PIXOO_DEVICES_JSON must be a JSON array";
            return false;
        }

        devices = load_devices_from_list(raw_devices, defaults);
        if (!devices.empty()) {
            LOG_INFO("[Devices] Loaded " << devices.size() << " device(s) from PIXOO_DEVICES_JSON");
            return true;
        }

        LOG_WARN("[Devices] PIXOO_DEVICES_JSON has no usable entries, falling back to single-host mode");
    }

    // Single-host mode
    if (trim(defaults.host).empty()) {
        error = "PIXOO_HOST is required when PIXOO_DEVICES_JSON provides no devices";
        return false;
    }

    DeviceContext device;
    device.host = trim(defaults.host);
    device.key = device.host;
    device.device_type = normalize_device_type(defaults.device_type);
    device.screen_size = defaults.screen_size > 0 ? defaults.screen_size : kDefaultScreenSize;
    device.debug = defaults.debug;
    device.connection_retries = defaults.connection_retries >= 0 ? defaults.connection_retries
                                                                 : kDefaultConnectionRetries;
    devices.push_back(std::move(device));

    LOG_INFO("[Devices] Single-host mode: " << devices.front().host);
    return true;
}

}  // namespace device
}  // namespace pixoogate
