#include "device_resolver.hpp"

#include "logging/logger.hpp"

namespace pixoogate {
namespace control {

DeviceResolver::DeviceResolver(const registry::DeviceRegistry *registry) : registry_(registry) {}

ResolveResult DeviceResolver::resolve(const DeviceSelector &selector, device::DeviceType required) const {
    ResolveResult result;

    if (registry_ == nullptr) {
        result.status_code = http::StatusCode::UNAVAILABLE;
        result.error_message = "Device registry is not initialized";
        return result;
    }

    const auto *selected = registry_->select(selector.device, selector.host);
    if (selected == nullptr) {
        result.status_code = http::StatusCode::NOT_FOUND;
        result.error_message = "Device not found. Available devices: " + available_devices();
        LOG_DEBUG("[Resolver] No match for device=" << selector.device.value_or("") << " host="
                                                    << selector.host.value_or(""));
        return result;
    }

    if (selected->device_type != required) {
        result.status_code = http::StatusCode::INVALID_ARGUMENT;
        result.error_message = "Device '" + selected->key + "' is configured as " +
                               device::device_type_to_string(selected->device_type) + ".";
        return result;
    }

    if (required == device::DeviceType::PIXOO && !selected->has_session()) {
        result.status_code = http::StatusCode::UNAVAILABLE;
        result.error_message = "Device '" + selected->key + "' is not connected.";
        return result;
    }

    result.success = true;
    result.status_code = http::StatusCode::OK;
    result.device = selected;
    return result;
}

std::string DeviceResolver::available_devices() const {
    std::string joined;
    for (const auto &key : registry_->keys()) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += key;
    }
    return joined.empty() ? "none" : joined;
}

}  // namespace control
}  // namespace pixoogate
