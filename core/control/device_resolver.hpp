#ifndef PIXOOGATE_CONTROL_DEVICE_RESOLVER_HPP
#define PIXOOGATE_CONTROL_DEVICE_RESOLVER_HPP

#include <optional>
#include <string>

#include "device/device_context.hpp"
#include "http/errors.hpp"
#include "registry/device_registry.hpp"

namespace pixoogate {
namespace control {

// Per-request device hints; query parameter wins over header when both exist
struct DeviceSelector {
    std::optional<std::string> device;  // ?device= or X-Pixoo-Device
    std::optional<std::string> host;    // ?host= or X-Pixoo-Host

    bool empty() const { return (!device || device->empty()) && (!host || host->empty()); }
};

struct ResolveResult {
    bool success = false;
    http::StatusCode status_code = http::StatusCode::INTERNAL;
    std::string error_message;
    const device::DeviceContext *device = nullptr;
};

// DeviceResolver - maps request hints to one device of the required type
class DeviceResolver {
public:
    // registry may be null until the runtime finishes startup
    explicit DeviceResolver(const registry::DeviceRegistry *registry);

    /**
     * Failure order:
     * - registry missing -> UNAVAILABLE
     * - no match -> NOT_FOUND (lists the configured keys)
     * - type differs from required -> INVALID_ARGUMENT
     * - PIXOO without an attached session -> UNAVAILABLE
     */
    ResolveResult resolve(const DeviceSelector &selector, device::DeviceType required) const;

private:
    const registry::DeviceRegistry *registry_;

    std::string available_devices() const;
};

}  // namespace control
}  // namespace pixoogate

#endif  // PIXOOGATE_CONTROL_DEVICE_RESOLVER_HPP
