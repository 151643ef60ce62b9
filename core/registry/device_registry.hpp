#ifndef PIXOOGATE_REGISTRY_DEVICE_REGISTRY_HPP
#define PIXOOGATE_REGISTRY_DEVICE_REGISTRY_HPP

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "device/device_context.hpp"

namespace pixoogate {
namespace registry {

// Device Registry - immutable inventory after startup
/**
 * Built once by the Runtime from the loader output and then only read.
 * Construction resolves AUTO -> PIXOO and applies the Time-Gate screen
 * floor; the connection prober attaches sessions before the HTTP server
 * starts. No locking: nothing is mutated once requests are served.
 *
 * Lookups:
 * - by key: case-insensitive
 * - by host: exact string, last registered entry wins on duplicates
 * - default: first registered device
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(std::vector<device::DeviceContext> devices);

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    /**
     * @brief Pick a device from request hints
     *
     * key wins over host (host is ignored when a key is given, even if the
     * key does not match); with neither, the default device is returned.
     * Empty strings count as absent.
     *
     * @return Matching device, or nullptr
     */
    const device::DeviceContext *select(const std::optional<std::string> &key,
                                        const std::optional<std::string> &host) const;

    const device::DeviceContext *get_device(const std::string &key) const;
    const device::DeviceContext *get_device_by_host(const std::string &host) const;
    const device::DeviceContext *default_device() const;

    const std::vector<device::DeviceContext> &get_all_devices() const { return devices_; }
    std::vector<std::string> keys() const;
    std::vector<std::string> hosts() const;
    size_t device_count() const { return devices_.size(); }

    // Startup only (connection prober)
    bool attach_session(const std::string &key, std::shared_ptr<device::IPixooSession> session);

private:
    std::vector<device::DeviceContext> devices_;
    std::unordered_map<std::string, size_t> key_to_index_;   // lower-cased key -> index
    std::unordered_map<std::string, size_t> host_to_index_;  // host -> index (last wins)
};

}  // namespace registry
}  // namespace pixoogate

#endif  // PIXOOGATE_REGISTRY_DEVICE_REGISTRY_HPP
