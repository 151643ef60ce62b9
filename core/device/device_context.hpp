#ifndef PIXOOGATE_DEVICE_DEVICE_CONTEXT_HPP
#define PIXOOGATE_DEVICE_DEVICE_CONTEXT_HPP

#include <memory>
#include <optional>
#include <string>

#include "device_types.hpp"
#include "i_pixoo_session.hpp"

namespace pixoogate {
namespace device {

constexpr int kDefaultScreenSize = 64;
constexpr int kTimeGateMinScreenSize = 128;
constexpr int kDefaultConnectionRetries = 10;

// One configured display
struct DeviceContext {
    std::string key;   // Unique alias (case-insensitive)
    std::string host;  // IP or hostname, optionally host:port
    DeviceType device_type = DeviceType::PIXOO;
    int screen_size = kDefaultScreenSize;
    bool debug = false;
    int connection_retries = kDefaultConnectionRetries;
    std::optional<std::string> name;

    // Set by the connection prober for PIXOO devices; never set for TIME_GATE
    std::shared_ptr<IPixooSession> session;

    bool has_session() const { return session != nullptr; }
};

}  // namespace device
}  // namespace pixoogate

#endif  // PIXOOGATE_DEVICE_DEVICE_CONTEXT_HPP
