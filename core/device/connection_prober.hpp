#ifndef PIXOOGATE_DEVICE_CONNECTION_PROBER_HPP
#define PIXOOGATE_DEVICE_CONNECTION_PROBER_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "device_context.hpp"
#include "device_transport.hpp"
#include "i_pixoo_session.hpp"

namespace pixoogate {
namespace registry {
class DeviceRegistry;
}

namespace device {

using SessionFactory = std::function<std::shared_ptr<IPixooSession>(const DeviceContext &)>;

// Startup connectivity check for Pixoo devices
/**
 * Each PIXOO device gets up to connection_retries + 1 probes. A reachable
 * device gets a session from the factory, attached to the registry. A device
 * that never answers fails the whole pass. TIME_GATE devices are skipped.
 *
 * Runs once on the startup thread, before the HTTP server accepts requests.
 */
class ConnectionProber {
public:
    ConnectionProber(IDeviceTransport &transport, SessionFactory factory,
                     std::chrono::milliseconds retry_delay = std::chrono::seconds(1));

    bool probe_all(registry::DeviceRegistry &registry, std::string &error);

    // Session of the first device that answered; null when none did
    std::shared_ptr<IPixooSession> default_session() const { return default_session_; }

private:
    bool probe_device(const DeviceContext &device);

    IDeviceTransport &transport_;
    SessionFactory factory_;
    std::chrono::milliseconds retry_delay_;
    std::shared_ptr<IPixooSession> default_session_;
};

}  // namespace device
}  // namespace pixoogate

#endif  // PIXOOGATE_DEVICE_CONNECTION_PROBER_HPP
