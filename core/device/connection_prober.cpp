#include "connection_prober.hpp"

#include <thread>
#include <utility>

#include "logging/logger.hpp"
#include "registry/device_registry.hpp"

namespace pixoogate {
namespace device {

ConnectionProber::ConnectionProber(IDeviceTransport &transport, SessionFactory factory,
                                   std::chrono::milliseconds retry_delay)
    : transport_(transport), factory_(std::move(factory)), retry_delay_(retry_delay) {}

bool ConnectionProber::probe_all(registry::DeviceRegistry &registry, std::string &error) {
    default_session_.reset();

    for (const auto &device : registry.get_all_devices()) {
        if (device.device_type == DeviceType::TIME_GATE) {
            LOG_INFO("[Prober] Time Gate device '" << device.key << "' at " << device.host
                                                   << " configured (no connection check)");
            continue;
        }

        LOG_INFO("[Prober] Connecting to Pixoo device '" << device.key << "' at " << device.host << "...");
        if (!probe_device(device)) {
            error = "Failed to connect to Pixoo device '" + device.key + "' at " + device.host;
            return false;
        }

        auto session = factory_(device);
        if (!session) {
            error = "Failed to create session for Pixoo device '" + device.key + "'";
            return false;
        }
        if (!registry.attach_session(device.key, session)) {
            error = "Device '" + device.key + "' disappeared from the registry";
            return false;
        }
        if (!default_session_) {
            default_session_ = session;
        }

        LOG_INFO("[Prober] Connected to Pixoo device '" << device.key << "' at " << device.host);
    }

    return true;
}

bool ConnectionProber::probe_device(const DeviceContext &device) {
    // retries may be INT_MAX
    const long long attempts = static_cast<long long>(device.connection_retries) + 1;
    for (long long attempt = 1; attempt <= attempts; ++attempt) {
        std::string probe_error;
        if (transport_.probe(device.host, probe_error)) {
            return true;
        }

        if (attempt == attempts) {
            LOG_ERROR("[Prober] Connection attempt " << attempt << " to " << device.host
                                                     << " failed: " << probe_error);
            break;
        }

        LOG_WARN("[Prober] Connection attempt " << attempt << " failed, retrying... (" << probe_error << ")");
        if (retry_delay_.count() > 0) {
            std::this_thread::sleep_for(retry_delay_);
        }
    }
    return false;
}

}  // namespace device
}  // namespace pixoogate
