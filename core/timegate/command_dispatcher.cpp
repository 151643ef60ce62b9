#include "command_dispatcher.hpp"

#include <exception>

#include "logging/logger.hpp"

namespace pixoogate {
namespace timegate {

namespace {
const std::string kFailurePrefix = "Time Gate request failed: ";
}  // namespace

CommandDispatcher::CommandDispatcher(device::IDeviceTransport &transport) : transport_(transport) {}

DispatchResult CommandDispatcher::dispatch(const device::DeviceContext &device, const Command &command) {
    DispatchResult result;

    try {
        nlohmann::json payload = to_wire(command, device.screen_size);
        const std::string name = command_name(command);

        if (device.debug) {
            LOG_INFO("[TimeGate " << device.key << "] -> " << payload.dump());
        } else {
            LOG_DEBUG("[TimeGate " << device.key << "] " << name << " -> " << device.host);
        }

        auto reply = transport_.post_command(device.host, payload);
        switch (reply.status) {
            case device::TransportStatus::OK:
                break;
            case device::TransportStatus::CONNECTION_ERROR:
            case device::TransportStatus::HTTP_ERROR:
                result.status_code = http::StatusCode::UPSTREAM_FAILED;
                result.error_message = kFailurePrefix + reply.error;
                LOG_WARN("[TimeGate " << device.key << "] " << name << " failed: " << reply.error);
                return result;
            default:
                result.status_code = http::StatusCode::INTERNAL;
                result.error_message = kFailurePrefix + reply.error;
                LOG_ERROR("[TimeGate " << device.key << "] " << name << " failed: " << reply.error);
                return result;
        }

        // Typed commands expect an object; raw passthrough relays whatever JSON came back
        if (!std::holds_alternative<RawCommand>(command) && !reply.body.is_object()) {
            result.status_code = http::StatusCode::INTERNAL;
            result.error_message = kFailurePrefix + "unexpected response " + reply.body.dump();
            LOG_ERROR("[TimeGate " << device.key << "] " << result.error_message);
            return result;
        }

        result.success = true;
        result.status_code = http::StatusCode::OK;
        result.response = std::move(reply.body);
        return result;
    } catch (const std::exception &e) {
        result.status_code = http::StatusCode::INTERNAL;
        result.error_message = kFailurePrefix + e.what();
        LOG_ERROR("[TimeGate " << device.key << "] " << result.error_message);
        return result;
    }
}

}  // namespace timegate
}  // namespace pixoogate
