#ifndef PIXOOGATE_TIMEGATE_COMMAND_DISPATCHER_HPP
#define PIXOOGATE_TIMEGATE_COMMAND_DISPATCHER_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "device/device_context.hpp"
#include "device/device_transport.hpp"
#include "http/errors.hpp"
#include "timegate/commands.hpp"

namespace pixoogate {
namespace timegate {

// Dispatch result - device reply on success, mapped status on failure
struct DispatchResult {
    bool success = false;
    http::StatusCode status_code = http::StatusCode::INTERNAL;
    std::string error_message;
    nlohmann::json response;
};

// CommandDispatcher - sends decoded Time-Gate commands to a device
/**
 * One POST per command, no retries. Failure mapping:
 * - connection error, timeout, non-2xx -> UPSTREAM_FAILED
 * - 2xx with a non-JSON body, or a non-object body for typed commands -> INTERNAL
 *
 * Stateless apart from the transport reference; safe to call from any
 * HTTP worker thread.
 */
class CommandDispatcher {
public:
    explicit CommandDispatcher(device::IDeviceTransport &transport);

    DispatchResult dispatch(const device::DeviceContext &device, const Command &command);

private:
    device::IDeviceTransport &transport_;
};

}  // namespace timegate
}  // namespace pixoogate

#endif  // PIXOOGATE_TIMEGATE_COMMAND_DISPATCHER_HPP
