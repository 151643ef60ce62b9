#include "../../logging/logger.hpp"
#include "../../timegate/command_dispatcher.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace pixoogate {
namespace http {

//=============================================================================
// POST /timegate/{operation}
//=============================================================================
void HttpServer::handle_timegate(timegate::Operation op, const httplib::Request &req, httplib::Response &res) {
    // Reset takes no fields, so an empty body is fine there
    nlohmann::json body;
    if (!parse_body(req, res, body, op == timegate::Operation::RESET_GIF_ID)) {
        return;
    }

    auto resolved = resolver_.resolve(selector_from_request(req), device::DeviceType::TIME_GATE);
    if (!resolved.success) {
        LOG_WARN("[HTTP] " << timegate::operation_to_string(op) << ": " << resolved.error_message);
        send_error(res, resolved.status_code, resolved.error_message);
        return;
    }

    auto decoded = timegate::decode_command(op, body);
    if (!decoded.success) {
        send_error(res, decoded.status_code, decoded.error_message);
        return;
    }

    auto result = dispatcher_.dispatch(*resolved.device, decoded.command);
    if (!result.success) {
        send_error(res, result.status_code, result.error_message);
        return;
    }

    send_json(res, StatusCode::OK, result.response);
}

}  // namespace http
}  // namespace pixoogate
