#include <cctype>
#include <limits>

#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace pixoogate {
namespace http {

namespace {
constexpr int kMaxInt = std::numeric_limits<int>::max();
const std::string kFailurePrefix = "Pixoo request failed: ";

void send_pixoo_result(httplib::Response &res, const device::TransportResult &result) {
    switch (result.status) {
        case device::TransportStatus::OK:
            send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"response", result.body}});
            return;
        case device::TransportStatus::INVALID_RESPONSE:
            send_error(res, StatusCode::INTERNAL, kFailurePrefix + result.error);
            return;
        default:
            send_error(res, StatusCode::UPSTREAM_FAILED, kFailurePrefix + result.error);
            return;
    }
}

// Draw routes either push the buffer or just acknowledge the change
void finish_draw(httplib::Response &res, device::IPixooSession &session, bool push_immediately) {
    if (push_immediately) {
        send_pixoo_result(res, session.push());
        return;
    }
    send_json(res, StatusCode::OK, {{"status", make_status(StatusCode::OK)}, {"pushed", false}});
}

// Path value as a base-10 integer within [min, max]
bool parse_path_int(const httplib::Request &req, const char *name, int min, int max, int &out, std::string &error) {
    const std::string raw = req.matches.size() >= 2 ? req.matches[1].str() : std::string();
    bool digits = !raw.empty() && raw.size() <= 9;
    for (char c : raw) {
        digits = digits && std::isdigit(static_cast<unsigned char>(c));
    }
    if (!digits) {
        error = std::string(name) + " must be an integer";
        return false;
    }
    int value = std::stoi(raw);
    if (value < min || value > max) {
        error = std::string(name) + " must be between " + std::to_string(min) + " and " + std::to_string(max);
        return false;
    }
    out = value;
    return true;
}

bool require_object(httplib::Response &res, const nlohmann::json &body) {
    if (!body.is_object()) {
        send_error(res, StatusCode::VALIDATION_FAILED, "Request body must be a JSON object");
        return false;
    }
    return true;
}
}  // namespace

std::shared_ptr<device::IPixooSession> HttpServer::resolve_pixoo_session(const httplib::Request &req,
                                                                         httplib::Response &res) const {
    auto selector = selector_from_request(req);
    if (selector.empty()) {
        if (!default_session_) {
            send_error(res, StatusCode::UNAVAILABLE, "No Pixoo device is connected.");
            return nullptr;
        }
        return default_session_;
    }

    auto resolved = resolver_.resolve(selector, device::DeviceType::PIXOO);
    if (!resolved.success) {
        LOG_WARN("[HTTP] " << req.path << ": " << resolved.error_message);
        send_error(res, resolved.status_code, resolved.error_message);
        return nullptr;
    }
    return resolved.device->session;
}

//=============================================================================
// POST /draw/fill
//=============================================================================
void HttpServer::handle_draw_fill(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body, true) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    device::Rgb color;
    bool push = true;
    std::string error;
    if (!decode_rgb(body, color, error) || !decode_bool_field(body, "push_immediately", true, push, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }

    session->fill(color);
    finish_draw(res, *session, push);
}

//=============================================================================
// POST /draw/pixel
//=============================================================================
void HttpServer::handle_draw_pixel(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    const int limit = session->screen_size() - 1;
    int x = 0;
    int y = 0;
    device::Rgb color;
    bool push = true;
    std::string error;
    if (!decode_int_field(body, "x", std::nullopt, 0, limit, x, error) ||
        !decode_int_field(body, "y", std::nullopt, 0, limit, y, error) || !decode_rgb(body, color, error) ||
        !decode_bool_field(body, "push_immediately", true, push, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }

    session->draw_pixel(x, y, color);
    finish_draw(res, *session, push);
}

//=============================================================================
// POST /draw/line
//=============================================================================
void HttpServer::handle_draw_line(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    const int limit = session->screen_size() - 1;
    int start_x = 0, start_y = 0, stop_x = 0, stop_y = 0;
    device::Rgb color;
    bool push = true;
    std::string error;
    if (!decode_int_field(body, "start_x", std::nullopt, 0, limit, start_x, error) ||
        !decode_int_field(body, "start_y", std::nullopt, 0, limit, start_y, error) ||
        !decode_int_field(body, "stop_x", std::nullopt, 0, limit, stop_x, error) ||
        !decode_int_field(body, "stop_y", std::nullopt, 0, limit, stop_y, error) || !decode_rgb(body, color, error) ||
        !decode_bool_field(body, "push_immediately", true, push, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }

    session->draw_line(start_x, start_y, stop_x, stop_y, color);
    finish_draw(res, *session, push);
}

//=============================================================================
// POST /draw/rectangle
//=============================================================================
void HttpServer::handle_draw_rectangle(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    const int limit = session->screen_size() - 1;
    int x0 = 0, y0 = 0, x1 = 0, y1 = 0;
    device::Rgb color;
    bool filled = true;
    bool push = true;
    std::string error;
    if (!decode_int_field(body, "top_left_x", std::nullopt, 0, limit, x0, error) ||
        !decode_int_field(body, "top_left_y", std::nullopt, 0, limit, y0, error) ||
        !decode_int_field(body, "bottom_right_x", std::nullopt, 0, limit, x1, error) ||
        !decode_int_field(body, "bottom_right_y", std::nullopt, 0, limit, y1, error) ||
        !decode_rgb(body, color, error) || !decode_bool_field(body, "filled", true, filled, error) ||
        !decode_bool_field(body, "push_immediately", true, push, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }

    session->draw_rectangle(x0, y0, x1, y1, color, filled);
    finish_draw(res, *session, push);
}

//=============================================================================
// POST /draw/push
//=============================================================================
void HttpServer::handle_draw_push(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    send_pixoo_result(res, session->push());
}

//=============================================================================
// POST /send/text
//=============================================================================
void HttpServer::handle_send_text(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    device::PixooText text;
    std::string error;
    if (!decode_pixoo_text(body, text, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->send_text(text));
}

//=============================================================================
// POST /set/{setting}/{value}
//=============================================================================
void HttpServer::handle_set_brightness(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    int value = 0;
    std::string error;
    if (!parse_path_int(req, "brightness", 0, 100, value, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->set_brightness(value));
}

void HttpServer::handle_set_channel(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    int value = 0;
    std::string error;
    if (!parse_path_int(req, "channel", 0, 3, value, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->set_channel(value));
}

void HttpServer::handle_set_clock(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    int value = 0;
    std::string error;
    if (!parse_path_int(req, "clock", 0, kMaxInt, value, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->set_clock(value));
}

void HttpServer::handle_set_face(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    int value = 0;
    std::string error;
    if (!parse_path_int(req, "face", 0, kMaxInt, value, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->set_face(value));
}

void HttpServer::handle_set_visualizer(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    int value = 0;
    std::string error;
    if (!parse_path_int(req, "visualizer", 0, kMaxInt, value, error)) {
        send_error(res, StatusCode::VALIDATION_FAILED, error);
        return;
    }
    send_pixoo_result(res, session->set_visualizer(value));
}

void HttpServer::handle_set_screen(const httplib::Request &req, httplib::Response &res) {
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }
    const std::string state = req.matches.size() >= 2 ? req.matches[1].str() : std::string();
    if (state != "on" && state != "off") {
        send_error(res, StatusCode::VALIDATION_FAILED, "screen must be 'on' or 'off'");
        return;
    }
    send_pixoo_result(res, session->set_screen(state == "on"));
}

//=============================================================================
// POST /divoom/command
//=============================================================================
void HttpServer::handle_divoom_command(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_body(req, res, body) || !require_object(res, body)) {
        return;
    }
    auto session = resolve_pixoo_session(req, res);
    if (!session) {
        return;
    }

    auto it = body.find("command");
    if (it == body.end()) {
        send_error(res, StatusCode::VALIDATION_FAILED, "Field required: command");
        return;
    }
    if (!it->is_object()) {
        send_error(res, StatusCode::VALIDATION_FAILED, "command must be an object");
        return;
    }
    send_pixoo_result(res, session->send_command(*it));
}

}  // namespace http
}  // namespace pixoogate
