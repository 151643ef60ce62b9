#include "../../registry/device_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace pixoogate {
namespace http {

//=============================================================================
// GET /devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &, httplib::Response &res) {
    if (registry_ == nullptr) {
        send_error(res, StatusCode::UNAVAILABLE, "Device registry is not initialized");
        return;
    }

    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &device : registry_->get_all_devices()) {
        devices_json.push_back(encode_device_info(device));
    }

    const auto *fallback = registry_->default_device();
    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"default_device", fallback != nullptr ? nlohmann::json(fallback->key) : nullptr},
                               {"devices", devices_json}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /health
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    nlohmann::json pixoo_host = nullptr;
    if (default_session_) {
        pixoo_host = default_session_->host();
    } else if (registry_ != nullptr && registry_->default_device() != nullptr) {
        pixoo_host = registry_->default_device()->host;
    }

    nlohmann::json response = {{"status", "healthy"},
                               {"pixoo_host", pixoo_host},
                               {"device_count", registry_ != nullptr ? registry_->device_count() : 0}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"name", "Pixoo REST API"},
                               {"version", PIXOOGATE_VERSION},
                               {"description", "REST gateway for Divoom Pixoo and Time Gate devices"},
                               {"devices", registry_ != nullptr ? registry_->keys() : std::vector<std::string>{}}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace pixoogate
