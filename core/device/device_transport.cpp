#include "device_transport.hpp"

#include <httplib.h>

#include <memory>

#include "logging/logger.hpp"

namespace pixoogate {
namespace device {

namespace {
constexpr const char *kCommandPath = "/post";
constexpr const char *kProbePath = "/get";

std::string base_url(const std::string &host) { return "http://" + host; }

std::unique_ptr<httplib::Client> make_client(const std::string &host, std::chrono::milliseconds timeout) {
    auto client = std::make_unique<httplib::Client>(base_url(host));
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    return client;
}
}  // namespace

std::string transport_status_to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK:
            return "OK";
        case TransportStatus::CONNECTION_ERROR:
            return "CONNECTION_ERROR";
        case TransportStatus::HTTP_ERROR:
            return "HTTP_ERROR";
        case TransportStatus::INVALID_RESPONSE:
            return "INVALID_RESPONSE";
        case TransportStatus::DEVICE_ERROR:
            return "DEVICE_ERROR";
        default:
            return "UNKNOWN";
    }
}

HttpDeviceTransport::HttpDeviceTransport(std::chrono::milliseconds command_timeout,
                                         std::chrono::milliseconds probe_timeout)
    : command_timeout_(command_timeout), probe_timeout_(probe_timeout) {}

TransportResult HttpDeviceTransport::post_command(const std::string &host, const nlohmann::json &payload) {
    TransportResult result;
    auto client = make_client(host, command_timeout_);

    const std::string url = base_url(host) + kCommandPath;
    LOG_DEBUG("[Transport] POST " << url << " " << payload.dump());

    auto response = client->Post(kCommandPath, payload.dump(), "application/json");
    if (!response) {
        result.status = TransportStatus::CONNECTION_ERROR;
        result.error = httplib::to_string(response.error()) + " for url '" + url + "'";
        return result;
    }

    result.http_status = response->status;
    if (response->status < 200 || response->status >= 300) {
        result.status = TransportStatus::HTTP_ERROR;
        result.error = "HTTP " + std::to_string(response->status) + " for url '" + url + "'";
        return result;
    }

    // Divoom firmware labels its JSON as text/html, so parse regardless of Content-Type
    result.body = nlohmann::json::parse(response->body, nullptr, false);
    if (result.body.is_discarded()) {
        result.status = TransportStatus::INVALID_RESPONSE;
        result.error = "Device returned a non-JSON body from '" + url + "'";
        result.body = nullptr;
        return result;
    }

    LOG_DEBUG("[Transport] " << url << " -> " << response->status << " " << response->body);
    return result;
}

bool HttpDeviceTransport::probe(const std::string &host, std::string &error) {
    auto client = make_client(host, probe_timeout_);

    auto response = client->Get(kProbePath);
    if (!response) {
        error = httplib::to_string(response.error());
        return false;
    }
    return true;
}

}  // namespace device
}  // namespace pixoogate
