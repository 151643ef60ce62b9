#ifndef PIXOOGATE_DEVICE_DEVICE_TRANSPORT_HPP
#define PIXOOGATE_DEVICE_DEVICE_TRANSPORT_HPP

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace pixoogate {
namespace device {

enum class TransportStatus {
    OK,
    CONNECTION_ERROR,  // connect/read/write failure or timeout
    HTTP_ERROR,        // device answered with a non-2xx status
    INVALID_RESPONSE,  // 2xx but the body is not JSON
    DEVICE_ERROR       // device JSON carries a non-zero error_code (Pixoo sessions only)
};

struct TransportResult {
    TransportStatus status = TransportStatus::OK;
    int http_status = 0;
    nlohmann::json body;
    std::string error;

    bool ok() const { return status == TransportStatus::OK; }
};

std::string transport_status_to_string(TransportStatus status);

// Interface for the device HTTP API so dispatch paths can be tested without a network
class IDeviceTransport {
public:
    virtual ~IDeviceTransport() = default;

    // POST payload as JSON to http://<host>/post and parse the JSON reply
    virtual TransportResult post_command(const std::string &host, const nlohmann::json &payload) = 0;

    // GET http://<host>/get; any HTTP answer counts as reachable
    virtual bool probe(const std::string &host, std::string &error) = 0;
};

// cpp-httplib backed transport. One client per call; calls are independent and
// may run concurrently from the HTTP worker pool.
class HttpDeviceTransport : public IDeviceTransport {
public:
    explicit HttpDeviceTransport(std::chrono::milliseconds command_timeout = std::chrono::seconds(10),
                                 std::chrono::milliseconds probe_timeout = std::chrono::seconds(5));

    TransportResult post_command(const std::string &host, const nlohmann::json &payload) override;
    bool probe(const std::string &host, std::string &error) override;

private:
    std::chrono::milliseconds command_timeout_;
    std::chrono::milliseconds probe_timeout_;
};

}  // namespace device
}  // namespace pixoogate

#endif  // PIXOOGATE_DEVICE_DEVICE_TRANSPORT_HPP
