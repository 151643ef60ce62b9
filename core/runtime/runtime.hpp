#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "device/connection_prober.hpp"
#include "device/device_transport.hpp"
#include "http/server.hpp"
#include "registry/device_registry.hpp"
#include "timegate/command_dispatcher.hpp"

namespace pixoogate {
namespace runtime {

class Runtime {
public:
    // transport defaults to HttpDeviceTransport
    explicit Runtime(const GatewayConfig &config, std::shared_ptr<device::IDeviceTransport> transport = nullptr);
    ~Runtime();

    // Load devices, build the registry, probe Pixoo devices, start HTTP
    bool initialize(std::string &error);

    // Main runtime loop (blocking until a signal or stop())
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    const registry::DeviceRegistry *get_registry() const { return registry_.get(); }
    int http_port() const { return http_server_ ? http_server_->get_port() : 0; }

private:
    // Staged initialization helpers
    bool init_devices(std::string &error);
    bool init_connections(std::string &error);
    bool init_http(std::string &error);

    GatewayConfig config_;

    std::shared_ptr<device::IDeviceTransport> transport_;
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<device::ConnectionProber> prober_;
    std::unique_ptr<timegate::CommandDispatcher> dispatcher_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace pixoogate
