#include "runtime.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include "device/device_config_loader.hpp"
#include "device/pixoo_session.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace pixoogate {
namespace runtime {

Runtime::Runtime(const GatewayConfig &config, std::shared_ptr<device::IDeviceTransport> transport)
    : config_(config), transport_(std::move(transport)) {
    if (!transport_) {
        transport_ = std::make_shared<device::HttpDeviceTransport>();
    }
}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Pixoo gateway");

    if (!init_devices(error)) {
        return false;
    }

    if (!init_connections(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_devices(std::string &error) {
    std::vector<device::DeviceContext> devices;
    if (!device::load_devices(config_.devices_json, config_.devices, devices, error)) {
        return false;
    }

    registry_ = std::make_unique<registry::DeviceRegistry>(std::move(devices));
    LOG_INFO("[Runtime] Registry ready with " << registry_->device_count() << " device(s)");
    return true;
}

bool Runtime::init_connections(std::string &error) {
    device::IDeviceTransport &transport = *transport_;
    prober_ = std::make_unique<device::ConnectionProber>(
        transport, [&transport](const device::DeviceContext &ctx) -> std::shared_ptr<device::IPixooSession> {
            return std::make_shared<device::PixooSession>(ctx.host, ctx.screen_size, ctx.debug, transport);
        });

    if (!prober_->probe_all(*registry_, error)) {
        return false;
    }

    dispatcher_ = std::make_unique<timegate::CommandDispatcher>(transport);
    return true;
}

bool Runtime::init_http(std::string &error) {
    LOG_INFO("[Runtime] Creating HTTP server");
    http_server_ =
        std::make_unique<http::HttpServer>(config_.http, registry_.get(), *dispatcher_, prober_->default_session());

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        return false;
    }
    LOG_INFO("[Runtime] HTTP server started on " << config_.http.bind << ":" << config_.http.port);
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Serving requests");
    LOG_INFO("[Runtime] Press Ctrl+C to exit");
    running_ = true;

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }
}

void Runtime::shutdown() {
    // Stop HTTP server first so no request touches the registry during teardown
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace pixoogate
