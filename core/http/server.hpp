#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "control/device_resolver.hpp"
#include "device/i_pixoo_session.hpp"
#include "runtime/config.hpp"
#include "timegate/commands.hpp"

// Forward declarations
namespace pixoogate {
namespace registry { class DeviceRegistry; }
namespace timegate { class CommandDispatcher; }
}

namespace pixoogate {
namespace http {

/**
 * @brief HTTP server wrapper for the gateway
 *
 * Exposes the Time-Gate command routes, the Pixoo drawing and control
 * routes and the informational endpoints. Handlers only translate between
 * HTTP and the resolver, dispatcher and Pixoo sessions.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - The registry is read-only once the server starts; Pixoo sessions lock internally
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, pool, CORS)
     * @param registry Device registry; null serves 503 on device routes
     * @param dispatcher Time-Gate command dispatcher
     * @param default_session Pixoo session used when a request names no device (may be null)
     */
    HttpServer(const runtime::HttpConfig &config, const registry::DeviceRegistry *registry,
               timegate::CommandDispatcher &dispatcher, std::shared_ptr<device::IPixooSession> default_session);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    const registry::DeviceRegistry *registry_;
    control::DeviceResolver resolver_;
    timegate::CommandDispatcher &dispatcher_;
    std::shared_ptr<device::IPixooSession> default_session_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Time-Gate routes (timegate_handlers.cpp)
    void handle_timegate(timegate::Operation op, const httplib::Request &req, httplib::Response &res);

    // Pixoo routes (pixoo_handlers.cpp)
    void handle_draw_fill(const httplib::Request &req, httplib::Response &res);
    void handle_draw_pixel(const httplib::Request &req, httplib::Response &res);
    void handle_draw_line(const httplib::Request &req, httplib::Response &res);
    void handle_draw_rectangle(const httplib::Request &req, httplib::Response &res);
    void handle_draw_push(const httplib::Request &req, httplib::Response &res);
    void handle_send_text(const httplib::Request &req, httplib::Response &res);
    void handle_set_brightness(const httplib::Request &req, httplib::Response &res);
    void handle_set_channel(const httplib::Request &req, httplib::Response &res);
    void handle_set_clock(const httplib::Request &req, httplib::Response &res);
    void handle_set_face(const httplib::Request &req, httplib::Response &res);
    void handle_set_visualizer(const httplib::Request &req, httplib::Response &res);
    void handle_set_screen(const httplib::Request &req, httplib::Response &res);
    void handle_divoom_command(const httplib::Request &req, httplib::Response &res);

    // System routes (system_handlers.cpp)
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_get_root(const httplib::Request &req, httplib::Response &res);

    // Session for a Pixoo route; sends the error response and returns null on failure
    std::shared_ptr<device::IPixooSession> resolve_pixoo_session(const httplib::Request &req,
                                                                 httplib::Response &res) const;
};

} // namespace http
} // namespace pixoogate
