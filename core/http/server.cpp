#include "server.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "errors.hpp"
#include "logging/logger.hpp"
#include "timegate/command_dispatcher.hpp"

namespace pixoogate {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowMethods = "GET, POST, OPTIONS";
constexpr const char *kAllowHeaders = "Content-Type, X-Pixoo-Device, X-Pixoo-Host";

// Route pattern that also accepts repeated leading slashes ("//draw/fill")
std::string route(const std::string &path) { return "/+" + path.substr(1); }
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const registry::DeviceRegistry *registry,
                       timegate::CommandDispatcher &dispatcher,
                       std::shared_ptr<device::IPixooSession> default_session)
    : config_(config),
      registry_(registry),
      resolver_(registry),
      dispatcher_(dispatcher),
      default_session_(std::move(default_session)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    // Create server
    server_ = std::make_unique<httplib::Server>();

    // Configure server
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    // Each worker blocks for up to one device round trip (10 s)
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string &allowed = *matched;
        const std::string response_origin = allowed == "*" ? "*" : origin;

        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    // Set up routes
    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        // If content was already set by the handler, don't override it
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status == kStatusInternal) {
            code = StatusCode::INTERNAL;
            message = "Internal server error";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(dump_json(response), "application/json");
    });

    // Set exception handler
    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(dump_json(response), "application/json");
    });

    // Bind first (bind_to_port returns the actual port used, or -1 on error)
    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        return false;
    }
    port_ = config_.port;

    // Start server thread
    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // Time-Gate commands
    const std::pair<const char *, timegate::Operation> timegate_routes[] = {
        {"/timegate/send-gif", timegate::Operation::SEND_GIF},
        {"/timegate/send-text", timegate::Operation::SEND_TEXT},
        {"/timegate/play-gif", timegate::Operation::PLAY_GIF},
        {"/timegate/set-brightness", timegate::Operation::SET_BRIGHTNESS},
        {"/timegate/reset-gif-id", timegate::Operation::RESET_GIF_ID},
        {"/timegate/command-list", timegate::Operation::COMMAND_LIST},
        {"/timegate/command", timegate::Operation::RAW_COMMAND},
    };
    for (const auto &[path, op] : timegate_routes) {
        const timegate::Operation route_op = op;
        server_->Post(route(path), [this, route_op](const httplib::Request &req, httplib::Response &res) {
            handle_timegate(route_op, req, res);
        });
    }

    // Pixoo drawing (buffer, optionally pushed)
    server_->Post(route("/draw/fill"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_draw_fill(req, res); });
    server_->Post(route("/draw/pixel"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_draw_pixel(req, res); });
    server_->Post(route("/draw/line"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_draw_line(req, res); });
    server_->Post(route("/draw/rectangle"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_draw_rectangle(req, res); });
    server_->Post(route("/draw/push"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_draw_push(req, res); });
    server_->Post(route("/send/text"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_send_text(req, res); });

    // Pixoo control, value in the path
    server_->Post(route(R"(/set/brightness/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_brightness(req, res); });
    server_->Post(route(R"(/set/channel/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_channel(req, res); });
    server_->Post(route(R"(/set/clock/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_clock(req, res); });
    server_->Post(route(R"(/set/face/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_face(req, res); });
    server_->Post(route(R"(/set/visualizer/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_visualizer(req, res); });
    server_->Post(route(R"(/set/screen/([^/]+))"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_set_screen(req, res); });
    server_->Post(route("/divoom/command"),
                  [this](const httplib::Request &req, httplib::Response &res) { handle_divoom_command(req, res); });

    // Informational
    server_->Get(route("/devices"),
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_devices(req, res); });
    server_->Get(route("/health"),
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });
    server_->Get(route("/"), [this](const httplib::Request &req, httplib::Response &res) { handle_get_root(req, res); });

    // OPTIONS catch-all for CORS preflight on all routes
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowHeaders);
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   POST /timegate/{send-gif,send-text,play-gif,set-brightness,reset-gif-id,command-list,command}");
    LOG_INFO("[HTTP]   POST /draw/{fill,pixel,line,rectangle,push}");
    LOG_INFO("[HTTP]   POST /send/text");
    LOG_INFO("[HTTP]   POST /set/{brightness,channel,clock,face,visualizer,screen}/{value}");
    LOG_INFO("[HTTP]   POST /divoom/command");
    LOG_INFO("[HTTP]   GET  /devices");
    LOG_INFO("[HTTP]   GET  /health");
    LOG_INFO("[HTTP]   GET  /");
}

}  // namespace http
}  // namespace pixoogate
