// Pixoo gateway runtime
// Optional YAML config, overlaid by PIXOO_* environment variables

#include <filesystem>
#include <iostream>
#include <string>
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: pixoogate-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to YAML config file (optional)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Environment:\n";
            std::cerr << "  PIXOO_DEVICES_JSON, PIXOO_HOST, PIXOO_DEVICE_TYPE, PIXOO_SCREEN_SIZE,\n";
            std::cerr << "  PIXOO_DEBUG, PIXOO_CONNECTION_RETRIES, PIXOO_REST_DEBUG,\n";
            std::cerr << "  PIXOO_REST_HOST, PIXOO_REST_PORT\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    pixoogate::runtime::GatewayConfig config;
    std::string error;

    if (!config_path.empty())
    {
        // Using cerr here as logger might not be initialized/configured
        if (!std::filesystem::exists(config_path))
        {
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }

        LOG_INFO("Loading config: " << config_path);
        if (!pixoogate::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    pixoogate::runtime::apply_environment(config);

    if (!pixoogate::runtime::validate_config(config, error))
    {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    // Initialize logger level
    pixoogate::logging::Logger::init(pixoogate::logging::string_to_level(config.logging.level));
    LOG_INFO("Pixoo gateway " << PIXOOGATE_VERSION << " starting (log level "
                              << pixoogate::logging::level_to_string(pixoogate::logging::Logger::level()) << ")");

    pixoogate::runtime::SignalHandler::install();

    // Create and initialize runtime
    pixoogate::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Devices: " << runtime.get_registry()->device_count());
    LOG_INFO("  Listening: " << config.http.bind << ":" << config.http.port);

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
