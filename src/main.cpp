#include "core/conversion_orchestrator.hpp"
#include "core/converter_config.hpp"
#include "core/file_utils.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "web/route_handlers.hpp"
#include <httplib.h>
#include <iostream>
#include <string>
#include <thread>
#include <unistd.h>

namespace
{
    const char *const DEFAULT_CONFIG_PATH = "config/config.json";

    void printUsage(const char *program)
    {
        std::cout << "AVIF Converter - JPEG/HEIC to AVIF conversion service" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>  Configuration file (default: " << DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Initialize coordinated signal handling FIRST
    ShutdownManager::getInstance().installSignalHandlers();

    auto &config = ConverterConfig::getInstance();
    if (!config_path.empty())
    {
        if (!config.load(config_path))
        {
            std::cerr << "Error: cannot load configuration from " << config_path << std::endl;
            return 1;
        }
    }
    else if (!config.load(DEFAULT_CONFIG_PATH))
    {
        std::cout << "No usable " << DEFAULT_CONFIG_PATH << ", using built-in defaults" << std::endl;
    }

    auto problems = config.validate();
    if (!problems.empty())
    {
        for (const auto &problem : problems)
        {
            std::cerr << "Configuration error: " << problem << std::endl;
        }
        return 1;
    }

    Logger::init(config.getLogLevel());
    Logger::info("Starting AVIF converter (PID: " + std::to_string(getpid()) + ")...");

    OrchestratorSettings settings = OrchestratorSettings::fromConfig(config);
    if (!settings.scratch_root.empty() && !FileUtils::isValidDirectory(settings.scratch_root))
    {
        Logger::error("Scratch root is not a directory: " + settings.scratch_root);
        return 1;
    }

    ConversionOrchestrator orchestrator(settings);
    Logger::info(std::string("HEIC decoder: ") + heicDecodeStrategyToString(settings.heic_strategy) +
                 ", sample interval " + std::to_string(settings.sample_interval.count()) + "ms");

    for (const auto &tool : orchestrator.requiredTools())
    {
        if (orchestrator.toolAvailable(tool))
        {
            Logger::info("Tool available: " + tool);
        }
        else
        {
            Logger::warn("Tool not available: " + tool + " (conversions needing it will fail)");
        }
    }

    httplib::Server svr;
    svr.set_payload_max_length(static_cast<size_t>(config.getMaxUploadMb()) * 1024 * 1024);
    RouteHandlers::setupRoutes(svr, orchestrator);

    const std::string host = config.getServerHost();
    const int port = config.getServerPort();
    if (!svr.bind_to_port(host.c_str(), port))
    {
        Logger::error("Failed to bind " + host + ":" + std::to_string(port));
        return 1;
    }

    std::thread server_thread([&svr]()
                              { svr.listen_after_bind(); });
    Logger::info("Server listening on " + host + ":" + std::to_string(port));

    ShutdownManager::getInstance().waitForShutdown();

    Logger::info("Shutting down: " + ShutdownManager::getInstance().getReason());
    svr.stop();
    if (server_thread.joinable())
    {
        server_thread.join();
    }

    Logger::info("Server stopped");
    return 0;
}
