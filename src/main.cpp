/**
 * aniflow - OpenList offline download orchestrator
 *
 * Main entry point for the application.
 * Loads the configuration, sets up logging and drives the download
 * manager until every task finished or a signal asks it to stop.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "core/Application.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "utils/JsonUtils.hpp"

namespace fs = std::filesystem;

namespace {

std::atomic<bool> g_stopRequested{false};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int) {
    g_stopRequested = true;
}

/**
 * Setup signal handlers for graceful shutdown
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

void printUsage(const char* program) {
    std::cout << "aniflow - OpenList offline download orchestrator\n"
              << "\nUsage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>   Configuration file (default: config.json)\n"
              << "  -e, --enqueue <path>  Submit the resources listed in a JSON file\n"
              << "      --check           Validate the configuration and the server\n"
              << "  -d, --debug           Enable debug logging\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version information\n"
              << std::endl;
}

/**
 * Load and apply configuration
 */
bool loadConfiguration(const fs::path& configPath) {
    auto& logger = aniflow::core::Logger::instance();
    auto& config = aniflow::core::Config::instance();

    if (fs::exists(configPath)) {
        if (!config.load(configPath.string())) {
            logger.error("Failed to parse configuration {}", configPath.string());
            return false;
        }
        logger.info("Configuration loaded from {}", configPath.string());
        return true;
    }

    config.setDefaults();
    if (config.save(configPath.string())) {
        logger.info("Default configuration created at {}", configPath.string());
    } else {
        logger.warn("Could not write default configuration to {}", configPath.string());
    }
    return true;
}

void initializeLogging(bool debugMode) {
    using aniflow::core::Logger;
    using aniflow::core::LogLevel;
    auto& config = aniflow::core::Config::instance();

    aniflow::core::LoggerOptions options;
    options.consoleLevel = debugMode
        ? LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("log.level", "info"));
    options.fileLevel = Logger::parseLevel(config.get<std::string>("log.fileLevel", "debug"), LogLevel::Debug);
    options.directory = config.get<std::string>("log.directory", "logs");
    options.maxFileSize = config.get<size_t>("log.maxFileSize", options.maxFileSize);
    options.maxFiles = config.get<size_t>("log.maxFiles", options.maxFiles);

    Logger::instance().initialize(options);
}

/**
 * Read an array of resource descriptors
 */
bool loadResources(const fs::path& path, std::vector<aniflow::ResourceInfo>& resources) {
    auto& logger = aniflow::core::Logger::instance();

    auto data = aniflow::utils::JsonUtils::parseFile(path);
    if (!data) {
        logger.error("Could not read resource list {}", path.string());
        return false;
    }

    if (data->is_object()) {
        resources.push_back(aniflow::ResourceInfo::fromJson(*data));
        return true;
    }
    if (!data->is_array()) {
        logger.error("Resource list {} must be a JSON array or object", path.string());
        return false;
    }

    for (const auto& item : *data) {
        if (item.is_object()) resources.push_back(aniflow::ResourceInfo::fromJson(item));
    }
    return true;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    // Parse command line arguments
    bool debugMode = false;
    bool checkOnly = false;
    fs::path configPath = "config.json";
    fs::path enqueuePath;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--debug" || arg == "-d") {
            debugMode = true;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "--enqueue" || arg == "-e") && i + 1 < argc) {
            enqueuePath = argv[++i];
        } else if (arg == "--check") {
            checkOnly = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << aniflow::core::Application::getName() << " v"
                      << aniflow::core::Application::getVersion() << std::endl;
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    auto& logger = aniflow::core::Logger::instance();

    if (!loadConfiguration(configPath)) {
        logger.critical("Failed to load configuration");
        return 1;
    }

    initializeLogging(debugMode);
    logger.info("aniflow v{} starting...", aniflow::core::Application::getVersion());

    setupSignalHandlers();

    try {
        auto app = std::make_unique<aniflow::core::Application>();

        if (!app->initialize()) {
            logger.critical("Failed to initialize application");
            return 1;
        }

        if (checkOnly) {
            bool ok = app->check();
            logger.info("Check {}", ok ? "passed" : "failed");
            return ok ? 0 : 1;
        }

        std::vector<aniflow::ResourceInfo> resources;
        if (!enqueuePath.empty() && !loadResources(enqueuePath, resources)) {
            return 1;
        }

        app->resume();
        if (!resources.empty()) {
            app->enqueue(resources);
        }

        // Signals only raise a flag; the watcher turns it into a shutdown
        std::atomic<bool> finished{false};
        std::thread watcher([&app, &finished, &logger] {
            while (!finished) {
                if (g_stopRequested) {
                    logger.info("Received signal, shutting down gracefully...");
                    app->shutdown();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
        });

        app->waitForAll();
        finished = true;
        watcher.join();

        app->shutdown();
        logger.info("aniflow shutdown complete");
        logger.flush();
        return 0;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
