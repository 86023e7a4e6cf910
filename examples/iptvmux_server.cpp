// IptvMux Server
// Runs the multiplexing proxy from a JSON configuration file

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "iptvmux/iptvmux.hpp"
#include "iptvmux/api/proxy_server.hpp"
#include "iptvmux/core/config_manager.hpp"

std::atomic<bool> g_running{true};

void signalHandler(int signal) {
    (void)signal;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "IptvMux Server v" << iptvmux::version() << "\n"
              << "Usage: " << programName << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -p, --port PORT       HTTP port (default: 8080)\n"
              << "  -b, --bind ADDRESS    Listen address (default: 0.0.0.0)\n"
              << "  -l, --log-level LEVEL debug, info, warning or error\n"
              << "  -j, --json-logs       Write log records as JSON\n"
              << "  -h, --help            Show this help\n"
              << "\nExample:\n"
              << "  " << programName << " -c /etc/iptvmux.json -p 8080\n"
              << "\nPlay with FFmpeg:\n"
              << "  ffplay http://localhost:8080/stream/1/12345.ts\n"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string configPath;
    iptvmux::core::ConfigOverrides overrides;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            std::string value = argv[++i];
            try {
                int port = std::stoi(value);
                if (port < 1 || port > 65535) {
                    throw std::out_of_range(value);
                }
                overrides.port = static_cast<uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "[ERROR] Invalid port: " << value << std::endl;
                return 1;
            }
        } else if ((arg == "-b" || arg == "--bind") && i + 1 < argc) {
            overrides.bindAddress = std::string(argv[++i]);
        } else if ((arg == "-l" || arg == "--log-level") && i + 1 < argc) {
            std::string value = argv[++i];
            auto level = iptvmux::core::parseLogLevel(value);
            if (!level) {
                std::cerr << "[ERROR] Invalid log level: " << value << std::endl;
                return 1;
            }
            overrides.logLevel = *level;
        } else if (arg == "-j" || arg == "--json-logs") {
            overrides.jsonLogs = true;
        } else {
            std::cerr << "[ERROR] Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // Client disconnects surface as send() errors instead.
    std::signal(SIGPIPE, SIG_IGN);

    // Load configuration: file, then environment, then command line
    iptvmux::core::ConfigManager configManager;
    configManager.setLogCallback([](const std::string& line) {
        std::cout << "[CONFIG] " << line << std::endl;
    });

    if (!configPath.empty()) {
        auto loaded = configManager.loadFromFile(configPath);
        if (loaded.isError()) {
            std::cerr << "[ERROR] Failed to load " << configPath << ": "
                      << loaded.error().message;
            if (loaded.error().line > 0) {
                std::cerr << " (line " << loaded.error().line << ")";
            }
            std::cerr << std::endl;
            return 1;
        }
    }
    configManager.applyEnvironmentOverrides();
    configManager.applyOverrides(overrides);

    auto valid = configManager.validate();
    if (valid.isError()) {
        std::cerr << "[ERROR] Invalid configuration";
        if (!valid.error().field.empty()) {
            std::cerr << " at " << valid.error().field;
        }
        std::cerr << ": " << valid.error().message << std::endl;
        return 1;
    }

    iptvmux::core::Configuration config = configManager.getConfig();
    if (config.accounts.empty()) {
        std::cout << "[WARN] No accounts configured, every stream request will return 404"
                  << std::endl;
    }

    iptvmux::api::ProxyServer server;

    auto initResult = server.initialize(config);
    if (initResult.isError()) {
        std::cerr << "[ERROR] Failed to initialize: " << initResult.error().message << std::endl;
        return 1;
    }

    auto startResult = server.start();
    if (startResult.isError()) {
        std::cerr << "[ERROR] Failed to start: " << startResult.error().message << std::endl;
        return 1;
    }

    auto logger = server.logger();
    logger->info("Stream URL: http://" + config.server.bindAddress + ":" +
                 std::to_string(server.port()) + "/stream/<account>/<stream>.ts", "Server");

    // Main loop - wait for shutdown signal
    auto lastStats = std::chrono::steady_clock::now();
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - lastStats >= std::chrono::seconds(60)) {
            auto stats = server.registry()->getStats();
            logger->info("Shared streams: " + std::to_string(stats.activeStreams) +
                         " | Subscribers: " + std::to_string(stats.totalSubscribers), "Server");
            lastStats = now;
        }
    }

    auto stopResult = server.stop();
    if (stopResult.isError()) {
        std::cerr << "[ERROR] Failed to stop: " << stopResult.error().message << std::endl;
        return 1;
    }
    return 0;
}
