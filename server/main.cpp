#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include "core/Logger.hpp"

#include "ServerConfig.hpp"
#include "ServerManager.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/server.json";
    int port = -1;
    bool showHelp = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-c" || arg == "--config") {
                if (i + 1 < argc) {
                    args.configPath = argv[++i];
                }
            } else if (arg == "-p" || arg == "--port") {
                if (i + 1 < argc) {
                    args.port = std::atoi(argv[++i]);
                }
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "Lattice Server\n";
        std::cout << "==============\n\n";
        std::cout << "Usage: lattice_server [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Path to server configuration file\n";
        std::cout << "  -p, --port PORT     Override the UDP port\n";
    }
};

} // namespace

/**
 * @brief Main entry point for the dedicated server
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }

    Lattice::ServerConfig config;
    if (std::filesystem::exists(args.configPath)) {
        auto loaded = config.LoadFromFile(args.configPath);
        if (!loaded) {
            std::cerr << "Failed to load " << args.configPath << ": "
                      << Lattice::ConfigErrorToString(loaded.error()) << "\n";
            return EXIT_FAILURE;
        }
    }

    if (args.port >= 0) {
        config.port = args.port;
    }

    Lattice::LogSettings logSettings;
    logSettings.file = config.logFile;
    logSettings.level = Lattice::Logger::ParseLevel(config.logLevel);
    Lattice::Logger::Initialize(logSettings);

    std::string errorMessage;
    if (!config.Validate(errorMessage)) {
        APP_LOG_ERROR("Invalid configuration: {}", errorMessage);
        Lattice::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    Lattice::ServerManager server;
    auto started = server.Initialize(config);
    if (!started) {
        Lattice::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    using Clock = std::chrono::steady_clock;
    const auto tickInterval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<float>(server.GetTickInterval()));

    auto lastTick = Clock::now();
    auto nextTick = lastTick + tickInterval;
    auto lastReport = lastTick;

    APP_LOG_INFO("Entering main loop at {} ticks per second", server.GetTickRate());
    while (!g_stopRequested) {
        auto now = Clock::now();
        float deltaTime = std::chrono::duration<float>(now - lastTick).count();
        lastTick = now;

        server.Update(deltaTime);

        if (now - lastReport >= std::chrono::seconds(30)) {
            auto stats = server.GetStatistics();
            APP_LOG_INFO("{} clients, {} ticks, avg tick {:.3f} ms, {} dropped messages",
                         stats.connectedClients, stats.tickCount, stats.avgTickTime, stats.messagesDropped);
            lastReport = now;
        }

        std::this_thread::sleep_until(nextTick);
        nextTick += tickInterval;
    }

    APP_LOG_INFO("Shutdown requested");
    server.Shutdown();
    Lattice::Logger::Shutdown();
    return EXIT_SUCCESS;
}
