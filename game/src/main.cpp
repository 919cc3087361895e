#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "core/Logger.hpp"

#include "core/Game.hpp"
#include "core/GameConfig.hpp"

namespace {

std::atomic<bool> g_stopRequested{false};

void HandleSignal(int) {
    g_stopRequested = true;
}

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string configPath = "config/client.json";
    std::optional<std::string> address;
    int port = -1;
    std::optional<std::string> chat;
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
            } else if (arg == "-a" || arg == "--address") {
                if (i + 1 < argc) {
                    args.address = argv[++i];
                }
            } else if (arg == "-p" || arg == "--port") {
                if (i + 1 < argc) {
                    args.port = std::atoi(argv[++i]);
                }
            } else if (arg == "--chat") {
                if (i + 1 < argc) {
                    args.chat = argv[++i];
                }
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << Lattice::Version::ClientName << "\n";
        std::cout << "==============\n\n";
        std::cout << "Usage: lattice_client [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help          Show this help message\n";
        std::cout << "  -c, --config PATH   Path to client configuration file\n";
        std::cout << "  -a, --address HOST  Server address\n";
        std::cout << "  -p, --port PORT     Server port\n";
        std::cout << "      --chat TEXT     Send a chat message after joining\n";
        std::cout << "\n";
        std::cout << "Version: " << Lattice::Version::ClientVersion << "\n";
    }
};

} // namespace

/**
 * @brief Main entry point for the headless client
 */
int main(int argc, char* argv[]) {
    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        CommandLineArgs::PrintHelp();
        return EXIT_SUCCESS;
    }

    Lattice::GameInitParams params;
    if (std::filesystem::exists(args.configPath)) {
        auto loaded = params.config.LoadFromFile(args.configPath);
        if (!loaded) {
            std::cerr << "Failed to load " << args.configPath << ": "
                      << Lattice::ConfigErrorToString(loaded.error()) << "\n";
            return EXIT_FAILURE;
        }
    }

    if (args.address) {
        params.config.serverAddress = *args.address;
    }
    if (args.port >= 0) {
        params.config.serverPort = args.port;
    }
    params.chatMessage = args.chat;

    Lattice::LogSettings logSettings;
    logSettings.file = params.config.logFile;
    logSettings.level = Lattice::Logger::ParseLevel(params.config.logLevel);
    Lattice::Logger::Initialize(logSettings);

    APP_LOG_INFO("{} v{} starting...", Lattice::Version::ClientName, Lattice::Version::ClientVersion);

    auto game = std::make_unique<Lattice::Game>();
    auto initResult = game->Initialize(params);
    if (!initResult) {
        APP_LOG_ERROR("Failed to initialize client: {}", Lattice::GameErrorToString(initResult.error()));
        Lattice::Logger::Shutdown();
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    using Clock = std::chrono::steady_clock;
    const auto tickInterval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<float>(1.0f / static_cast<float>(params.config.tickRate)));

    auto lastTick = Clock::now();
    auto nextTick = lastTick + tickInterval;

    APP_LOG_INFO("Entering main loop");
    while (!g_stopRequested && game->IsRunning()) {
        auto now = Clock::now();
        float deltaTime = std::chrono::duration<float>(now - lastTick).count();
        lastTick = now;

        game->Update(deltaTime);

        std::this_thread::sleep_until(nextTick);
        nextTick += tickInterval;
    }

    int exitCode = game->GetState() == Lattice::GameState::Disconnected ? EXIT_FAILURE : EXIT_SUCCESS;
    APP_LOG_INFO("Final score {}, {} chunks streamed", game->GetScore(), game->GetChunksReady());

    game->Shutdown();
    game.reset();

    APP_LOG_INFO("Exiting with code {}", exitCode);
    Lattice::Logger::Shutdown();
    return exitCode;
}
