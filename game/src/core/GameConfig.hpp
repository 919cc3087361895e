#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace Lattice {

// =============================================================================
// Version Information
// =============================================================================
namespace Version {
    inline constexpr std::string_view ClientName = "Lattice Client";
    inline constexpr std::string_view ClientVersion = "1.0.0";
}

/**
 * @brief Runtime configuration of the headless client
 *
 * Contains the settings for:
 * - Server connection
 * - Tick rate
 * - Chunk streaming around the controlled player
 * - Logging
 */
struct GameConfig {
    // Connection
    std::string serverAddress = "127.0.0.1";
    int serverPort = 5000;
    float connectTimeoutSeconds = 5.0f;
    float timeoutSeconds = 10.0f;

    // Simulation
    int tickRate = 60;

    // Chunk streaming
    int viewDistance = 16;              // Radius in chunks
    bool asyncGeneration = false;
    uint32_t workerThreads = 0;         // 0 = hardware_concurrency - 1
    size_t maxPendingGeneration = 4096;
    int groundHeight = 64;

    // Logging
    std::string logLevel = "info";
    std::string logFile;

    [[nodiscard]] std::expected<void, ConfigError> LoadFromFile(const std::filesystem::path& filepath);
    void LoadFromConfig(const Config& config);
    [[nodiscard]] std::expected<void, ConfigError> SaveToFile(const std::filesystem::path& filepath) const;

    /**
     * @brief Validate configuration
     * @param errorMessage Set to a description of the first problem found
     */
    bool Validate(std::string& errorMessage) const;
};

} // namespace Lattice
