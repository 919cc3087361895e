#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

namespace Lattice {

/**
 * @brief Dedicated server configuration settings
 *
 * Stores the network, world and logging settings of a lattice_server
 * process. Missing keys keep their defaults.
 */
class ServerConfig {
public:
    ServerConfig() = default;
    ~ServerConfig() = default;

    // =========================================================================
    // SERVER IDENTITY
    // =========================================================================

    std::string serverName = "Lattice Server";
    int maxClients = 64;

    // =========================================================================
    // NETWORK SETTINGS
    // =========================================================================

    std::string bindAddress = "0.0.0.0";
    int port = 5000;
    float timeoutSeconds = 10.0f;
    int tickRate = 60;

    // =========================================================================
    // WORLD SETTINGS
    // =========================================================================

    float spawnHalfExtent = 20.0f;
    float spawnHeight = 171.0f;
    uint32_t spawnSeed = 0;

    // =========================================================================
    // LOGGING
    // =========================================================================

    std::string logLevel = "info";
    std::string logFile;

    // =========================================================================
    // METHODS
    // =========================================================================

    /**
     * @brief Load configuration from a JSON file
     */
    [[nodiscard]] std::expected<void, ConfigError> LoadFromFile(const std::filesystem::path& filepath);

    /**
     * @brief Read settings from an already loaded Config
     */
    void LoadFromConfig(const Config& config);

    /**
     * @brief Save configuration to a JSON file
     */
    [[nodiscard]] std::expected<void, ConfigError> SaveToFile(const std::filesystem::path& filepath) const;

    /**
     * @brief Reset to default values
     */
    void ResetToDefaults();

    /**
     * @brief Validate configuration
     * @param errorMessage Set to a description of the first problem found
     * @return True if configuration is valid
     */
    bool Validate(std::string& errorMessage) const;
};

} // namespace Lattice
