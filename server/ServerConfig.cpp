#include "ServerConfig.hpp"

namespace Lattice {

std::expected<void, ConfigError> ServerConfig::LoadFromFile(const std::filesystem::path& filepath) {
    Config config;
    auto result = config.Load(filepath);
    if (!result) {
        return result;
    }

    LoadFromConfig(config);
    return {};
}

void ServerConfig::LoadFromConfig(const Config& config) {
    serverName = config.Get<std::string>("server.name", serverName);
    maxClients = config.Get<int>("server.max_clients", maxClients);

    bindAddress = config.Get<std::string>("server.bind_address", bindAddress);
    port = config.Get<int>("server.port", port);
    timeoutSeconds = config.Get<float>("server.timeout_seconds", timeoutSeconds);
    tickRate = config.Get<int>("server.tick_rate", tickRate);

    spawnHalfExtent = config.Get<float>("server.spawn_half_extent", spawnHalfExtent);
    spawnHeight = config.Get<float>("server.spawn_height", spawnHeight);
    spawnSeed = config.Get<uint32_t>("server.spawn_seed", spawnSeed);

    logLevel = config.Get<std::string>("logging.level", logLevel);
    logFile = config.Get<std::string>("logging.file", logFile);
}

std::expected<void, ConfigError> ServerConfig::SaveToFile(const std::filesystem::path& filepath) const {
    Config config;

    config.Set("server.name", serverName);
    config.Set("server.max_clients", maxClients);
    config.Set("server.bind_address", bindAddress);
    config.Set("server.port", port);
    config.Set("server.timeout_seconds", timeoutSeconds);
    config.Set("server.tick_rate", tickRate);

    config.Set("server.spawn_half_extent", spawnHalfExtent);
    config.Set("server.spawn_height", spawnHeight);
    config.Set("server.spawn_seed", spawnSeed);

    config.Set("logging.level", logLevel);
    config.Set("logging.file", logFile);

    return config.Save(filepath);
}

void ServerConfig::ResetToDefaults() {
    *this = ServerConfig();
}

bool ServerConfig::Validate(std::string& errorMessage) const {
    if (serverName.empty()) {
        errorMessage = "Server name cannot be empty";
        return false;
    }

    if (maxClients < 1 || maxClients > 1024) {
        errorMessage = "Max clients must be between 1 and 1024";
        return false;
    }

    // 0 binds an ephemeral port
    if (port < 0 || port > 65535) {
        errorMessage = "Server port must be between 0 and 65535";
        return false;
    }

    if (tickRate < 1 || tickRate > 1000) {
        errorMessage = "Tick rate must be between 1 and 1000";
        return false;
    }

    if (timeoutSeconds <= 0.0f) {
        errorMessage = "Timeout must be positive";
        return false;
    }

    if (spawnHalfExtent <= 0.0f) {
        errorMessage = "Spawn half extent must be positive";
        return false;
    }

    return true;
}

} // namespace Lattice
