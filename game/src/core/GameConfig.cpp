#include "GameConfig.hpp"
#include "terrain/Chunk.hpp"

namespace Lattice {

std::expected<void, ConfigError> GameConfig::LoadFromFile(const std::filesystem::path& filepath) {
    Config config;
    auto result = config.Load(filepath);
    if (!result) {
        return result;
    }

    LoadFromConfig(config);
    return {};
}

void GameConfig::LoadFromConfig(const Config& config) {
    serverAddress = config.Get<std::string>("client.server_address", serverAddress);
    serverPort = config.Get<int>("client.server_port", serverPort);
    connectTimeoutSeconds = config.Get<float>("client.connect_timeout_seconds", connectTimeoutSeconds);
    timeoutSeconds = config.Get<float>("client.timeout_seconds", timeoutSeconds);
    tickRate = config.Get<int>("client.tick_rate", tickRate);

    viewDistance = config.Get<int>("world.view_distance", viewDistance);
    asyncGeneration = config.Get<bool>("world.async_generation", asyncGeneration);
    workerThreads = config.Get<uint32_t>("world.worker_threads", workerThreads);
    maxPendingGeneration = config.Get<size_t>("world.max_pending_generation", maxPendingGeneration);
    groundHeight = config.Get<int>("world.ground_height", groundHeight);

    logLevel = config.Get<std::string>("logging.level", logLevel);
    logFile = config.Get<std::string>("logging.file", logFile);
}

std::expected<void, ConfigError> GameConfig::SaveToFile(const std::filesystem::path& filepath) const {
    Config config;

    config.Set("client.server_address", serverAddress);
    config.Set("client.server_port", serverPort);
    config.Set("client.connect_timeout_seconds", connectTimeoutSeconds);
    config.Set("client.timeout_seconds", timeoutSeconds);
    config.Set("client.tick_rate", tickRate);

    config.Set("world.view_distance", viewDistance);
    config.Set("world.async_generation", asyncGeneration);
    config.Set("world.worker_threads", workerThreads);
    config.Set("world.max_pending_generation", maxPendingGeneration);
    config.Set("world.ground_height", groundHeight);

    config.Set("logging.level", logLevel);
    config.Set("logging.file", logFile);

    return config.Save(filepath);
}

bool GameConfig::Validate(std::string& errorMessage) const {
    if (serverAddress.empty()) {
        errorMessage = "Server address cannot be empty";
        return false;
    }

    if (serverPort < 1 || serverPort > 65535) {
        errorMessage = "Server port must be between 1 and 65535";
        return false;
    }

    if (tickRate < 1 || tickRate > 1000) {
        errorMessage = "Tick rate must be between 1 and 1000";
        return false;
    }

    if (viewDistance < 0 || viewDistance > 64) {
        errorMessage = "View distance must be between 0 and 64 chunks";
        return false;
    }

    if (maxPendingGeneration == 0) {
        errorMessage = "Max pending generation must be at least 1";
        return false;
    }

    if (groundHeight < 0 || groundHeight > CHUNK_HEIGHT) {
        errorMessage = "Ground height must be between 0 and " + std::to_string(CHUNK_HEIGHT);
        return false;
    }

    return true;
}

} // namespace Lattice
