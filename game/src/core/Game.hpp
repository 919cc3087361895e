#pragma once

#include "GameConfig.hpp"
#include "core/JobSystem.hpp"
#include "networking/ClientReconciliation.hpp"
#include "networking/Transport.hpp"
#include "scene/EntityRegistry.hpp"
#include "terrain/ChunkManager.hpp"
#include "terrain/TerrainGenerator.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace Lattice {

/**
 * @brief Game state enumeration
 */
enum class GameState : uint8_t {
    Initializing,   ///< Subsystems not created yet
    Connecting,     ///< Waiting for the server to accept us
    Playing,        ///< Connected and ticking
    Disconnected    ///< Denied, kicked, timed out or left
};

[[nodiscard]] const char* GameStateToString(GameState state);

/**
 * @brief Game initialization parameters
 */
struct GameInitParams {
    GameConfig config;
    std::optional<std::string> chatMessage;  ///< Sent once the local player exists
};

/**
 * @brief Error types for game operations
 */
enum class GameError {
    None,
    InitializationFailed,
    NetworkError,
    InvalidState
};

[[nodiscard]] const char* GameErrorToString(GameError error);

/**
 * @brief Presentation factory that only records and logs what it is asked to build
 *
 * Stands in for the renderer on a headless client.
 */
class LoggingPresentationFactory : public IPresentationFactory {
public:
    void SpawnBundle(EntityRegistry& registry, EntityId entity, BundleKind kind) override;
    void DespawnBundle(EntityRegistry& registry, EntityId entity) override;

    [[nodiscard]] size_t GetSpawnCount() const noexcept { return m_spawned; }
    [[nodiscard]] size_t GetDespawnCount() const noexcept { return m_despawned; }

private:
    size_t m_spawned = 0;
    size_t m_despawned = 0;
};

/**
 * @brief Headless client that keeps a local view of the server world
 *
 * This class is responsible for:
 * - Connecting to the server and reconciling its snapshots
 * - Streaming chunks around the controlled player
 * - Tracking the local player's score
 */
class Game {
public:
    Game();
    ~Game();

    // Non-copyable, non-movable (manages unique resources)
    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;
    Game(Game&&) = delete;
    Game& operator=(Game&&) = delete;

    // =========================================================================
    // Initialization and Lifecycle
    // =========================================================================

    /**
     * @brief Connect over UDP and create every subsystem
     * @return Expected success or error
     */
    [[nodiscard]] std::expected<void, GameError> Initialize(const GameInitParams& params);

    /**
     * @brief Create every subsystem on top of an existing transport
     */
    [[nodiscard]] std::expected<void, GameError> Initialize(const GameInitParams& params,
                                                            std::unique_ptr<IClientTransport> transport);

    /**
     * @brief Disconnect and release all resources
     */
    void Shutdown();

    /**
     * @brief Main client tick
     * @param deltaTime Time since last tick in seconds
     */
    void Update(float deltaTime);

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] GameState GetState() const noexcept { return m_state; }
    [[nodiscard]] bool IsRunning() const noexcept {
        return m_state == GameState::Connecting || m_state == GameState::Playing;
    }

    /**
     * @brief Score of the controlled player, 0 before it exists
     */
    [[nodiscard]] int64_t GetScore() const;

    // =========================================================================
    // Subsystem Access
    // =========================================================================

    [[nodiscard]] EntityRegistry& GetRegistry() noexcept { return m_registry; }
    [[nodiscard]] const EntityRegistry& GetRegistry() const noexcept { return m_registry; }

    [[nodiscard]] ClientReconciliation* GetReconciliation() noexcept { return m_reconciliation.get(); }
    [[nodiscard]] ChunkManager* GetChunkManager() noexcept { return m_chunkManager.get(); }
    [[nodiscard]] const LoggingPresentationFactory& GetPresentation() const noexcept { return m_presentation; }

    /**
     * @brief Chunks reported ready since initialization
     */
    [[nodiscard]] uint64_t GetChunksReady() const noexcept { return m_chunksReady; }

private:
    [[nodiscard]] std::expected<void, GameError> CreateSubsystems(const GameInitParams& params,
                                                                  std::unique_ptr<IClientTransport> transport);
    void SetState(GameState state);
    void UpdatePlaying(float deltaTime);

    GameState m_state = GameState::Initializing;
    GameConfig m_config;

    EntityRegistry m_registry;
    LoggingPresentationFactory m_presentation;
    std::unique_ptr<IClientTransport> m_transport;
    std::unique_ptr<ClientReconciliation> m_reconciliation;

    // The chunk manager waits on generation jobs that reference the
    // generator, so it is destroyed first and the generator last.
    std::unique_ptr<LayeredTerrainGenerator> m_generator;
    std::unique_ptr<JobSystem> m_jobs;
    std::unique_ptr<ChunkManager> m_chunkManager;

    float m_totalPlayTime = 0.0f;
    uint64_t m_chunksReady = 0;
};

} // namespace Lattice
