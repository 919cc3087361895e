#pragma once

#include "ServerConfig.hpp"
#include "networking/ServerReplication.hpp"
#include "networking/Transport.hpp"
#include "scene/EntityRegistry.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace Lattice {

/**
 * @brief Server statistics
 */
struct ServerStats {
    size_t connectedClients = 0;
    size_t worldEntities = 0;
    uint64_t tickCount = 0;
    uint64_t uptimeSeconds = 0;
    float avgTickTime = 0.0f;   // Milliseconds
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;
    uint64_t messagesDropped = 0;
};

/**
 * @brief Server status
 */
enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Stopping,
    Error
};

[[nodiscard]] const char* ServerStatusToString(ServerStatus status);

/**
 * @brief Dedicated server host
 *
 * Owns the transport, the authoritative entity registry and the
 * replication engine, and drives them from the main loop:
 * - Binds the UDP transport (or adopts an injected one)
 * - Ticks replication at the configured rate
 * - Reports joins, leaves, commands and chat through the app logger
 */
class ServerManager {
public:
    ServerManager();
    ~ServerManager();

    ServerManager(const ServerManager&) = delete;
    ServerManager& operator=(const ServerManager&) = delete;

    // =========================================================================
    // LIFECYCLE
    // =========================================================================

    /**
     * @brief Validate the configuration and bind the UDP transport
     * @return TransportError if the socket could not be created or bound
     */
    [[nodiscard]] std::expected<void, TransportError> Initialize(const ServerConfig& config);

    /**
     * @brief Start with an already connected transport (listen server, tests)
     */
    void Initialize(const ServerConfig& config, std::unique_ptr<IServerTransport> transport);

    /**
     * @brief Disconnect every client and release the transport
     */
    void Shutdown();

    ServerStatus GetStatus() const { return m_status; }
    bool IsRunning() const { return m_status == ServerStatus::Running; }

    // =========================================================================
    // UPDATE
    // =========================================================================

    /**
     * @brief Run one server tick (call from main loop)
     * @param deltaTime Time since last tick
     */
    void Update(float deltaTime);

    int GetTickRate() const { return m_config.tickRate; }

    /**
     * @brief Fixed interval between ticks in seconds
     */
    float GetTickInterval() const { return 1.0f / static_cast<float>(m_config.tickRate); }

    // =========================================================================
    // ACCESS
    // =========================================================================

    const ServerConfig& GetConfig() const { return m_config; }

    /**
     * @brief Port the UDP transport is bound to, 0 for other transports
     */
    uint16_t GetBoundPort() const { return m_boundPort; }

    ServerReplication* GetReplication() { return m_replication.get(); }
    EntityRegistry& GetRegistry() { return m_registry; }
    const EntityRegistry& GetRegistry() const { return m_registry; }

    ServerStats GetStatistics() const;

    // =========================================================================
    // CALLBACKS
    // =========================================================================

    std::function<void(const std::string& message)> OnServerMessage;
    std::function<void(const std::string& error)> OnError;

private:
    void Attach(std::unique_ptr<IServerTransport> transport);

    void LogMessage(const std::string& message);
    void LogError(const std::string& error);

    ServerConfig m_config;
    ServerStatus m_status = ServerStatus::Stopped;

    // Declaration order is destruction order in reverse: replication
    // references the registry and the transport.
    EntityRegistry m_registry;
    std::unique_ptr<IServerTransport> m_transport;
    std::unique_ptr<ServerReplication> m_replication;
    uint16_t m_boundPort = 0;

    // Timing
    uint64_t m_startTime = 0;
    uint64_t m_tickCount = 0;
    float m_totalTickTime = 0.0f;
};

} // namespace Lattice
