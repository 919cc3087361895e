#pragma once

#include "networking/Messages.hpp"
#include "networking/Transport.hpp"
#include "scene/EntityRegistry.hpp"

#include <functional>
#include <map>
#include <optional>
#include <random>
#include <vector>

namespace Lattice {

/**
 * @brief Lifecycle of a client connection on the server
 */
enum class ConnectionState : uint8_t {
    Connected,      // Transport connected, join fan-out in progress
    Active,         // Player entity exists; input is drained each tick
    Disconnected
};

/**
 * @brief Spawn placement for new players
 */
struct ReplicationSettings {
    float spawnHalfExtent = 20.0f;  // x and z drawn from [-h, h)
    float spawnHeight = 171.0f;
    uint32_t spawnSeed = 0;
};

struct ReplicationStats {
    uint64_t messagesSent = 0;
    uint64_t messagesReceived = 0;
    uint64_t messagesDropped = 0;
    uint64_t snapshotsBroadcast = 0;
};

/**
 * @brief Authoritative server side of world state synchronization
 *
 * Owns the player lobby (client id -> authoritative entity). Each Tick
 * pumps the transport, handles connects and disconnects, applies the most
 * recent input of every active client and broadcasts a snapshot of all
 * player entities.
 */
class ServerReplication {
public:
    using CommandCallback = std::function<void(ClientId, const PlayerCommand&)>;
    using ChatCallback = std::function<void(const ChatMessage&)>;
    using PlayerCallback = std::function<void(ClientId, EntityId)>;

    ServerReplication(IServerTransport& transport, EntityRegistry& registry,
                      ReplicationSettings settings = {});

    ServerReplication(const ServerReplication&) = delete;
    ServerReplication& operator=(const ServerReplication&) = delete;

    /**
     * @brief One server tick
     *
     * Order: transport update, connection events, client messages,
     * snapshot broadcast.
     */
    void Tick(float deltaTime);

    // =========================================================================
    // Tick stages
    // =========================================================================

    void ProcessConnectionEvents();
    void HandleClientConnected(ClientId client);
    void HandleClientDisconnected(ClientId client);

    /**
     * @brief Drain every active client's channels
     *
     * Input and Rots are most-recent-wins per tick. Malformed payloads are
     * counted and dropped without disconnecting the client.
     */
    void ReceiveClientMessages();

    void BroadcastSnapshots();

    // =========================================================================
    // World entities
    // =========================================================================

    /**
     * @brief Spawn a server-owned non-player entity and announce it
     */
    EntityId SpawnWorldEntity(const Transform& transform);

    bool DespawnWorldEntity(EntityId entity);

    bool SetWorldEntityTransform(EntityId entity, const Transform& transform);

    [[nodiscard]] const std::vector<EntityId>& GetWorldEntities() const { return m_worldEntities; }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::optional<EntityId> GetPlayerEntity(ClientId client) const;
    [[nodiscard]] ConnectionState GetConnectionState(ClientId client) const;
    [[nodiscard]] size_t GetPlayerCount() const { return m_connections.size(); }
    [[nodiscard]] std::optional<ClientId> GetHostClient() const { return m_host; }
    [[nodiscard]] const ReplicationStats& GetStats() const { return m_stats; }

    // =========================================================================
    // Callbacks
    // =========================================================================

    void SetOnPlayerCommand(CommandCallback callback) { m_onPlayerCommand = std::move(callback); }
    void SetOnChatMessage(ChatCallback callback) { m_onChatMessage = std::move(callback); }
    void SetOnPlayerJoined(PlayerCallback callback) { m_onPlayerJoined = std::move(callback); }
    void SetOnPlayerLeft(PlayerCallback callback) { m_onPlayerLeft = std::move(callback); }

private:
    struct Connection {
        ClientId id = 0;
        EntityId entity;
        ConnectionState state = ConnectionState::Connected;
        uint64_t joinOrder = 0;
    };

    glm::vec3 RandomSpawnPosition();
    void SendTo(ClientId client, ServerChannel channel, const Message& message);
    void BroadcastMessage(ServerChannel channel, const Message& message);
    void DrainClient(Connection& connection);

    IServerTransport& m_transport;
    EntityRegistry& m_registry;
    ReplicationSettings m_settings;

    std::map<ClientId, Connection> m_connections;
    std::vector<EntityId> m_worldEntities;
    std::optional<ClientId> m_host;
    uint64_t m_nextJoinOrder = 0;

    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_spawnDistribution;

    ReplicationStats m_stats;

    CommandCallback m_onPlayerCommand;
    ChatCallback m_onChatMessage;
    PlayerCallback m_onPlayerJoined;
    PlayerCallback m_onPlayerLeft;
};

} // namespace Lattice
