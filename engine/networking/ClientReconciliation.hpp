#pragma once

#include "networking/EntityMapping.hpp"
#include "networking/Messages.hpp"
#include "networking/Transport.hpp"
#include "scene/EntityRegistry.hpp"

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_set>

namespace Lattice {

/**
 * @brief What a presentation bundle represents
 */
enum class BundleKind : uint8_t {
    LocalPlayer,
    RemotePlayer,
    WorldObject
};

inline const char* BundleKindToString(BundleKind kind) {
    switch (kind) {
        case BundleKind::LocalPlayer:  return "LocalPlayer";
        case BundleKind::RemotePlayer: return "RemotePlayer";
        case BundleKind::WorldObject:  return "WorldObject";
        default:                       return "Unknown";
    }
}

/**
 * @brief Collaborator that attaches visuals to replicated entities
 */
class IPresentationFactory {
public:
    virtual ~IPresentationFactory() = default;

    virtual void SpawnBundle(EntityRegistry& registry, EntityId entity, BundleKind kind) = 0;

    /** @brief Called before a replicated entity is despawned */
    virtual void DespawnBundle(EntityRegistry& /*registry*/, EntityId /*entity*/) {}
};

/**
 * @brief Binding of one connected player's server entity to its local entity
 */
struct PlayerInfo {
    EntityId serverEntity;
    EntityId clientEntity;
};

struct ReconciliationStats {
    uint64_t applied = 0;           // Snapshot entries written to a transform
    uint64_t unchanged = 0;         // Entries whose translation already matched
    uint64_t selfSkipped = 0;       // Entries for the controlled player
    uint64_t unmapped = 0;          // Entries with no local entity
    uint64_t decodeErrors = 0;
    uint64_t messagesSent = 0;
};

/**
 * @brief Client side of world state synchronization
 *
 * Applies server messages to the local registry through the entity
 * mapping, never overwriting the transform of the controlled player, and
 * pushes the controlled player's state to the server once per tick.
 */
class ClientReconciliation {
public:
    using ChatCallback = std::function<void(const ChatMessage&)>;
    using PlayerCallback = std::function<void(ClientId, EntityId)>;

    ClientReconciliation(IClientTransport& transport, EntityRegistry& registry,
                         IPresentationFactory* presentation = nullptr);

    ClientReconciliation(const ClientReconciliation&) = delete;
    ClientReconciliation& operator=(const ClientReconciliation&) = delete;

    /**
     * @brief Pump the transport, apply inbound messages, push local state
     */
    void Tick(float deltaTime);

    /**
     * @brief Drain every server channel; undecodable buffers are skipped
     */
    void ReceiveServerMessages();

    /**
     * @brief Send translation, look rotation, queued commands and pending chat
     *
     * Does nothing until a controlled entity exists.
     */
    void SendClientState();

    /**
     * @brief Apply one decoded server message
     */
    void ApplyMessage(const Message& message);

    /**
     * @brief Apply a transform snapshot under the self-authority rule
     */
    void ApplySnapshot(const EntitySnapshot& snapshot);

    // =========================================================================
    // Outbound state
    // =========================================================================

    void SetLookRotation(const glm::quat& rotation) { m_lookRotation = rotation; }
    void QueueCommand(const PlayerCommand& command) { m_pendingCommands.push_back(command); }

    /**
     * @brief Replace the pending chat line (sent on the next push)
     * @return false if the text exceeds the wire string limit; nothing is queued
     */
    bool QueueChat(std::string text);

    [[nodiscard]] bool HasPendingChat() const { return m_pendingChat.has_value(); }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::optional<EntityId> GetControlledEntity() const { return m_controlled; }
    [[nodiscard]] const std::map<ClientId, PlayerInfo>& GetPlayers() const { return m_players; }
    [[nodiscard]] const EntityMapping& GetMapping() const { return m_mapping; }
    [[nodiscard]] const std::optional<ChatMessage>& GetLastChat() const { return m_lastChat; }
    [[nodiscard]] bool IsHost() const { return m_isHost; }
    [[nodiscard]] const ReconciliationStats& GetStats() const { return m_stats; }

    void SetOnChatReceived(ChatCallback callback) { m_onChatReceived = std::move(callback); }
    void SetOnPlayerJoined(PlayerCallback callback) { m_onPlayerJoined = std::move(callback); }
    void SetOnPlayerLeft(PlayerCallback callback) { m_onPlayerLeft = std::move(callback); }

private:
    void OnPlayerCreate(const PlayerCreate& message);
    void OnPlayerRemove(const PlayerRemove& message);
    void OnEntityCreate(const EntityCreate& message);
    void OnEntityRemove(const EntityRemove& message);
    void Send(ClientChannel channel, const Message& message);

    IClientTransport& m_transport;
    EntityRegistry& m_registry;
    IPresentationFactory* m_presentation;

    EntityMapping m_mapping;
    std::map<ClientId, PlayerInfo> m_players;
    std::unordered_set<EntityId> m_worldEntities;     // Server ids
    std::optional<EntityId> m_controlled;

    glm::quat m_lookRotation{1.0f, 0.0f, 0.0f, 0.0f};
    std::deque<PlayerCommand> m_pendingCommands;
    std::optional<std::string> m_pendingChat;
    std::optional<ChatMessage> m_lastChat;
    bool m_isHost = false;

    ReconciliationStats m_stats;

    ChatCallback m_onChatReceived;
    PlayerCallback m_onPlayerJoined;
    PlayerCallback m_onPlayerLeft;
};

} // namespace Lattice
