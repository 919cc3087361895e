#include "networking/ServerReplication.hpp"
#include "networking/WireCodec.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace Lattice {

ServerReplication::ServerReplication(IServerTransport& transport, EntityRegistry& registry,
                                     ReplicationSettings settings)
    : m_transport(transport)
    , m_registry(registry)
    , m_settings(settings)
    , m_rng(settings.spawnSeed)
    , m_spawnDistribution(-settings.spawnHalfExtent, settings.spawnHalfExtent) {
}

void ServerReplication::Tick(float deltaTime) {
    m_transport.Update(deltaTime);
    ProcessConnectionEvents();
    ReceiveClientMessages();
    BroadcastSnapshots();
}

// ============================================================================
// Connections
// ============================================================================

void ServerReplication::ProcessConnectionEvents() {
    while (auto event = m_transport.PollEvent()) {
        switch (event->type) {
            case TransportEvent::Type::Connected:
                HandleClientConnected(event->clientId);
                break;
            case TransportEvent::Type::Disconnected:
                LATTICE_LOG_INFO("Client {} disconnected: {}", event->clientId,
                                 DisconnectReasonToString(event->reason));
                HandleClientDisconnected(event->clientId);
                break;
        }
    }
}

void ServerReplication::HandleClientConnected(ClientId client) {
    if (m_connections.contains(client)) {
        LATTICE_LOG_WARN("Client {} connected twice, ignoring", client);
        return;
    }

    LATTICE_LOG_INFO("Client {} connected", client);

    // Existing players and world entities go to the newcomer only
    for (const auto& [id, connection] : m_connections) {
        const Transform* transform = m_registry.GetTransform(connection.entity);
        PlayerCreate create;
        create.id = id;
        create.entity = connection.entity;
        create.translation = transform ? transform->translation : glm::vec3(0.0f);
        SendTo(client, ServerChannel::ServerMessages, create);
    }
    for (EntityId entity : m_worldEntities) {
        const Transform* transform = m_registry.GetTransform(entity);
        EntityCreate create;
        create.entity = entity;
        if (transform) {
            create.translation = transform->translation;
            create.rotation = transform->rotation;
        }
        SendTo(client, ServerChannel::ServerMessages, create);
    }

    Connection& connection = m_connections[client];
    connection.id = client;
    connection.state = ConnectionState::Connected;
    connection.joinOrder = m_nextJoinOrder++;

    glm::vec3 spawn = RandomSpawnPosition();
    connection.entity = m_registry.Spawn(Transform::FromTranslation(spawn));
    m_registry.SetPlayer(connection.entity, PlayerTag{client});

    PlayerCreate create;
    create.id = client;
    create.entity = connection.entity;
    create.translation = spawn;
    BroadcastMessage(ServerChannel::ServerMessages, create);

    if (!m_host) {
        m_host = client;
    }
    SendTo(client, ServerChannel::Host, Host{m_host == client});

    connection.state = ConnectionState::Active;

    LATTICE_LOG_DEBUG("Client {} spawned as entity {} at ({:.2f}, {:.2f}, {:.2f})",
                      client, connection.entity.ToString(), spawn.x, spawn.y, spawn.z);

    if (m_onPlayerJoined) {
        m_onPlayerJoined(client, connection.entity);
    }
}

void ServerReplication::HandleClientDisconnected(ClientId client) {
    auto it = m_connections.find(client);
    if (it == m_connections.end()) {
        return;
    }

    EntityId entity = it->second.entity;
    m_registry.Despawn(entity);
    m_connections.erase(it);

    BroadcastMessage(ServerChannel::ServerMessages, PlayerRemove{client});

    if (m_host == client) {
        m_host.reset();
        auto oldest = std::min_element(m_connections.begin(), m_connections.end(),
            [](const auto& a, const auto& b) { return a.second.joinOrder < b.second.joinOrder; });
        if (oldest != m_connections.end()) {
            m_host = oldest->first;
            SendTo(oldest->first, ServerChannel::Host, Host{true});
            LATTICE_LOG_INFO("Client {} is now host", oldest->first);
        }
    }

    if (m_onPlayerLeft) {
        m_onPlayerLeft(client, entity);
    }
}

// ============================================================================
// Client messages
// ============================================================================

void ServerReplication::ReceiveClientMessages() {
    for (auto& [id, connection] : m_connections) {
        if (connection.state == ConnectionState::Active) {
            DrainClient(connection);
        }
    }
}

void ServerReplication::DrainClient(Connection& connection) {
    const ClientId client = connection.id;

    auto drain = [this, client](ClientChannel channel, auto&& handle) {
        while (auto payload = m_transport.Receive(client, channel)) {
            ++m_stats.messagesReceived;
            auto message = WireCodec::DecodeOn(channel, *payload);
            if (!message) {
                ++m_stats.messagesDropped;
                LATTICE_LOG_DEBUG("Dropped message from client {} on {}: {}", client,
                                  ChannelToString(channel), DecodeErrorToString(message.error()));
                continue;
            }
            handle(*message);
        }
    };

    std::optional<glm::vec3> latestTranslation;
    std::optional<glm::quat> latestRotation;

    drain(ClientChannel::Input, [&latestTranslation](const Message& message) {
        latestTranslation = std::get<PlayerInput>(message).translation;
    });
    drain(ClientChannel::Rots, [&latestRotation](const Message& message) {
        latestRotation = std::get<RotationInput>(message).rotation;
    });

    if (latestTranslation || latestRotation) {
        if (const Transform* current = m_registry.GetTransform(connection.entity)) {
            Transform updated = *current;
            if (latestTranslation) updated.translation = *latestTranslation;
            if (latestRotation) updated.rotation = *latestRotation;
            m_registry.SetTransform(connection.entity, updated);
        }
    }

    drain(ClientChannel::Command, [this, client](const Message& message) {
        const auto& command = std::get<PlayerCommand>(message);
        LATTICE_LOG_DEBUG("Client {} command {}", client, CommandActionToString(command.action));
        if (m_onPlayerCommand) {
            m_onPlayerCommand(client, command);
        }
    });

    drain(ClientChannel::Chat, [this, client](const Message& message) {
        ChatMessage chat = std::get<ChatMessage>(message);
        chat.clientId = client;
        BroadcastMessage(ServerChannel::ChatChannel, chat);
        if (m_onChatMessage) {
            m_onChatMessage(chat);
        }
    });
}

// ============================================================================
// Snapshots
// ============================================================================

void ServerReplication::BroadcastSnapshots() {
    NetworkedEntities players;
    for (const auto& [id, connection] : m_connections) {
        if (const Transform* transform = m_registry.GetTransform(connection.entity)) {
            players.Add(connection.entity, transform->translation, transform->rotation);
        }
    }
    BroadcastMessage(ServerChannel::NetworkedEntities, players);
    ++m_stats.snapshotsBroadcast;

    if (!m_worldEntities.empty()) {
        NonNetworkedEntities world;
        for (EntityId entity : m_worldEntities) {
            if (const Transform* transform = m_registry.GetTransform(entity)) {
                world.Add(entity, transform->translation, transform->rotation);
            }
        }
        BroadcastMessage(ServerChannel::NonNetworkedEntities, world);
        ++m_stats.snapshotsBroadcast;
    }
}

// ============================================================================
// World entities
// ============================================================================

EntityId ServerReplication::SpawnWorldEntity(const Transform& transform) {
    EntityId entity = m_registry.Spawn(transform);
    m_worldEntities.push_back(entity);

    EntityCreate create;
    create.entity = entity;
    create.translation = transform.translation;
    create.rotation = transform.rotation;
    BroadcastMessage(ServerChannel::ServerMessages, create);
    return entity;
}

bool ServerReplication::DespawnWorldEntity(EntityId entity) {
    auto it = std::find(m_worldEntities.begin(), m_worldEntities.end(), entity);
    if (it == m_worldEntities.end()) {
        return false;
    }
    m_worldEntities.erase(it);
    m_registry.Despawn(entity);
    BroadcastMessage(ServerChannel::ServerMessages, EntityRemove{entity});
    return true;
}

bool ServerReplication::SetWorldEntityTransform(EntityId entity, const Transform& transform) {
    if (std::find(m_worldEntities.begin(), m_worldEntities.end(), entity) == m_worldEntities.end()) {
        return false;
    }
    return m_registry.SetTransform(entity, transform);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<EntityId> ServerReplication::GetPlayerEntity(ClientId client) const {
    auto it = m_connections.find(client);
    if (it == m_connections.end()) {
        return std::nullopt;
    }
    return it->second.entity;
}

ConnectionState ServerReplication::GetConnectionState(ClientId client) const {
    auto it = m_connections.find(client);
    return it == m_connections.end() ? ConnectionState::Disconnected : it->second.state;
}

// ============================================================================
// Helpers
// ============================================================================

glm::vec3 ServerReplication::RandomSpawnPosition() {
    float x = m_spawnDistribution(m_rng);
    float z = m_spawnDistribution(m_rng);
    return glm::vec3(x, m_settings.spawnHeight, z);
}

void ServerReplication::SendTo(ClientId client, ServerChannel channel, const Message& message) {
    m_transport.Send(client, channel, WireCodec::Encode(message));
    ++m_stats.messagesSent;
}

void ServerReplication::BroadcastMessage(ServerChannel channel, const Message& message) {
    // Only clients whose join has been handled; the transport may already
    // hold links whose Connected event is still queued
    const std::vector<uint8_t> payload = WireCodec::Encode(message);
    for (const auto& [id, connection] : m_connections) {
        m_transport.Send(id, channel, payload);
        ++m_stats.messagesSent;
    }
}

} // namespace Lattice
