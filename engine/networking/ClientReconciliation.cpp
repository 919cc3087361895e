#include "networking/ClientReconciliation.hpp"
#include "networking/WireCodec.hpp"
#include "core/Logger.hpp"

#include <type_traits>

namespace Lattice {

ClientReconciliation::ClientReconciliation(IClientTransport& transport, EntityRegistry& registry,
                                           IPresentationFactory* presentation)
    : m_transport(transport)
    , m_registry(registry)
    , m_presentation(presentation) {
}

bool ClientReconciliation::QueueChat(std::string text) {
    if (text.size() > WireCodec::MAX_STRING_LENGTH) {
        LATTICE_LOG_WARN("Chat message of {} bytes exceeds the {} byte limit, not sent",
                         text.size(), WireCodec::MAX_STRING_LENGTH);
        return false;
    }
    m_pendingChat = std::move(text);
    return true;
}

void ClientReconciliation::Tick(float deltaTime) {
    m_transport.Update(deltaTime);
    ReceiveServerMessages();
    SendClientState();
}

// ============================================================================
// Inbound
// ============================================================================

void ClientReconciliation::ReceiveServerMessages() {
    for (ServerChannel channel : ALL_SERVER_CHANNELS) {
        while (auto payload = m_transport.Receive(channel)) {
            auto message = WireCodec::DecodeOn(channel, *payload);
            if (!message) {
                ++m_stats.decodeErrors;
                LATTICE_LOG_DEBUG("Dropped server message on {}: {}",
                                  ChannelToString(channel), DecodeErrorToString(message.error()));
                continue;
            }
            ApplyMessage(*message);
        }
    }
}

void ClientReconciliation::ApplyMessage(const Message& message) {
    std::visit([this](auto&& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, PlayerCreate>) {
            OnPlayerCreate(msg);
        } else if constexpr (std::is_same_v<T, PlayerRemove>) {
            OnPlayerRemove(msg);
        } else if constexpr (std::is_same_v<T, NetworkedEntities> ||
                             std::is_same_v<T, NonNetworkedEntities>) {
            ApplySnapshot(msg);
        } else if constexpr (std::is_same_v<T, EntityCreate>) {
            OnEntityCreate(msg);
        } else if constexpr (std::is_same_v<T, EntityRemove>) {
            OnEntityRemove(msg);
        } else if constexpr (std::is_same_v<T, ChatMessage>) {
            m_lastChat = msg;
            if (m_onChatReceived) {
                m_onChatReceived(msg);
            }
        } else if constexpr (std::is_same_v<T, Host>) {
            m_isHost = msg.isHost;
            LATTICE_LOG_INFO("Host status: {}", m_isHost);
        } else {
            LATTICE_LOG_DEBUG("Ignoring client-bound message kind {}",
                              static_cast<int>(WireCodec::GetTag(msg)));
        }
    }, message);
}

void ClientReconciliation::ApplySnapshot(const EntitySnapshot& snapshot) {
    for (size_t i = 0; i < snapshot.entities.size(); ++i) {
        std::optional<EntityId> local = m_mapping.Lookup(snapshot.entities[i]);
        if (!local) {
            ++m_stats.unmapped;
            continue;
        }

        if (m_registry.IsControlled(*local)) {
            ++m_stats.selfSkipped;
            continue;
        }

        const Transform* current = m_registry.GetTransform(*local);
        if (!current) {
            ++m_stats.unmapped;
            continue;
        }

        if (current->translation == snapshot.translations[i]) {
            ++m_stats.unchanged;
            continue;
        }

        Transform updated;
        updated.translation = snapshot.translations[i];
        updated.rotation = snapshot.rotations[i];
        m_registry.SetTransform(*local, updated);
        ++m_stats.applied;
    }
}

void ClientReconciliation::OnPlayerCreate(const PlayerCreate& message) {
    if (m_players.contains(message.id)) {
        LATTICE_LOG_DEBUG("Duplicate PlayerCreate for client {}", message.id);
        return;
    }

    EntityId local = m_registry.Spawn(Transform::FromTranslation(message.translation));
    m_registry.SetPlayer(local, PlayerTag{message.id});

    const bool isLocal = message.id == m_transport.GetClientId();
    if (isLocal) {
        m_registry.SetControlled(local, true);
        m_controlled = local;
    }

    if (m_presentation) {
        m_presentation->SpawnBundle(m_registry, local, isLocal ? BundleKind::LocalPlayer : BundleKind::RemotePlayer);
    }

    m_players[message.id] = PlayerInfo{message.entity, local};
    m_mapping.Insert(message.entity, local);

    LATTICE_LOG_INFO("Player {} joined{}", message.id, isLocal ? " (you)" : "");

    if (m_onPlayerJoined) {
        m_onPlayerJoined(message.id, local);
    }
}

void ClientReconciliation::OnPlayerRemove(const PlayerRemove& message) {
    auto it = m_players.find(message.id);
    if (it == m_players.end()) {
        LATTICE_LOG_DEBUG("PlayerRemove for unknown client {}", message.id);
        return;
    }

    PlayerInfo info = it->second;
    m_players.erase(it);
    m_mapping.Remove(info.serverEntity);

    if (m_presentation) {
        m_presentation->DespawnBundle(m_registry, info.clientEntity);
    }
    m_registry.Despawn(info.clientEntity);

    if (m_controlled == info.clientEntity) {
        m_controlled.reset();
    }

    LATTICE_LOG_INFO("Player {} left", message.id);

    if (m_onPlayerLeft) {
        m_onPlayerLeft(message.id, info.clientEntity);
    }
}

void ClientReconciliation::OnEntityCreate(const EntityCreate& message) {
    if (m_mapping.Contains(message.entity)) {
        return;
    }

    Transform transform;
    transform.translation = message.translation;
    transform.rotation = message.rotation;
    EntityId local = m_registry.Spawn(transform);

    if (m_presentation) {
        m_presentation->SpawnBundle(m_registry, local, BundleKind::WorldObject);
    }

    m_mapping.Insert(message.entity, local);
    m_worldEntities.insert(message.entity);
}

void ClientReconciliation::OnEntityRemove(const EntityRemove& message) {
    if (!m_worldEntities.erase(message.entity)) {
        return;
    }
    if (auto local = m_mapping.Remove(message.entity)) {
        if (m_presentation) {
            m_presentation->DespawnBundle(m_registry, *local);
        }
        m_registry.Despawn(*local);
    }
}

// ============================================================================
// Outbound
// ============================================================================

void ClientReconciliation::SendClientState() {
    if (!m_controlled || !m_transport.IsConnected()) {
        return;
    }

    const Transform* transform = m_registry.GetTransform(*m_controlled);
    if (!transform) {
        return;
    }

    Send(ClientChannel::Input, PlayerInput{transform->translation});
    Send(ClientChannel::Rots, RotationInput{m_lookRotation});

    while (!m_pendingCommands.empty()) {
        Send(ClientChannel::Command, m_pendingCommands.front());
        m_pendingCommands.pop_front();
    }

    if (m_pendingChat) {
        ChatMessage chat;
        chat.clientId = m_transport.GetClientId();
        chat.text = std::move(*m_pendingChat);
        m_pendingChat.reset();
        Send(ClientChannel::Chat, chat);
    }
}

void ClientReconciliation::Send(ClientChannel channel, const Message& message) {
    m_transport.Send(channel, WireCodec::Encode(message));
    ++m_stats.messagesSent;
}

} // namespace Lattice
