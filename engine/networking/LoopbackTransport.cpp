#include "networking/LoopbackTransport.hpp"
#include "core/Logger.hpp"

namespace Lattice {

// ============================================================================
// LoopbackServerTransport
// ============================================================================

LoopbackServerTransport::LoopbackServerTransport()
    : LoopbackServerTransport(Settings{}) {
}

LoopbackServerTransport::LoopbackServerTransport(Settings settings)
    : m_settings(settings) {
}

LoopbackServerTransport::~LoopbackServerTransport() {
    Shutdown();
}

std::unique_ptr<LoopbackClientTransport> LoopbackServerTransport::Connect(uint64_t protocolId) {
    if (m_shutdown) {
        return std::make_unique<LoopbackClientTransport>(DisconnectReason::ServerShutdown);
    }
    if (protocolId != m_settings.protocolId) {
        LATTICE_LOG_WARN("Loopback: refused connection with protocol id {:#x}", protocolId);
        return std::make_unique<LoopbackClientTransport>(DisconnectReason::ProtocolMismatch);
    }
    if (m_links.size() >= m_settings.maxClients) {
        LATTICE_LOG_WARN("Loopback: refused connection, server full ({} clients)", m_links.size());
        return std::make_unique<LoopbackClientTransport>(DisconnectReason::ServerFull);
    }

    auto link = std::make_shared<Link>();
    link->clientId = m_nextClientId++;
    m_links[link->clientId] = link;
    m_events.push(TransportEvent{TransportEvent::Type::Connected, link->clientId, DisconnectReason::ClientLeft});

    return std::make_unique<LoopbackClientTransport>(link);
}

void LoopbackServerTransport::Update(float /*deltaTime*/) {
    // Links the client side closed since the last update
    for (auto it = m_links.begin(); it != m_links.end();) {
        if (!it->second->open) {
            m_events.push(TransportEvent{TransportEvent::Type::Disconnected, it->first, it->second->closeReason});
            it = m_links.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<TransportEvent> LoopbackServerTransport::PollEvent() {
    if (m_events.empty()) {
        return std::nullopt;
    }
    TransportEvent event = m_events.front();
    m_events.pop();
    return event;
}

std::optional<std::vector<uint8_t>> LoopbackServerTransport::Receive(ClientId client, ClientChannel channel) {
    auto it = m_links.find(client);
    if (it == m_links.end() || !it->second->open) {
        return std::nullopt;
    }
    auto& queue = it->second->toServer[static_cast<size_t>(channel)];
    if (queue.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> payload = std::move(queue.front());
    queue.pop_front();
    return payload;
}

void LoopbackServerTransport::Send(ClientId client, ServerChannel channel, const std::vector<uint8_t>& payload) {
    auto it = m_links.find(client);
    if (it == m_links.end() || !it->second->open) {
        return;
    }
    it->second->toClient[static_cast<size_t>(channel)].push_back(payload);
}

std::vector<ClientId> LoopbackServerTransport::GetClientIds() const {
    std::vector<ClientId> ids;
    ids.reserve(m_links.size());
    for (const auto& [id, link] : m_links) {
        if (link->open) {
            ids.push_back(id);
        }
    }
    return ids;
}

bool LoopbackServerTransport::IsClientConnected(ClientId client) const {
    auto it = m_links.find(client);
    return it != m_links.end() && it->second->open;
}

void LoopbackServerTransport::Disconnect(ClientId client) {
    CloseLink(client, DisconnectReason::Kicked);
}

void LoopbackServerTransport::Shutdown() {
    if (m_shutdown) {
        return;
    }
    while (!m_links.empty()) {
        CloseLink(m_links.begin()->first, DisconnectReason::ServerShutdown);
    }
    m_shutdown = true;
}

void LoopbackServerTransport::CloseLink(ClientId client, DisconnectReason reason) {
    auto it = m_links.find(client);
    if (it == m_links.end()) {
        return;
    }
    it->second->open = false;
    it->second->closeReason = reason;
    m_events.push(TransportEvent{TransportEvent::Type::Disconnected, client, reason});
    m_links.erase(it);
}

// ============================================================================
// LoopbackClientTransport
// ============================================================================

LoopbackClientTransport::LoopbackClientTransport(std::shared_ptr<LoopbackServerTransport::Link> link)
    : m_link(std::move(link)) {
}

LoopbackClientTransport::LoopbackClientTransport(DisconnectReason deniedReason)
    : m_state(ClientConnectionState::Denied)
    , m_reason(deniedReason) {
}

LoopbackClientTransport::~LoopbackClientTransport() {
    Disconnect();
}

void LoopbackClientTransport::Update(float /*deltaTime*/) {
    if (m_state == ClientConnectionState::Connected && m_link && !m_link->open) {
        m_state = ClientConnectionState::Disconnected;
        m_reason = m_link->closeReason;
    }
}

std::optional<std::vector<uint8_t>> LoopbackClientTransport::Receive(ServerChannel channel) {
    if (!m_link) {
        return std::nullopt;
    }
    // Messages queued before the server closed the link are still readable
    auto& queue = m_link->toClient[static_cast<size_t>(channel)];
    if (queue.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> payload = std::move(queue.front());
    queue.pop_front();
    return payload;
}

void LoopbackClientTransport::Send(ClientChannel channel, const std::vector<uint8_t>& payload) {
    if (m_state != ClientConnectionState::Connected || !m_link || !m_link->open) {
        return;
    }
    m_link->toServer[static_cast<size_t>(channel)].push_back(payload);
}

ClientConnectionState LoopbackClientTransport::GetState() const {
    return m_state;
}

ClientId LoopbackClientTransport::GetClientId() const {
    return m_link ? m_link->clientId : 0;
}

std::optional<DisconnectReason> LoopbackClientTransport::GetDisconnectReason() const {
    return m_reason;
}

void LoopbackClientTransport::Disconnect() {
    if (m_state != ClientConnectionState::Connected) {
        return;
    }
    if (m_link && m_link->open) {
        m_link->open = false;
        m_link->closeReason = DisconnectReason::ClientLeft;
    }
    m_state = ClientConnectionState::Disconnected;
    m_reason = DisconnectReason::ClientLeft;
}

} // namespace Lattice
