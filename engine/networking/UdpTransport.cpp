#include "networking/UdpTransport.hpp"
#include "networking/ByteStream.hpp"
#include "core/Logger.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
#include <queue>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    using SocketType = SOCKET;
    #define INVALID_SOCK INVALID_SOCKET
    #define SOCKET_ERROR_CODE WSAGetLastError()
    #define CLOSE_SOCKET closesocket
#else
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <fcntl.h>
    #include <netdb.h>
    using SocketType = int;
    #define INVALID_SOCK -1
    #define SOCKET_ERROR_CODE errno
    #define CLOSE_SOCKET close
#endif

namespace Lattice {

namespace {

constexpr size_t MAX_DATAGRAM_SIZE = 65536;
constexpr uint32_t MAX_REORDER_WINDOW = 1024;
constexpr uint64_t CONNECT_RETRY_MS = 250;

uint64_t GetCurrentTimeMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool InitializeSockets() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsaData;
        if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
            return false;
        }
        initialized = true;
    }
#endif
    return true;
}

void SetNonBlocking(SocketType sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

std::string AddressToString(const sockaddr_in& addr) {
    char buffer[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer));
    return std::string(buffer) + ":" + std::to_string(ntohs(addr.sin_port));
}

bool SameAddress(const sockaddr_in& a, const sockaddr_in& b) {
    return a.sin_addr.s_addr == b.sin_addr.s_addr && a.sin_port == b.sin_port;
}

/**
 * @brief Resolve a dotted address or host name to an IPv4 address
 */
bool ResolveAddress(const std::string& address, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    if (inet_pton(AF_INET, address.c_str(), &out.sin_addr) > 0) {
        return true;
    }

    struct addrinfo hints{}, *result = nullptr;
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    if (getaddrinfo(address.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return false;
    }

    out.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

ByteWriter BeginPacket(uint64_t protocolId, PacketType type) {
    ByteWriter writer(16);
    writer.WriteU64(protocolId);
    writer.WriteU8(static_cast<uint8_t>(type));
    return writer;
}

std::vector<ReliabilityMode> ServerChannelModes() {
    std::vector<ReliabilityMode> modes;
    for (ServerChannel channel : ALL_SERVER_CHANNELS) {
        modes.push_back(GetReliability(channel));
    }
    return modes;
}

std::vector<ReliabilityMode> ClientChannelModes() {
    std::vector<ReliabilityMode> modes;
    for (ClientChannel channel : ALL_CLIENT_CHANNELS) {
        modes.push_back(GetReliability(channel));
    }
    return modes;
}

uint64_t SecondsToMs(float seconds) {
    return static_cast<uint64_t>(seconds * 1000.0f);
}

} // anonymous namespace

// ============================================================================
// ChannelReliability
// ============================================================================

ChannelReliability::ChannelReliability(std::vector<ReliabilityMode> outgoing,
                                       std::vector<ReliabilityMode> incoming) {
    m_outgoing.resize(outgoing.size());
    for (size_t i = 0; i < outgoing.size(); ++i) {
        m_outgoing[i].mode = outgoing[i];
    }
    m_incoming.resize(incoming.size());
    for (size_t i = 0; i < incoming.size(); ++i) {
        m_incoming[i].mode = incoming[i];
    }
}

uint32_t ChannelReliability::PrepareSend(uint8_t channel, const std::vector<uint8_t>& body, uint64_t nowMs) {
    Outgoing& out = m_outgoing[channel];
    uint32_t sequence = out.nextSequence++;
    if (out.mode == ReliabilityMode::ReliableOrdered) {
        out.unacked[sequence] = PendingPacket{body, nowMs};
    }
    return sequence;
}

bool ChannelReliability::OnPayload(uint8_t channel, uint32_t sequence, std::vector<uint8_t> body) {
    Incoming& in = m_incoming[channel];

    if (in.mode == ReliabilityMode::Unreliable) {
        if (in.hasNewest && sequence <= in.newestSequence) {
            return false;
        }
        in.hasNewest = true;
        in.newestSequence = sequence;
        in.ready.push_back(std::move(body));
        return false;
    }

    if (sequence >= in.expectedSequence + MAX_REORDER_WINDOW) {
        // Outside the window: no ack, the sender will resend
        return false;
    }

    if (sequence >= in.expectedSequence) {
        in.outOfOrder.emplace(sequence, std::move(body));
        for (auto it = in.outOfOrder.find(in.expectedSequence);
             it != in.outOfOrder.end();
             it = in.outOfOrder.find(in.expectedSequence)) {
            in.ready.push_back(std::move(it->second));
            in.outOfOrder.erase(it);
            ++in.expectedSequence;
        }
    }

    // Duplicates are acked again since the previous ack may have been lost
    return true;
}

void ChannelReliability::OnAck(uint8_t channel, uint32_t sequence) {
    if (channel < m_outgoing.size()) {
        m_outgoing[channel].unacked.erase(sequence);
    }
}

void ChannelReliability::CollectResends(
    uint64_t nowMs, uint64_t intervalMs,
    const std::function<void(uint8_t, uint32_t, const std::vector<uint8_t>&)>& resend) {
    for (size_t channel = 0; channel < m_outgoing.size(); ++channel) {
        for (auto& [sequence, packet] : m_outgoing[channel].unacked) {
            if (nowMs - packet.lastSendMs >= intervalMs) {
                packet.lastSendMs = nowMs;
                resend(static_cast<uint8_t>(channel), sequence, packet.body);
            }
        }
    }
}

std::optional<std::vector<uint8_t>> ChannelReliability::Pop(uint8_t channel) {
    Incoming& in = m_incoming[channel];
    if (in.ready.empty()) {
        return std::nullopt;
    }
    std::vector<uint8_t> body = std::move(in.ready.front());
    in.ready.pop_front();
    return body;
}

size_t ChannelReliability::GetUnackedCount() const {
    size_t count = 0;
    for (const Outgoing& out : m_outgoing) {
        count += out.unacked.size();
    }
    return count;
}

// ============================================================================
// UdpServerTransport
// ============================================================================

struct UdpServerTransport::Impl {
    struct Peer {
        ClientId id = 0;
        sockaddr_in address{};
        uint64_t lastReceiveMs = 0;
        uint64_t lastSendMs = 0;
        ChannelReliability channels{ServerChannelModes(), ClientChannelModes()};
    };

    UdpServerSettings settings;
    SocketType sock = INVALID_SOCK;
    uint16_t boundPort = 0;
    bool shutdown = false;

    std::map<ClientId, Peer> peers;
    std::queue<TransportEvent> events;
    ClientId nextClientId = 1;

    ~Impl() {
        Close();
    }

    void Close() {
        if (sock != INVALID_SOCK) {
            CLOSE_SOCKET(sock);
            sock = INVALID_SOCK;
        }
    }

    void SendRaw(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
        int sent = sendto(sock, reinterpret_cast<const char*>(data.data()),
            static_cast<int>(data.size()), 0,
            reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
        if (sent != static_cast<int>(data.size())) {
            LATTICE_LOG_DEBUG("UDP server: sendto {} failed (error {})", AddressToString(addr), SOCKET_ERROR_CODE);
        }
    }

    void SendControl(PacketType type, const sockaddr_in& addr) {
        SendRaw(BeginPacket(settings.protocolId, type).Data(), addr);
    }

    void SendDenied(const sockaddr_in& addr, DisconnectReason reason) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::ConnectDenied);
        writer.WriteU8(static_cast<uint8_t>(reason));
        SendRaw(writer.Data(), addr);
    }

    void SendDisconnect(const sockaddr_in& addr, DisconnectReason reason) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::Disconnect);
        writer.WriteU8(static_cast<uint8_t>(reason));
        SendRaw(writer.Data(), addr);
    }

    void SendAccepted(Peer& peer, uint64_t now) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::ConnectAccepted);
        writer.WriteU64(peer.id);
        SendRaw(writer.Data(), peer.address);
        peer.lastSendMs = now;
    }

    void SendPayload(Peer& peer, uint8_t channel, uint32_t sequence, const std::vector<uint8_t>& body, uint64_t now) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::Payload);
        writer.WriteU8(channel);
        writer.WriteU32(sequence);
        writer.WriteBytes(body);
        SendRaw(writer.Data(), peer.address);
        peer.lastSendMs = now;
    }

    void SendAck(const Peer& peer, uint8_t channel, uint32_t sequence) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::Ack);
        writer.WriteU8(channel);
        writer.WriteU32(sequence);
        SendRaw(writer.Data(), peer.address);
    }

    Peer* FindPeer(const sockaddr_in& addr) {
        for (auto& [id, peer] : peers) {
            if (SameAddress(peer.address, addr)) {
                return &peer;
            }
        }
        return nullptr;
    }

    void RemovePeer(ClientId id, DisconnectReason reason) {
        if (peers.erase(id) > 0) {
            events.push(TransportEvent{TransportEvent::Type::Disconnected, id, reason});
            LATTICE_LOG_INFO("UDP server: client {} disconnected ({})", id, DisconnectReasonToString(reason));
        }
    }

    void HandleDatagram(std::span<const uint8_t> data, const sockaddr_in& from, uint64_t now) {
        ByteReader reader(data);
        uint64_t protocolId = 0;
        uint8_t rawType = 0;
        if (!reader.ReadU64(protocolId) || !reader.ReadU8(rawType)) {
            return;
        }

        PacketType type = static_cast<PacketType>(rawType);
        if (protocolId != settings.protocolId) {
            if (type == PacketType::ConnectRequest) {
                LATTICE_LOG_WARN("UDP server: refused {} (protocol id {:#x})", AddressToString(from), protocolId);
                SendDenied(from, DisconnectReason::ProtocolMismatch);
            }
            return;
        }

        Peer* peer = FindPeer(from);
        if (peer) {
            peer->lastReceiveMs = now;
        }

        switch (type) {
            case PacketType::ConnectRequest: {
                if (peer) {
                    // Our accept was lost
                    SendAccepted(*peer, now);
                    return;
                }
                if (shutdown) {
                    return;
                }
                if (peers.size() >= settings.maxClients) {
                    LATTICE_LOG_WARN("UDP server: refused {} (server full)", AddressToString(from));
                    SendDenied(from, DisconnectReason::ServerFull);
                    return;
                }
                ClientId id = nextClientId++;
                Peer& added = peers[id];
                added.id = id;
                added.address = from;
                added.lastReceiveMs = now;
                SendAccepted(added, now);
                events.push(TransportEvent{TransportEvent::Type::Connected, id, DisconnectReason::ClientLeft});
                LATTICE_LOG_INFO("UDP server: client {} connected from {}", id, AddressToString(from));
                return;
            }
            case PacketType::Payload: {
                uint8_t channel = 0;
                uint32_t sequence = 0;
                if (!peer || !reader.ReadU8(channel) || !reader.ReadU32(sequence) ||
                    !peer->channels.IsValidIncoming(channel)) {
                    return;
                }
                auto body = reader.ReadRest();
                if (peer->channels.OnPayload(channel, sequence, std::vector<uint8_t>(body.begin(), body.end()))) {
                    SendAck(*peer, channel, sequence);
                }
                return;
            }
            case PacketType::Ack: {
                uint8_t channel = 0;
                uint32_t sequence = 0;
                if (peer && reader.ReadU8(channel) && reader.ReadU32(sequence)) {
                    peer->channels.OnAck(channel, sequence);
                }
                return;
            }
            case PacketType::Disconnect:
                if (peer) {
                    RemovePeer(peer->id, DisconnectReason::ClientLeft);
                }
                return;
            default:
                return;
        }
    }
};

std::expected<std::unique_ptr<UdpServerTransport>, TransportError>
UdpServerTransport::Create(const UdpServerSettings& settings) {
    if (!InitializeSockets()) {
        return std::unexpected(TransportError::SocketCreateFailed);
    }

    auto impl = std::make_unique<Impl>();
    impl->settings = settings;

    sockaddr_in addr{};
    if (!ResolveAddress(settings.bindAddress, settings.port, addr)) {
        LATTICE_LOG_ERROR("UDP server: cannot resolve bind address '{}'", settings.bindAddress);
        return std::unexpected(TransportError::ResolveFailed);
    }

    impl->sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (impl->sock == INVALID_SOCK) {
        LATTICE_LOG_ERROR("UDP server: failed to create socket (error {})", SOCKET_ERROR_CODE);
        return std::unexpected(TransportError::SocketCreateFailed);
    }

    SetNonBlocking(impl->sock);

    if (bind(impl->sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        LATTICE_LOG_ERROR("UDP server: failed to bind {} (error {})", AddressToString(addr), SOCKET_ERROR_CODE);
        return std::unexpected(TransportError::BindFailed);
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(impl->sock, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0) {
        impl->boundPort = ntohs(bound.sin_port);
    } else {
        impl->boundPort = settings.port;
    }

    LATTICE_LOG_INFO("UDP server: listening on {}:{}", settings.bindAddress, impl->boundPort);
    return std::unique_ptr<UdpServerTransport>(new UdpServerTransport(std::move(impl)));
}

UdpServerTransport::UdpServerTransport(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {
}

UdpServerTransport::~UdpServerTransport() {
    Shutdown();
}

uint16_t UdpServerTransport::GetBoundPort() const {
    return m_impl->boundPort;
}

void UdpServerTransport::Update(float /*deltaTime*/) {
    Impl& impl = *m_impl;
    if (impl.sock == INVALID_SOCK) {
        return;
    }

    uint64_t now = GetCurrentTimeMs();

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    while (true) {
        sockaddr_in from{};
        socklen_t addrLen = sizeof(from);
        int bytesRead = recvfrom(impl.sock, reinterpret_cast<char*>(buffer.data()),
            static_cast<int>(buffer.size()), 0,
            reinterpret_cast<sockaddr*>(&from), &addrLen);

        if (bytesRead < 0) break;

        impl.HandleDatagram(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(bytesRead)), from, now);
    }

    const uint64_t timeoutMs = SecondsToMs(impl.settings.timeoutSeconds);
    const uint64_t keepAliveMs = SecondsToMs(impl.settings.keepAliveSeconds);

    std::vector<ClientId> timedOut;
    for (auto& [id, peer] : impl.peers) {
        if (now - peer.lastReceiveMs > timeoutMs) {
            timedOut.push_back(id);
            continue;
        }

        peer.channels.CollectResends(now, impl.settings.resendIntervalMs,
            [&impl, &peer, now](uint8_t channel, uint32_t sequence, const std::vector<uint8_t>& body) {
                impl.SendPayload(peer, channel, sequence, body, now);
            });

        if (now - peer.lastSendMs >= keepAliveMs) {
            impl.SendControl(PacketType::KeepAlive, peer.address);
            peer.lastSendMs = now;
        }
    }

    for (ClientId id : timedOut) {
        impl.RemovePeer(id, DisconnectReason::TimedOut);
    }
}

std::optional<TransportEvent> UdpServerTransport::PollEvent() {
    if (m_impl->events.empty()) {
        return std::nullopt;
    }
    TransportEvent event = m_impl->events.front();
    m_impl->events.pop();
    return event;
}

std::optional<std::vector<uint8_t>> UdpServerTransport::Receive(ClientId client, ClientChannel channel) {
    auto it = m_impl->peers.find(client);
    if (it == m_impl->peers.end()) {
        return std::nullopt;
    }
    return it->second.channels.Pop(static_cast<uint8_t>(channel));
}

void UdpServerTransport::Send(ClientId client, ServerChannel channel, const std::vector<uint8_t>& payload) {
    auto it = m_impl->peers.find(client);
    if (it == m_impl->peers.end()) {
        return;
    }
    uint64_t now = GetCurrentTimeMs();
    auto rawChannel = static_cast<uint8_t>(channel);
    uint32_t sequence = it->second.channels.PrepareSend(rawChannel, payload, now);
    m_impl->SendPayload(it->second, rawChannel, sequence, payload, now);
}

std::vector<ClientId> UdpServerTransport::GetClientIds() const {
    std::vector<ClientId> ids;
    ids.reserve(m_impl->peers.size());
    for (const auto& [id, peer] : m_impl->peers) {
        ids.push_back(id);
    }
    return ids;
}

bool UdpServerTransport::IsClientConnected(ClientId client) const {
    return m_impl->peers.contains(client);
}

void UdpServerTransport::Disconnect(ClientId client) {
    auto it = m_impl->peers.find(client);
    if (it == m_impl->peers.end()) {
        return;
    }
    m_impl->SendDisconnect(it->second.address, DisconnectReason::Kicked);
    m_impl->RemovePeer(client, DisconnectReason::Kicked);
}

void UdpServerTransport::Shutdown() {
    if (m_impl->shutdown) {
        return;
    }
    m_impl->shutdown = true;
    while (!m_impl->peers.empty()) {
        auto it = m_impl->peers.begin();
        m_impl->SendDisconnect(it->second.address, DisconnectReason::ServerShutdown);
        m_impl->RemovePeer(it->first, DisconnectReason::ServerShutdown);
    }
    m_impl->Close();
}

// ============================================================================
// UdpClientTransport
// ============================================================================

struct UdpClientTransport::Impl {
    UdpClientSettings settings;
    SocketType sock = INVALID_SOCK;

    ClientConnectionState state = ClientConnectionState::Connecting;
    std::optional<DisconnectReason> reason;
    ClientId clientId = 0;

    uint64_t connectStartMs = 0;
    uint64_t lastRequestMs = 0;
    uint64_t lastReceiveMs = 0;
    uint64_t lastSendMs = 0;

    ChannelReliability channels{ClientChannelModes(), ServerChannelModes()};

    ~Impl() {
        if (sock != INVALID_SOCK) {
            CLOSE_SOCKET(sock);
            sock = INVALID_SOCK;
        }
    }

    void SendRaw(const std::vector<uint8_t>& data, uint64_t now) {
        int sent = send(sock, reinterpret_cast<const char*>(data.data()),
            static_cast<int>(data.size()), 0);
        if (sent != static_cast<int>(data.size())) {
            LATTICE_LOG_DEBUG("UDP client: send failed (error {})", SOCKET_ERROR_CODE);
        }
        lastSendMs = now;
    }

    void SendControl(PacketType type, uint64_t now) {
        SendRaw(BeginPacket(settings.protocolId, type).Data(), now);
    }

    void SendPayload(uint8_t channel, uint32_t sequence, const std::vector<uint8_t>& body, uint64_t now) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::Payload);
        writer.WriteU8(channel);
        writer.WriteU32(sequence);
        writer.WriteBytes(body);
        SendRaw(writer.Data(), now);
    }

    void SendAck(uint8_t channel, uint32_t sequence, uint64_t now) {
        ByteWriter writer = BeginPacket(settings.protocolId, PacketType::Ack);
        writer.WriteU8(channel);
        writer.WriteU32(sequence);
        SendRaw(writer.Data(), now);
    }

    void Close(ClientConnectionState newState, DisconnectReason why) {
        state = newState;
        reason = why;
    }

    void HandleDatagram(std::span<const uint8_t> data, uint64_t now) {
        ByteReader reader(data);
        uint64_t protocolId = 0;
        uint8_t rawType = 0;
        if (!reader.ReadU64(protocolId) || !reader.ReadU8(rawType)) {
            return;
        }

        PacketType type = static_cast<PacketType>(rawType);

        // A denial carries the server's protocol id, which may differ from ours
        if (type == PacketType::ConnectDenied) {
            if (state != ClientConnectionState::Connecting) {
                return;
            }
            uint8_t rawReason = 0;
            DisconnectReason denied = DisconnectReason::ServerFull;
            if (reader.ReadU8(rawReason) && rawReason <= static_cast<uint8_t>(DisconnectReason::ProtocolMismatch)) {
                denied = static_cast<DisconnectReason>(rawReason);
            }
            LATTICE_LOG_WARN("UDP client: connection denied ({})", DisconnectReasonToString(denied));
            Close(ClientConnectionState::Denied, denied);
            return;
        }

        if (protocolId != settings.protocolId) {
            return;
        }

        lastReceiveMs = now;

        switch (type) {
            case PacketType::ConnectAccepted: {
                uint64_t assigned = 0;
                if (state == ClientConnectionState::Connecting && reader.ReadU64(assigned)) {
                    clientId = assigned;
                    state = ClientConnectionState::Connected;
                    LATTICE_LOG_INFO("UDP client: connected as client {}", clientId);
                }
                return;
            }
            case PacketType::Payload: {
                uint8_t channel = 0;
                uint32_t sequence = 0;
                if (state != ClientConnectionState::Connected || !reader.ReadU8(channel) ||
                    !reader.ReadU32(sequence) || !channels.IsValidIncoming(channel)) {
                    return;
                }
                auto body = reader.ReadRest();
                if (channels.OnPayload(channel, sequence, std::vector<uint8_t>(body.begin(), body.end()))) {
                    SendAck(channel, sequence, now);
                }
                return;
            }
            case PacketType::Ack: {
                uint8_t channel = 0;
                uint32_t sequence = 0;
                if (reader.ReadU8(channel) && reader.ReadU32(sequence)) {
                    channels.OnAck(channel, sequence);
                }
                return;
            }
            case PacketType::Disconnect: {
                if (state != ClientConnectionState::Connected) {
                    return;
                }
                uint8_t rawReason = 0;
                DisconnectReason closed = DisconnectReason::ServerShutdown;
                if (reader.ReadU8(rawReason) && rawReason <= static_cast<uint8_t>(DisconnectReason::ProtocolMismatch)) {
                    closed = static_cast<DisconnectReason>(rawReason);
                }
                LATTICE_LOG_INFO("UDP client: server closed the connection ({})", DisconnectReasonToString(closed));
                Close(ClientConnectionState::Disconnected, closed);
                return;
            }
            default:
                return;
        }
    }
};

std::expected<std::unique_ptr<UdpClientTransport>, TransportError>
UdpClientTransport::Connect(const UdpClientSettings& settings) {
    if (!InitializeSockets()) {
        return std::unexpected(TransportError::SocketCreateFailed);
    }

    sockaddr_in serverAddr{};
    if (!ResolveAddress(settings.serverAddress, settings.serverPort, serverAddr)) {
        LATTICE_LOG_ERROR("UDP client: cannot resolve '{}'", settings.serverAddress);
        return std::unexpected(TransportError::ResolveFailed);
    }

    auto impl = std::make_unique<Impl>();
    impl->settings = settings;

    impl->sock = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (impl->sock == INVALID_SOCK) {
        LATTICE_LOG_ERROR("UDP client: failed to create socket (error {})", SOCKET_ERROR_CODE);
        return std::unexpected(TransportError::SocketCreateFailed);
    }

    SetNonBlocking(impl->sock);

    // Fixes the peer address so only the server's datagrams are received
    if (connect(impl->sock, reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr)) < 0) {
        LATTICE_LOG_ERROR("UDP client: failed to connect to {} (error {})",
                          AddressToString(serverAddr), SOCKET_ERROR_CODE);
        return std::unexpected(TransportError::ConnectFailed);
    }

    uint64_t now = GetCurrentTimeMs();
    impl->connectStartMs = now;
    impl->lastRequestMs = now;
    impl->lastReceiveMs = now;
    impl->SendControl(PacketType::ConnectRequest, now);

    LATTICE_LOG_INFO("UDP client: connecting to {}", AddressToString(serverAddr));
    return std::unique_ptr<UdpClientTransport>(new UdpClientTransport(std::move(impl)));
}

UdpClientTransport::UdpClientTransport(std::unique_ptr<Impl> impl)
    : m_impl(std::move(impl)) {
}

UdpClientTransport::~UdpClientTransport() {
    Disconnect();
}

void UdpClientTransport::Update(float /*deltaTime*/) {
    Impl& impl = *m_impl;
    if (impl.state == ClientConnectionState::Denied || impl.state == ClientConnectionState::Disconnected) {
        return;
    }

    uint64_t now = GetCurrentTimeMs();

    std::vector<uint8_t> buffer(MAX_DATAGRAM_SIZE);
    while (true) {
        int bytesRead = recv(impl.sock, reinterpret_cast<char*>(buffer.data()),
            static_cast<int>(buffer.size()), 0);

        if (bytesRead < 0) break;

        impl.HandleDatagram(std::span<const uint8_t>(buffer.data(), static_cast<size_t>(bytesRead)), now);
    }

    if (impl.state == ClientConnectionState::Connecting) {
        if (now - impl.connectStartMs > SecondsToMs(impl.settings.connectTimeoutSeconds)) {
            LATTICE_LOG_WARN("UDP client: connect timed out");
            impl.Close(ClientConnectionState::Disconnected, DisconnectReason::TimedOut);
            return;
        }
        if (now - impl.lastRequestMs >= CONNECT_RETRY_MS) {
            impl.SendControl(PacketType::ConnectRequest, now);
            impl.lastRequestMs = now;
        }
        return;
    }

    if (impl.state != ClientConnectionState::Connected) {
        return;
    }

    if (now - impl.lastReceiveMs > SecondsToMs(impl.settings.timeoutSeconds)) {
        LATTICE_LOG_WARN("UDP client: server timed out");
        impl.Close(ClientConnectionState::Disconnected, DisconnectReason::TimedOut);
        return;
    }

    impl.channels.CollectResends(now, impl.settings.resendIntervalMs,
        [&impl, now](uint8_t channel, uint32_t sequence, const std::vector<uint8_t>& body) {
            impl.SendPayload(channel, sequence, body, now);
        });

    if (now - impl.lastSendMs >= SecondsToMs(impl.settings.keepAliveSeconds)) {
        impl.SendControl(PacketType::KeepAlive, now);
    }
}

std::optional<std::vector<uint8_t>> UdpClientTransport::Receive(ServerChannel channel) {
    return m_impl->channels.Pop(static_cast<uint8_t>(channel));
}

void UdpClientTransport::Send(ClientChannel channel, const std::vector<uint8_t>& payload) {
    if (m_impl->state != ClientConnectionState::Connected) {
        return;
    }
    uint64_t now = GetCurrentTimeMs();
    auto rawChannel = static_cast<uint8_t>(channel);
    uint32_t sequence = m_impl->channels.PrepareSend(rawChannel, payload, now);
    m_impl->SendPayload(rawChannel, sequence, payload, now);
}

ClientConnectionState UdpClientTransport::GetState() const {
    return m_impl->state;
}

ClientId UdpClientTransport::GetClientId() const {
    return m_impl->clientId;
}

std::optional<DisconnectReason> UdpClientTransport::GetDisconnectReason() const {
    return m_impl->reason;
}

void UdpClientTransport::Disconnect() {
    if (m_impl->state != ClientConnectionState::Connected &&
        m_impl->state != ClientConnectionState::Connecting) {
        return;
    }
    m_impl->SendControl(PacketType::Disconnect, GetCurrentTimeMs());
    m_impl->Close(ClientConnectionState::Disconnected, DisconnectReason::ClientLeft);
}

} // namespace Lattice
