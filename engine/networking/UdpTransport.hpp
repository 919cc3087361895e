#pragma once

#include "networking/Transport.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <deque>
#include <string>
#include <vector>

namespace Lattice {

// ============================================================================
// Datagram framing
// ============================================================================

/**
 * @brief Datagram type following the PROTOCOL_ID header
 */
enum class PacketType : uint8_t {
    ConnectRequest = 1,
    ConnectAccepted,    // u64 clientId
    ConnectDenied,      // u8 DisconnectReason
    Payload,            // u8 channel, u32 sequence, body
    Ack,                // u8 channel, u32 sequence
    KeepAlive,
    Disconnect
};

/**
 * @brief Per-peer channel sequencing, acknowledgement and resend state
 *
 * Reliable channels keep every sent payload until acked and deliver
 * received payloads strictly in sequence order. Unreliable channels
 * deliver a payload only if it is newer than the newest already delivered.
 */
class ChannelReliability {
public:
    ChannelReliability(std::vector<ReliabilityMode> outgoing, std::vector<ReliabilityMode> incoming);

    /**
     * @brief Assign the next sequence number on an outgoing channel
     *
     * Reliable payloads are retained for resend until OnAck.
     */
    uint32_t PrepareSend(uint8_t channel, const std::vector<uint8_t>& body, uint64_t nowMs);

    /**
     * @brief Accept an incoming payload
     * @return true if the sender expects an Ack (reliable channel)
     */
    bool OnPayload(uint8_t channel, uint32_t sequence, std::vector<uint8_t> body);

    void OnAck(uint8_t channel, uint32_t sequence);

    /**
     * @brief Visit reliable payloads unacknowledged for at least intervalMs
     */
    void CollectResends(uint64_t nowMs, uint64_t intervalMs,
                        const std::function<void(uint8_t, uint32_t, const std::vector<uint8_t>&)>& resend);

    /**
     * @brief Next deliverable payload on an incoming channel
     */
    std::optional<std::vector<uint8_t>> Pop(uint8_t channel);

    [[nodiscard]] size_t GetUnackedCount() const;

    [[nodiscard]] bool IsValidIncoming(uint8_t channel) const { return channel < m_incoming.size(); }
    [[nodiscard]] bool IsValidOutgoing(uint8_t channel) const { return channel < m_outgoing.size(); }

private:
    struct PendingPacket {
        std::vector<uint8_t> body;
        uint64_t lastSendMs = 0;
    };

    struct Outgoing {
        ReliabilityMode mode = ReliabilityMode::Unreliable;
        uint32_t nextSequence = 0;
        std::map<uint32_t, PendingPacket> unacked;
    };

    struct Incoming {
        ReliabilityMode mode = ReliabilityMode::Unreliable;
        uint32_t expectedSequence = 0;              // Reliable: next in-order sequence
        bool hasNewest = false;                     // Unreliable: any delivered yet
        uint32_t newestSequence = 0;                // Unreliable: newest delivered
        std::map<uint32_t, std::vector<uint8_t>> outOfOrder;
        std::deque<std::vector<uint8_t>> ready;
    };

    std::vector<Outgoing> m_outgoing;
    std::vector<Incoming> m_incoming;
};

// ============================================================================
// UDP server
// ============================================================================

struct UdpServerSettings {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 5000;           // 0 picks an ephemeral port
    size_t maxClients = 64;
    uint64_t protocolId = PROTOCOL_ID;
    float timeoutSeconds = 10.0f;
    float keepAliveSeconds = 1.0f;
    uint32_t resendIntervalMs = 100;
};

/**
 * @brief Non-blocking UDP server transport
 */
class UdpServerTransport : public IServerTransport {
public:
    /**
     * @brief Create the socket and bind it
     */
    static std::expected<std::unique_ptr<UdpServerTransport>, TransportError> Create(const UdpServerSettings& settings);

    ~UdpServerTransport() override;

    UdpServerTransport(const UdpServerTransport&) = delete;
    UdpServerTransport& operator=(const UdpServerTransport&) = delete;

    /**
     * @brief Port the socket is actually bound to
     */
    [[nodiscard]] uint16_t GetBoundPort() const;

    void Update(float deltaTime) override;
    std::optional<TransportEvent> PollEvent() override;
    std::optional<std::vector<uint8_t>> Receive(ClientId client, ClientChannel channel) override;
    void Send(ClientId client, ServerChannel channel, const std::vector<uint8_t>& payload) override;
    [[nodiscard]] std::vector<ClientId> GetClientIds() const override;
    [[nodiscard]] bool IsClientConnected(ClientId client) const override;
    void Disconnect(ClientId client) override;
    void Shutdown() override;

private:
    struct Impl;
    explicit UdpServerTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// UDP client
// ============================================================================

struct UdpClientSettings {
    std::string serverAddress = "127.0.0.1";
    uint16_t serverPort = 5000;
    uint64_t protocolId = PROTOCOL_ID;
    float connectTimeoutSeconds = 5.0f;
    float timeoutSeconds = 10.0f;
    float keepAliveSeconds = 1.0f;
    uint32_t resendIntervalMs = 100;
};

/**
 * @brief Non-blocking UDP client transport
 *
 * Starts in Connecting and repeats its ConnectRequest until accepted,
 * denied, or connectTimeoutSeconds elapse.
 */
class UdpClientTransport : public IClientTransport {
public:
    static std::expected<std::unique_ptr<UdpClientTransport>, TransportError> Connect(const UdpClientSettings& settings);

    ~UdpClientTransport() override;

    UdpClientTransport(const UdpClientTransport&) = delete;
    UdpClientTransport& operator=(const UdpClientTransport&) = delete;

    void Update(float deltaTime) override;
    std::optional<std::vector<uint8_t>> Receive(ServerChannel channel) override;
    void Send(ClientChannel channel, const std::vector<uint8_t>& payload) override;
    [[nodiscard]] ClientConnectionState GetState() const override;
    [[nodiscard]] ClientId GetClientId() const override;
    [[nodiscard]] std::optional<DisconnectReason> GetDisconnectReason() const override;
    void Disconnect() override;

private:
    struct Impl;
    explicit UdpClientTransport(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> m_impl;
};

} // namespace Lattice
