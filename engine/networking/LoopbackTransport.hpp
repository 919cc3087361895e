#pragma once

#include "networking/Transport.hpp"

#include <array>
#include <deque>
#include <map>
#include <memory>
#include <queue>

namespace Lattice {

class LoopbackClientTransport;

/**
 * @brief In-process server transport
 *
 * Clients are created with Connect() and exchange messages through shared
 * queues; delivery is immediate and lossless. Used for listen servers and
 * tests.
 */
class LoopbackServerTransport : public IServerTransport {
public:
    struct Settings {
        uint64_t protocolId = PROTOCOL_ID;
        size_t maxClients = 64;
    };

    LoopbackServerTransport();
    explicit LoopbackServerTransport(Settings settings);
    ~LoopbackServerTransport() override;

    LoopbackServerTransport(const LoopbackServerTransport&) = delete;
    LoopbackServerTransport& operator=(const LoopbackServerTransport&) = delete;

    /**
     * @brief Open a client connection
     *
     * A mismatched protocol id or a full server yields a client in the
     * Denied state; the server keeps running.
     */
    std::unique_ptr<LoopbackClientTransport> Connect(uint64_t protocolId = PROTOCOL_ID);

    // IServerTransport
    void Update(float deltaTime) override;
    std::optional<TransportEvent> PollEvent() override;
    std::optional<std::vector<uint8_t>> Receive(ClientId client, ClientChannel channel) override;
    void Send(ClientId client, ServerChannel channel, const std::vector<uint8_t>& payload) override;
    [[nodiscard]] std::vector<ClientId> GetClientIds() const override;
    [[nodiscard]] bool IsClientConnected(ClientId client) const override;
    void Disconnect(ClientId client) override;
    void Shutdown() override;

    /**
     * @brief Shared state between one client and the server
     */
    struct Link {
        ClientId clientId = 0;
        bool open = true;
        DisconnectReason closeReason = DisconnectReason::ClientLeft;
        std::array<std::deque<std::vector<uint8_t>>, CLIENT_CHANNEL_COUNT> toServer;
        std::array<std::deque<std::vector<uint8_t>>, SERVER_CHANNEL_COUNT> toClient;
    };

private:
    void CloseLink(ClientId client, DisconnectReason reason);

    Settings m_settings;
    std::map<ClientId, std::shared_ptr<Link>> m_links;
    std::queue<TransportEvent> m_events;
    ClientId m_nextClientId = 1;
    bool m_shutdown = false;
};

/**
 * @brief Client end of a loopback connection
 */
class LoopbackClientTransport : public IClientTransport {
public:
    /** @brief Connected client bound to a link */
    explicit LoopbackClientTransport(std::shared_ptr<LoopbackServerTransport::Link> link);

    /** @brief Refused client */
    explicit LoopbackClientTransport(DisconnectReason deniedReason);

    ~LoopbackClientTransport() override;

    void Update(float deltaTime) override;
    std::optional<std::vector<uint8_t>> Receive(ServerChannel channel) override;
    void Send(ClientChannel channel, const std::vector<uint8_t>& payload) override;
    [[nodiscard]] ClientConnectionState GetState() const override;
    [[nodiscard]] ClientId GetClientId() const override;
    [[nodiscard]] std::optional<DisconnectReason> GetDisconnectReason() const override;
    void Disconnect() override;

private:
    std::shared_ptr<LoopbackServerTransport::Link> m_link;
    ClientConnectionState m_state = ClientConnectionState::Connected;
    std::optional<DisconnectReason> m_reason;
};

} // namespace Lattice
