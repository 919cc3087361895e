#pragma once

#include "networking/Channels.hpp"
#include "scene/Entity.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace Lattice {

/**
 * @brief Transport start-up failures
 */
enum class TransportError : uint8_t {
    SocketCreateFailed,
    BindFailed,
    ResolveFailed,
    ConnectFailed
};

inline const char* TransportErrorToString(TransportError error) {
    switch (error) {
        case TransportError::SocketCreateFailed: return "failed to create socket";
        case TransportError::BindFailed:         return "failed to bind socket";
        case TransportError::ResolveFailed:      return "failed to resolve address";
        case TransportError::ConnectFailed:      return "failed to connect";
        default:                                 return "unknown transport error";
    }
}

/**
 * @brief Why a connection ended or was refused
 */
enum class DisconnectReason : uint8_t {
    ClientLeft = 0,
    TimedOut,
    Kicked,
    ServerShutdown,
    ServerFull,
    ProtocolMismatch
};

inline const char* DisconnectReasonToString(DisconnectReason reason) {
    switch (reason) {
        case DisconnectReason::ClientLeft:       return "client left";
        case DisconnectReason::TimedOut:         return "timed out";
        case DisconnectReason::Kicked:           return "kicked";
        case DisconnectReason::ServerShutdown:   return "server shutdown";
        case DisconnectReason::ServerFull:       return "server full";
        case DisconnectReason::ProtocolMismatch: return "protocol mismatch";
        default:                                 return "unknown";
    }
}

/**
 * @brief Connection lifecycle notification raised by a server transport
 */
struct TransportEvent {
    enum class Type : uint8_t {
        Connected,
        Disconnected
    };

    Type type = Type::Connected;
    ClientId clientId = 0;
    DisconnectReason reason = DisconnectReason::ClientLeft;
};

/**
 * @brief Server side of a channelled message transport
 *
 * All calls are non-blocking. Per-channel FIFO order is preserved; there is
 * no ordering across channels.
 */
class IServerTransport {
public:
    virtual ~IServerTransport() = default;

    /**
     * @brief Pump the network: receive, resend, time out peers
     */
    virtual void Update(float deltaTime) = 0;

    /**
     * @brief Next pending connect/disconnect event, if any
     */
    virtual std::optional<TransportEvent> PollEvent() = 0;

    /**
     * @brief Next message from a client on a channel, if any
     */
    virtual std::optional<std::vector<uint8_t>> Receive(ClientId client, ClientChannel channel) = 0;

    virtual void Send(ClientId client, ServerChannel channel, const std::vector<uint8_t>& payload) = 0;

    [[nodiscard]] virtual std::vector<ClientId> GetClientIds() const = 0;
    [[nodiscard]] virtual bool IsClientConnected(ClientId client) const = 0;

    virtual void Disconnect(ClientId client) = 0;

    /**
     * @brief Disconnect every client and stop accepting new ones
     */
    virtual void Shutdown() = 0;
};

/**
 * @brief Connection state of a client transport
 */
enum class ClientConnectionState : uint8_t {
    Connecting,
    Connected,
    Denied,
    Disconnected
};

/**
 * @brief Client side of a channelled message transport
 */
class IClientTransport {
public:
    virtual ~IClientTransport() = default;

    virtual void Update(float deltaTime) = 0;

    virtual std::optional<std::vector<uint8_t>> Receive(ServerChannel channel) = 0;
    virtual void Send(ClientChannel channel, const std::vector<uint8_t>& payload) = 0;

    [[nodiscard]] virtual ClientConnectionState GetState() const = 0;
    [[nodiscard]] bool IsConnected() const { return GetState() == ClientConnectionState::Connected; }

    /**
     * @brief Id assigned by the server (valid once connected)
     */
    [[nodiscard]] virtual ClientId GetClientId() const = 0;

    /**
     * @brief Reason the connection was refused or ended, if it has
     */
    [[nodiscard]] virtual std::optional<DisconnectReason> GetDisconnectReason() const = 0;

    virtual void Disconnect() = 0;
};

} // namespace Lattice
