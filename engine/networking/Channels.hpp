#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace Lattice {

/**
 * @brief Protocol identifier exchanged on connect; peers with a different
 *        value are refused.
 */
inline constexpr uint64_t PROTOCOL_ID = 0x4C41545449434531ull;

/**
 * @brief Delivery class of a channel
 */
enum class ReliabilityMode : uint8_t {
    Unreliable,         // May be lost; stale datagrams dropped (movement updates)
    ReliableOrdered     // Guaranteed + ordered (lifecycle, commands, chat)
};

// ============================================================================
// Server -> Client
// ============================================================================

enum class ServerChannel : uint8_t {
    ServerMessages = 0,     // PlayerCreate / PlayerRemove / EntityCreate / EntityRemove
    Host,                   // Host flag
    NetworkedEntities,      // Player snapshot
    NonNetworkedEntities,   // World entity snapshot
    ChatChannel,            // Relayed chat

    Count
};

// ============================================================================
// Client -> Server
// ============================================================================

enum class ClientChannel : uint8_t {
    Input = 0,      // PlayerInput
    Rots,           // RotationInput
    Command,        // PlayerCommand
    Chat,           // ChatMessage

    Count
};

inline constexpr std::size_t SERVER_CHANNEL_COUNT = static_cast<std::size_t>(ServerChannel::Count);
inline constexpr std::size_t CLIENT_CHANNEL_COUNT = static_cast<std::size_t>(ClientChannel::Count);

inline constexpr std::array<ServerChannel, SERVER_CHANNEL_COUNT> ALL_SERVER_CHANNELS = {
    ServerChannel::ServerMessages,
    ServerChannel::Host,
    ServerChannel::NetworkedEntities,
    ServerChannel::NonNetworkedEntities,
    ServerChannel::ChatChannel
};

inline constexpr std::array<ClientChannel, CLIENT_CHANNEL_COUNT> ALL_CLIENT_CHANNELS = {
    ClientChannel::Input,
    ClientChannel::Rots,
    ClientChannel::Command,
    ClientChannel::Chat
};

constexpr ReliabilityMode GetReliability(ServerChannel channel) {
    switch (channel) {
        case ServerChannel::NetworkedEntities:
        case ServerChannel::NonNetworkedEntities:
            return ReliabilityMode::Unreliable;
        default:
            return ReliabilityMode::ReliableOrdered;
    }
}

constexpr ReliabilityMode GetReliability(ClientChannel channel) {
    switch (channel) {
        case ClientChannel::Input:
        case ClientChannel::Rots:
            return ReliabilityMode::Unreliable;
        default:
            return ReliabilityMode::ReliableOrdered;
    }
}

inline const char* ChannelToString(ServerChannel channel) {
    switch (channel) {
        case ServerChannel::ServerMessages:       return "ServerMessages";
        case ServerChannel::Host:                 return "Host";
        case ServerChannel::NetworkedEntities:    return "NetworkedEntities";
        case ServerChannel::NonNetworkedEntities: return "NonNetworkedEntities";
        case ServerChannel::ChatChannel:          return "ChatChannel";
        default:                                  return "Unknown";
    }
}

inline const char* ChannelToString(ClientChannel channel) {
    switch (channel) {
        case ClientChannel::Input:   return "Input";
        case ClientChannel::Rots:    return "Rots";
        case ClientChannel::Command: return "Command";
        case ClientChannel::Chat:    return "Chat";
        default:                     return "Unknown";
    }
}

} // namespace Lattice
