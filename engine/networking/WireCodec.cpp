#include "networking/WireCodec.hpp"
#include "networking/ByteStream.hpp"

#include <type_traits>
#include <unordered_set>

namespace Lattice {

namespace {

void WriteSnapshot(ByteWriter& writer, const EntitySnapshot& snapshot) {
    writer.WriteU32(static_cast<uint32_t>(snapshot.entities.size()));
    for (const EntityId& id : snapshot.entities) {
        writer.WriteU64(id.ToBits());
    }
    writer.WriteU32(static_cast<uint32_t>(snapshot.translations.size()));
    for (const glm::vec3& t : snapshot.translations) {
        writer.WriteVec3(t);
    }
    writer.WriteU32(static_cast<uint32_t>(snapshot.rotations.size()));
    for (const glm::quat& r : snapshot.rotations) {
        writer.WriteQuat(r);
    }
}

/**
 * @brief Read an array count and check it against the bytes left
 */
std::expected<uint32_t, DecodeError> ReadCount(ByteReader& reader, size_t elementSize) {
    uint32_t count = 0;
    if (!reader.ReadU32(count)) {
        return std::unexpected(DecodeError::Truncated);
    }
    if (count > WireCodec::MAX_SNAPSHOT_ENTRIES) {
        return std::unexpected(DecodeError::Oversize);
    }
    if (static_cast<size_t>(count) * elementSize > reader.Remaining()) {
        return std::unexpected(DecodeError::Truncated);
    }
    return count;
}

std::expected<void, DecodeError> ReadSnapshot(ByteReader& reader, EntitySnapshot& snapshot) {
    auto entityCount = ReadCount(reader, 8);
    if (!entityCount) return std::unexpected(entityCount.error());

    snapshot.entities.reserve(*entityCount);
    for (uint32_t i = 0; i < *entityCount; ++i) {
        uint64_t bits = 0;
        if (!reader.ReadU64(bits)) {
            return std::unexpected(DecodeError::Truncated);
        }
        snapshot.entities.push_back(EntityId::FromBits(bits));
    }

    auto translationCount = ReadCount(reader, 12);
    if (!translationCount) return std::unexpected(translationCount.error());

    snapshot.translations.resize(*translationCount);
    for (auto& t : snapshot.translations) {
        if (!reader.ReadVec3(t)) {
            return std::unexpected(DecodeError::Truncated);
        }
    }

    auto rotationCount = ReadCount(reader, 16);
    if (!rotationCount) return std::unexpected(rotationCount.error());

    snapshot.rotations.resize(*rotationCount);
    for (auto& r : snapshot.rotations) {
        if (!reader.ReadQuat(r)) {
            return std::unexpected(DecodeError::Truncated);
        }
    }

    if (snapshot.entities.size() != snapshot.translations.size() ||
        snapshot.entities.size() != snapshot.rotations.size()) {
        return std::unexpected(DecodeError::LengthMismatch);
    }

    std::unordered_set<EntityId> seen;
    seen.reserve(snapshot.entities.size());
    for (const EntityId& id : snapshot.entities) {
        if (!seen.insert(id).second) {
            return std::unexpected(DecodeError::DuplicateEntity);
        }
    }

    return {};
}

std::expected<std::string, DecodeError> ReadText(ByteReader& reader) {
    uint32_t len = 0;
    if (!reader.ReadU32(len)) {
        return std::unexpected(DecodeError::Truncated);
    }
    if (len > WireCodec::MAX_STRING_LENGTH) {
        return std::unexpected(DecodeError::Oversize);
    }
    std::string text;
    if (!reader.ReadString(text, len)) {
        return std::unexpected(DecodeError::Truncated);
    }
    return text;
}

std::expected<Message, DecodeError> DecodeBody(MessageTag tag, ByteReader& reader) {
    switch (tag) {
        case MessageTag::PlayerCreate: {
            PlayerCreate msg;
            uint64_t bits = 0;
            if (!reader.ReadU64(msg.id) || !reader.ReadU64(bits) || !reader.ReadVec3(msg.translation)) {
                return std::unexpected(DecodeError::Truncated);
            }
            msg.entity = EntityId::FromBits(bits);
            return msg;
        }
        case MessageTag::PlayerRemove: {
            PlayerRemove msg;
            if (!reader.ReadU64(msg.id)) {
                return std::unexpected(DecodeError::Truncated);
            }
            return msg;
        }
        case MessageTag::NetworkedEntities: {
            NetworkedEntities msg;
            if (auto result = ReadSnapshot(reader, msg); !result) {
                return std::unexpected(result.error());
            }
            return msg;
        }
        case MessageTag::NonNetworkedEntities: {
            NonNetworkedEntities msg;
            if (auto result = ReadSnapshot(reader, msg); !result) {
                return std::unexpected(result.error());
            }
            return msg;
        }
        case MessageTag::ChatMessage: {
            ChatMessage msg;
            if (!reader.ReadU64(msg.clientId)) {
                return std::unexpected(DecodeError::Truncated);
            }
            auto text = ReadText(reader);
            if (!text) return std::unexpected(text.error());
            msg.text = std::move(*text);
            return msg;
        }
        case MessageTag::PlayerInput: {
            PlayerInput msg;
            if (!reader.ReadVec3(msg.translation)) {
                return std::unexpected(DecodeError::Truncated);
            }
            return msg;
        }
        case MessageTag::RotationInput: {
            RotationInput msg;
            if (!reader.ReadQuat(msg.rotation)) {
                return std::unexpected(DecodeError::Truncated);
            }
            return msg;
        }
        case MessageTag::PlayerCommand: {
            PlayerCommand msg;
            uint8_t action = 0;
            if (!reader.ReadU8(action) || !reader.ReadVec3(msg.target)) {
                return std::unexpected(DecodeError::Truncated);
            }
            if (action >= static_cast<uint8_t>(CommandAction::Count)) {
                return std::unexpected(DecodeError::InvalidValue);
            }
            msg.action = static_cast<CommandAction>(action);
            return msg;
        }
        case MessageTag::Host: {
            uint8_t flag = 0;
            if (!reader.ReadU8(flag)) {
                return std::unexpected(DecodeError::Truncated);
            }
            if (flag > 1) {
                return std::unexpected(DecodeError::InvalidValue);
            }
            return Host{flag == 1};
        }
        case MessageTag::EntityCreate: {
            EntityCreate msg;
            uint64_t bits = 0;
            if (!reader.ReadU64(bits) || !reader.ReadVec3(msg.translation) || !reader.ReadQuat(msg.rotation)) {
                return std::unexpected(DecodeError::Truncated);
            }
            msg.entity = EntityId::FromBits(bits);
            return msg;
        }
        case MessageTag::EntityRemove: {
            uint64_t bits = 0;
            if (!reader.ReadU64(bits)) {
                return std::unexpected(DecodeError::Truncated);
            }
            return EntityRemove{EntityId::FromBits(bits)};
        }
    }
    return std::unexpected(DecodeError::UnknownTag);
}

} // anonymous namespace

const char* DecodeErrorToString(DecodeError error) {
    switch (error) {
        case DecodeError::Truncated:         return "truncated buffer";
        case DecodeError::UnknownTag:        return "unknown message tag";
        case DecodeError::LengthMismatch:    return "snapshot array length mismatch";
        case DecodeError::DuplicateEntity:   return "duplicate entity in snapshot";
        case DecodeError::Oversize:          return "oversize string or array";
        case DecodeError::InvalidValue:      return "field value out of range";
        case DecodeError::TrailingBytes:     return "trailing bytes after message";
        case DecodeError::UnexpectedMessage: return "message not allowed on channel";
        default:                             return "unknown decode error";
    }
}

// ============================================================================
// Encode
// ============================================================================

std::vector<uint8_t> WireCodec::Encode(const Message& message) {
    ByteWriter writer(32);
    writer.WriteU8(static_cast<uint8_t>(GetTag(message)));

    std::visit([&writer](auto&& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, PlayerCreate>) {
            writer.WriteU64(msg.id);
            writer.WriteU64(msg.entity.ToBits());
            writer.WriteVec3(msg.translation);
        } else if constexpr (std::is_same_v<T, PlayerRemove>) {
            writer.WriteU64(msg.id);
        } else if constexpr (std::is_same_v<T, NetworkedEntities> ||
                             std::is_same_v<T, NonNetworkedEntities>) {
            WriteSnapshot(writer, msg);
        } else if constexpr (std::is_same_v<T, ChatMessage>) {
            writer.WriteU64(msg.clientId);
            writer.WriteString(msg.text);
        } else if constexpr (std::is_same_v<T, PlayerInput>) {
            writer.WriteVec3(msg.translation);
        } else if constexpr (std::is_same_v<T, RotationInput>) {
            writer.WriteQuat(msg.rotation);
        } else if constexpr (std::is_same_v<T, PlayerCommand>) {
            writer.WriteU8(static_cast<uint8_t>(msg.action));
            writer.WriteVec3(msg.target);
        } else if constexpr (std::is_same_v<T, Host>) {
            writer.WriteU8(msg.isHost ? 1 : 0);
        } else if constexpr (std::is_same_v<T, EntityCreate>) {
            writer.WriteU64(msg.entity.ToBits());
            writer.WriteVec3(msg.translation);
            writer.WriteQuat(msg.rotation);
        } else if constexpr (std::is_same_v<T, EntityRemove>) {
            writer.WriteU64(msg.entity.ToBits());
        }
    }, message);

    return writer.Release();
}

// ============================================================================
// Decode
// ============================================================================

std::expected<Message, DecodeError> WireCodec::Decode(std::span<const uint8_t> bytes) {
    ByteReader reader(bytes);

    uint8_t rawTag = 0;
    if (!reader.ReadU8(rawTag)) {
        return std::unexpected(DecodeError::Truncated);
    }
    if (rawTag < static_cast<uint8_t>(MessageTag::PlayerCreate) ||
        rawTag > static_cast<uint8_t>(MessageTag::EntityRemove)) {
        return std::unexpected(DecodeError::UnknownTag);
    }

    auto message = DecodeBody(static_cast<MessageTag>(rawTag), reader);
    if (!message) {
        return message;
    }
    if (!reader.AtEnd()) {
        return std::unexpected(DecodeError::TrailingBytes);
    }
    return message;
}

std::expected<Message, DecodeError> WireCodec::DecodeOn(ServerChannel channel,
                                                        std::span<const uint8_t> bytes) {
    auto message = Decode(bytes);
    if (message && !IsAllowedOn(channel, *message)) {
        return std::unexpected(DecodeError::UnexpectedMessage);
    }
    return message;
}

std::expected<Message, DecodeError> WireCodec::DecodeOn(ClientChannel channel,
                                                        std::span<const uint8_t> bytes) {
    auto message = Decode(bytes);
    if (message && !IsAllowedOn(channel, *message)) {
        return std::unexpected(DecodeError::UnexpectedMessage);
    }
    return message;
}

MessageTag WireCodec::GetTag(const Message& message) {
    return std::visit([](auto&& msg) -> MessageTag {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, PlayerCreate>) return MessageTag::PlayerCreate;
        else if constexpr (std::is_same_v<T, PlayerRemove>) return MessageTag::PlayerRemove;
        else if constexpr (std::is_same_v<T, NetworkedEntities>) return MessageTag::NetworkedEntities;
        else if constexpr (std::is_same_v<T, NonNetworkedEntities>) return MessageTag::NonNetworkedEntities;
        else if constexpr (std::is_same_v<T, ChatMessage>) return MessageTag::ChatMessage;
        else if constexpr (std::is_same_v<T, PlayerInput>) return MessageTag::PlayerInput;
        else if constexpr (std::is_same_v<T, RotationInput>) return MessageTag::RotationInput;
        else if constexpr (std::is_same_v<T, PlayerCommand>) return MessageTag::PlayerCommand;
        else if constexpr (std::is_same_v<T, Host>) return MessageTag::Host;
        else if constexpr (std::is_same_v<T, EntityCreate>) return MessageTag::EntityCreate;
        else return MessageTag::EntityRemove;
    }, message);
}

bool WireCodec::IsAllowedOn(ServerChannel channel, const Message& message) {
    switch (channel) {
        case ServerChannel::ServerMessages:
            return std::holds_alternative<PlayerCreate>(message) ||
                   std::holds_alternative<PlayerRemove>(message) ||
                   std::holds_alternative<EntityCreate>(message) ||
                   std::holds_alternative<EntityRemove>(message);
        case ServerChannel::Host:
            return std::holds_alternative<Host>(message);
        case ServerChannel::NetworkedEntities:
            return std::holds_alternative<NetworkedEntities>(message);
        case ServerChannel::NonNetworkedEntities:
            return std::holds_alternative<NonNetworkedEntities>(message);
        case ServerChannel::ChatChannel:
            return std::holds_alternative<ChatMessage>(message);
        default:
            return false;
    }
}

bool WireCodec::IsAllowedOn(ClientChannel channel, const Message& message) {
    switch (channel) {
        case ClientChannel::Input:   return std::holds_alternative<PlayerInput>(message);
        case ClientChannel::Rots:    return std::holds_alternative<RotationInput>(message);
        case ClientChannel::Command: return std::holds_alternative<PlayerCommand>(message);
        case ClientChannel::Chat:    return std::holds_alternative<ChatMessage>(message);
        default:                     return false;
    }
}

} // namespace Lattice
