#pragma once

#include "networking/Channels.hpp"
#include "networking/Messages.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace Lattice {

/**
 * @brief Why a buffer failed to decode
 *
 * A decode failure affects only the one buffer; callers drop it and keep
 * draining the channel.
 */
enum class DecodeError : uint8_t {
    Truncated,          // Buffer ended before the message did
    UnknownTag,         // First byte is not a known MessageTag
    LengthMismatch,     // Snapshot arrays differ in length
    DuplicateEntity,    // Snapshot lists an entity twice
    Oversize,           // String or array count exceeds the protocol limit
    InvalidValue,       // Enum or bool field out of range
    TrailingBytes,      // Bytes left after a complete message
    UnexpectedMessage   // Message kind not legal on the channel it arrived on
};

const char* DecodeErrorToString(DecodeError error);

/**
 * @brief Binary codec for Message values
 *
 * Format: one tag byte, then fields little-endian; floats as IEEE-754 bit
 * patterns; strings and arrays as a u32 count followed by the payload.
 */
class WireCodec {
public:
    static constexpr uint32_t MAX_STRING_LENGTH = 1024;
    static constexpr uint32_t MAX_SNAPSHOT_ENTRIES = 65536;

    [[nodiscard]] static std::vector<uint8_t> Encode(const Message& message);

    [[nodiscard]] static std::expected<Message, DecodeError> Decode(std::span<const uint8_t> bytes);

    /**
     * @brief Decode and check that the message kind is legal on the channel
     */
    [[nodiscard]] static std::expected<Message, DecodeError> DecodeOn(ServerChannel channel,
                                                                     std::span<const uint8_t> bytes);
    [[nodiscard]] static std::expected<Message, DecodeError> DecodeOn(ClientChannel channel,
                                                                     std::span<const uint8_t> bytes);

    [[nodiscard]] static MessageTag GetTag(const Message& message);

    [[nodiscard]] static bool IsAllowedOn(ServerChannel channel, const Message& message);
    [[nodiscard]] static bool IsAllowedOn(ClientChannel channel, const Message& message);
};

} // namespace Lattice
