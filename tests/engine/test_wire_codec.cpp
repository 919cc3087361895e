/**
 * @file test_wire_codec.cpp
 * @brief Unit tests for the wire message codec
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "networking/ByteStream.hpp"
#include "networking/Channels.hpp"
#include "networking/WireCodec.hpp"

#include "utils/TestHelpers.hpp"

#include <glm/gtc/quaternion.hpp>

using namespace Lattice;
using namespace Lattice::Test;

namespace {

template<typename T>
T DecodeAs(const std::vector<uint8_t>& bytes) {
    auto decoded = WireCodec::Decode(bytes);
    EXPECT_TRUE(decoded.has_value()) << DecodeErrorToString(decoded.error());
    EXPECT_TRUE(std::holds_alternative<T>(*decoded));
    return std::get<T>(*decoded);
}

DecodeError DecodeErrorOf(const std::vector<uint8_t>& bytes) {
    auto decoded = WireCodec::Decode(bytes);
    EXPECT_FALSE(decoded.has_value());
    return decoded ? DecodeError::UnexpectedMessage : decoded.error();
}

} // namespace

// =============================================================================
// Encoding
// =============================================================================

TEST(WireCodecTest, TagIsFirstByte) {
    auto bytes = WireCodec::Encode(PlayerRemove{9});

    ASSERT_EQ(9u, bytes.size());
    EXPECT_EQ(static_cast<uint8_t>(MessageTag::PlayerRemove), bytes[0]);
    EXPECT_EQ(9, bytes[1]);  // Little-endian u64
    for (size_t i = 2; i < bytes.size(); ++i) {
        EXPECT_EQ(0, bytes[i]);
    }
}

TEST(WireCodecTest, PlayerCreatePreservesFields) {
    PlayerCreate original;
    original.id = 0x1122334455667788ull;
    original.entity = EntityId{3, 17};
    original.translation = glm::vec3(-4.5f, 171.0f, 12.25f);

    auto decoded = DecodeAs<PlayerCreate>(WireCodec::Encode(original));

    EXPECT_EQ(original.id, decoded.id);
    EXPECT_EQ(original.entity, decoded.entity);
    EXPECT_VEC3_EQ(original.translation, decoded.translation);
}

TEST(WireCodecTest, SnapshotPreservesOrderAndAlignment) {
    NetworkedEntities original;
    original.Add(EntityId{0, 5}, glm::vec3(1.0f, 2.0f, 3.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
    original.Add(EntityId{1, 2}, glm::vec3(-1.0f, 0.0f, 8.0f),
                 glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f)));

    auto decoded = DecodeAs<NetworkedEntities>(WireCodec::Encode(original));

    ASSERT_EQ(2u, decoded.Size());
    for (size_t i = 0; i < decoded.Size(); ++i) {
        EXPECT_EQ(original.entities[i], decoded.entities[i]);
        EXPECT_VEC3_EQ(original.translations[i], decoded.translations[i]);
        EXPECT_QUAT_EQ(original.rotations[i], decoded.rotations[i]);
    }
}

TEST(WireCodecTest, EmptySnapshotIsValid) {
    auto decoded = DecodeAs<NonNetworkedEntities>(WireCodec::Encode(NonNetworkedEntities{}));
    EXPECT_TRUE(decoded.Empty());
}

TEST(WireCodecTest, ChatTextSurvives) {
    ChatMessage original{42, "hello, lattice"};

    auto decoded = DecodeAs<ChatMessage>(WireCodec::Encode(original));

    EXPECT_EQ(42u, decoded.clientId);
    EXPECT_EQ("hello, lattice", decoded.text);
}

TEST(WireCodecTest, CommandAndHost) {
    auto command = DecodeAs<PlayerCommand>(
        WireCodec::Encode(PlayerCommand{CommandAction::PlaceBlock, glm::vec3(1.0f, 64.0f, -2.0f)}));
    EXPECT_EQ(CommandAction::PlaceBlock, command.action);
    EXPECT_VEC3_EQ(glm::vec3(1.0f, 64.0f, -2.0f), command.target);

    EXPECT_TRUE(DecodeAs<Host>(WireCodec::Encode(Host{true})).isHost);
    EXPECT_FALSE(DecodeAs<Host>(WireCodec::Encode(Host{false})).isHost);
}

TEST(WireCodecTest, GetTagMatchesVariant) {
    EXPECT_EQ(MessageTag::PlayerCreate, WireCodec::GetTag(PlayerCreate{}));
    EXPECT_EQ(MessageTag::NonNetworkedEntities, WireCodec::GetTag(NonNetworkedEntities{}));
    EXPECT_EQ(MessageTag::RotationInput, WireCodec::GetTag(RotationInput{}));
    EXPECT_EQ(MessageTag::EntityRemove, WireCodec::GetTag(EntityRemove{}));
}

// =============================================================================
// Malformed Input
// =============================================================================

TEST(WireCodecTest, EmptyBufferIsTruncated) {
    EXPECT_EQ(DecodeError::Truncated, DecodeErrorOf({}));
}

TEST(WireCodecTest, UnknownTagIsRejected) {
    EXPECT_EQ(DecodeError::UnknownTag, DecodeErrorOf({0}));
    EXPECT_EQ(DecodeError::UnknownTag, DecodeErrorOf({12, 0, 0}));
    EXPECT_EQ(DecodeError::UnknownTag, DecodeErrorOf({0xFF}));
}

TEST(WireCodecTest, TruncatedBodyIsRejected) {
    auto bytes = WireCodec::Encode(PlayerInput{glm::vec3(1.0f)});
    bytes.pop_back();

    EXPECT_EQ(DecodeError::Truncated, DecodeErrorOf(bytes));
}

TEST(WireCodecTest, TrailingBytesAreRejected) {
    auto bytes = WireCodec::Encode(PlayerRemove{1});
    bytes.push_back(0);

    EXPECT_EQ(DecodeError::TrailingBytes, DecodeErrorOf(bytes));
}

TEST(WireCodecTest, SnapshotLengthMismatchIsRejected) {
    ByteWriter writer;
    writer.WriteU8(static_cast<uint8_t>(MessageTag::NetworkedEntities));
    writer.WriteU32(2);
    writer.WriteU64(EntityId{0, 1}.ToBits());
    writer.WriteU64(EntityId{0, 2}.ToBits());
    writer.WriteU32(1);
    writer.WriteVec3(glm::vec3(0.0f));
    writer.WriteU32(2);
    writer.WriteQuat(glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
    writer.WriteQuat(glm::quat(1.0f, 0.0f, 0.0f, 0.0f));

    EXPECT_EQ(DecodeError::LengthMismatch, DecodeErrorOf(writer.Data()));
}

TEST(WireCodecTest, SnapshotDuplicateEntityIsRejected) {
    NetworkedEntities snapshot;
    snapshot.Add(EntityId{0, 7}, glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
    snapshot.Add(EntityId{0, 7}, glm::vec3(1.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));

    EXPECT_EQ(DecodeError::DuplicateEntity, DecodeErrorOf(WireCodec::Encode(snapshot)));
}

TEST(WireCodecTest, SnapshotCountBeyondBufferIsTruncated) {
    ByteWriter writer;
    writer.WriteU8(static_cast<uint8_t>(MessageTag::NetworkedEntities));
    writer.WriteU32(1000);  // Claims 8000 bytes of ids
    writer.WriteU64(0);

    EXPECT_EQ(DecodeError::Truncated, DecodeErrorOf(writer.Data()));
}

TEST(WireCodecTest, SnapshotCountBeyondLimitIsOversize) {
    ByteWriter writer;
    writer.WriteU8(static_cast<uint8_t>(MessageTag::NonNetworkedEntities));
    writer.WriteU32(WireCodec::MAX_SNAPSHOT_ENTRIES + 1);

    EXPECT_EQ(DecodeError::Oversize, DecodeErrorOf(writer.Data()));
}

TEST(WireCodecTest, OversizeChatIsRejected) {
    ChatMessage chat{1, std::string(WireCodec::MAX_STRING_LENGTH + 1, 'x')};

    EXPECT_EQ(DecodeError::Oversize, DecodeErrorOf(WireCodec::Encode(chat)));
}

TEST(WireCodecTest, OutOfRangeValuesAreRejected) {
    EXPECT_EQ(DecodeError::InvalidValue,
              DecodeErrorOf({static_cast<uint8_t>(MessageTag::Host), 2}));

    ByteWriter writer;
    writer.WriteU8(static_cast<uint8_t>(MessageTag::PlayerCommand));
    writer.WriteU8(static_cast<uint8_t>(CommandAction::Count));
    writer.WriteVec3(glm::vec3(0.0f));
    EXPECT_EQ(DecodeError::InvalidValue, DecodeErrorOf(writer.Data()));
}

// =============================================================================
// Channel Legality
// =============================================================================

TEST(WireCodecTest, MessagesAreBoundToTheirChannels) {
    EXPECT_TRUE(WireCodec::IsAllowedOn(ServerChannel::ServerMessages, PlayerCreate{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ServerChannel::ServerMessages, EntityRemove{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ServerChannel::Host, Host{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ServerChannel::NetworkedEntities, NetworkedEntities{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ServerChannel::ChatChannel, ChatMessage{}));

    EXPECT_FALSE(WireCodec::IsAllowedOn(ServerChannel::NetworkedEntities, NonNetworkedEntities{}));
    EXPECT_FALSE(WireCodec::IsAllowedOn(ServerChannel::Host, PlayerCreate{}));

    EXPECT_TRUE(WireCodec::IsAllowedOn(ClientChannel::Input, PlayerInput{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ClientChannel::Rots, RotationInput{}));
    EXPECT_TRUE(WireCodec::IsAllowedOn(ClientChannel::Command, PlayerCommand{}));
    EXPECT_FALSE(WireCodec::IsAllowedOn(ClientChannel::Input, RotationInput{}));
}

TEST(WireCodecTest, DecodeOnRejectsWrongChannel) {
    auto bytes = WireCodec::Encode(PlayerInput{glm::vec3(1.0f)});

    EXPECT_TRUE(WireCodec::DecodeOn(ClientChannel::Input, bytes).has_value());

    auto wrong = WireCodec::DecodeOn(ClientChannel::Chat, bytes);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(DecodeError::UnexpectedMessage, wrong.error());
}

TEST(ChannelsTest, ReliabilityAssignments) {
    EXPECT_EQ(ReliabilityMode::ReliableOrdered, GetReliability(ServerChannel::ServerMessages));
    EXPECT_EQ(ReliabilityMode::ReliableOrdered, GetReliability(ServerChannel::Host));
    EXPECT_EQ(ReliabilityMode::Unreliable, GetReliability(ServerChannel::NetworkedEntities));
    EXPECT_EQ(ReliabilityMode::Unreliable, GetReliability(ServerChannel::NonNetworkedEntities));
    EXPECT_EQ(ReliabilityMode::ReliableOrdered, GetReliability(ServerChannel::ChatChannel));

    EXPECT_EQ(ReliabilityMode::Unreliable, GetReliability(ClientChannel::Input));
    EXPECT_EQ(ReliabilityMode::Unreliable, GetReliability(ClientChannel::Rots));
    EXPECT_EQ(ReliabilityMode::ReliableOrdered, GetReliability(ClientChannel::Command));
    EXPECT_EQ(ReliabilityMode::ReliableOrdered, GetReliability(ClientChannel::Chat));
}
