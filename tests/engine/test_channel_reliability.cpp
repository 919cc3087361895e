/**
 * @file test_channel_reliability.cpp
 * @brief Unit tests for per-channel sequencing, acks and resends
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "networking/UdpTransport.hpp"

#include "utils/TestHelpers.hpp"

using namespace Lattice;
using namespace Lattice::Test;

namespace {

constexpr uint8_t UNRELIABLE = 0;
constexpr uint8_t RELIABLE = 1;

std::vector<uint8_t> Body(uint8_t value) {
    return std::vector<uint8_t>{value};
}

} // namespace

class ChannelReliabilityTest : public ::testing::Test {
protected:
    ChannelReliability m_channels{
        {ReliabilityMode::Unreliable, ReliabilityMode::ReliableOrdered},
        {ReliabilityMode::Unreliable, ReliabilityMode::ReliableOrdered}
    };
};

// =============================================================================
// Outgoing
// =============================================================================

TEST_F(ChannelReliabilityTest, SequencesArePerChannel) {
    EXPECT_EQ(0u, m_channels.PrepareSend(UNRELIABLE, Body(1), 0));
    EXPECT_EQ(1u, m_channels.PrepareSend(UNRELIABLE, Body(2), 0));
    EXPECT_EQ(0u, m_channels.PrepareSend(RELIABLE, Body(3), 0));
}

TEST_F(ChannelReliabilityTest, OnlyReliablePayloadsAreRetained) {
    m_channels.PrepareSend(UNRELIABLE, Body(1), 0);
    m_channels.PrepareSend(RELIABLE, Body(2), 0);
    m_channels.PrepareSend(RELIABLE, Body(3), 0);

    EXPECT_EQ(2u, m_channels.GetUnackedCount());

    m_channels.OnAck(RELIABLE, 0);
    EXPECT_EQ(1u, m_channels.GetUnackedCount());

    m_channels.OnAck(RELIABLE, 0);  // Duplicate ack
    m_channels.OnAck(42, 0);        // Unknown channel
    EXPECT_EQ(1u, m_channels.GetUnackedCount());
}

TEST_F(ChannelReliabilityTest, ResendAfterInterval) {
    m_channels.PrepareSend(RELIABLE, Body(7), 1000);

    int resent = 0;
    auto collect = [&resent](uint8_t channel, uint32_t sequence, const std::vector<uint8_t>& body) {
        EXPECT_EQ(RELIABLE, channel);
        EXPECT_EQ(0u, sequence);
        EXPECT_EQ(Body(7), body);
        resent++;
    };

    m_channels.CollectResends(1050, 100, collect);
    EXPECT_EQ(0, resent);

    m_channels.CollectResends(1100, 100, collect);
    EXPECT_EQ(1, resent);

    // Resend restarts the interval
    m_channels.CollectResends(1150, 100, collect);
    EXPECT_EQ(1, resent);

    m_channels.OnAck(RELIABLE, 0);
    m_channels.CollectResends(5000, 100, collect);
    EXPECT_EQ(1, resent);
}

// =============================================================================
// Incoming
// =============================================================================

TEST_F(ChannelReliabilityTest, UnreliableDropsStalePayloads) {
    EXPECT_FALSE(m_channels.OnPayload(UNRELIABLE, 5, Body(5)));
    EXPECT_FALSE(m_channels.OnPayload(UNRELIABLE, 3, Body(3)));
    EXPECT_FALSE(m_channels.OnPayload(UNRELIABLE, 5, Body(5)));
    EXPECT_FALSE(m_channels.OnPayload(UNRELIABLE, 6, Body(6)));

    EXPECT_EQ(Body(5), m_channels.Pop(UNRELIABLE).value());
    EXPECT_EQ(Body(6), m_channels.Pop(UNRELIABLE).value());
    EXPECT_FALSE(m_channels.Pop(UNRELIABLE).has_value());
}

TEST_F(ChannelReliabilityTest, ReliableDeliversInOrder) {
    EXPECT_TRUE(m_channels.OnPayload(RELIABLE, 2, Body(2)));
    EXPECT_TRUE(m_channels.OnPayload(RELIABLE, 1, Body(1)));
    EXPECT_FALSE(m_channels.Pop(RELIABLE).has_value());

    EXPECT_TRUE(m_channels.OnPayload(RELIABLE, 0, Body(0)));

    EXPECT_EQ(Body(0), m_channels.Pop(RELIABLE).value());
    EXPECT_EQ(Body(1), m_channels.Pop(RELIABLE).value());
    EXPECT_EQ(Body(2), m_channels.Pop(RELIABLE).value());
    EXPECT_FALSE(m_channels.Pop(RELIABLE).has_value());
}

TEST_F(ChannelReliabilityTest, ReliableDuplicatesAreAckedButNotRedelivered) {
    EXPECT_TRUE(m_channels.OnPayload(RELIABLE, 0, Body(0)));
    EXPECT_TRUE(m_channels.OnPayload(RELIABLE, 0, Body(0)));

    EXPECT_EQ(Body(0), m_channels.Pop(RELIABLE).value());
    EXPECT_FALSE(m_channels.Pop(RELIABLE).has_value());
}

TEST_F(ChannelReliabilityTest, ReliableFarAheadIsNotAcked) {
    EXPECT_FALSE(m_channels.OnPayload(RELIABLE, 100000, Body(9)));
    EXPECT_FALSE(m_channels.Pop(RELIABLE).has_value());
}

TEST_F(ChannelReliabilityTest, ChannelBounds) {
    EXPECT_TRUE(m_channels.IsValidIncoming(RELIABLE));
    EXPECT_FALSE(m_channels.IsValidIncoming(2));
    EXPECT_TRUE(m_channels.IsValidOutgoing(UNRELIABLE));
    EXPECT_FALSE(m_channels.IsValidOutgoing(2));
}
