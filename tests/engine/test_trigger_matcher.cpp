// tests/engine/test_trigger_matcher.cpp
#include <gtest/gtest.h>
#include "core/engine/strategy_parser.hpp"
#include "core/engine/trigger_matcher.hpp"
#include "core/engine/header_fields.hpp"
#include "test_packets.hpp"

using namespace Geneva::Engine;
using Geneva::Common::Packet;
using GenevaTest::PacketSpec;
using GenevaTest::buildTcpPacket;
using GenevaTest::buildUdpPacket;

class TriggerMatcherTest : public ::testing::Test
{
protected:
    TriggerMatcherTest()
        : matcher(FieldRegistry::createDefault())
    {
    }

    bool matches(const std::string &protocol_field_value, const Packet &packet)
    {
        auto strategy = parser.parse("[" + protocol_field_value + "]-drop-| \\/");
        EXPECT_NE(strategy, nullptr) << parser.getError().toString();
        if (!strategy)
        {
            return false;
        }
        return matcher.matches(strategy->getOutbound().front().getTrigger(), packet, Direction::OUTBOUND);
    }

    TriggerMatcher matcher;
    Parser parser;
};

// ==================== Field Matching ====================
TEST_F(TriggerMatcherTest, MatchesTcpFlags)
{
    PacketSpec spec;
    spec.flags = TH_PUSH | TH_ACK;
    Packet packet = buildTcpPacket(spec);

    EXPECT_TRUE(matches("TCP:flags:PA", packet));
    EXPECT_TRUE(matches("TCP:flags:AP", packet));
    EXPECT_TRUE(matches("TCP:flags:24", packet));
    EXPECT_FALSE(matches("TCP:flags:A", packet));
    EXPECT_FALSE(matches("TCP:flags:S", packet));
}

TEST_F(TriggerMatcherTest, MatchesNumericFields)
{
    Packet packet = buildTcpPacket();

    EXPECT_TRUE(matches("IP:ttl:64", packet));
    EXPECT_TRUE(matches("ip:ttl:064", packet));
    EXPECT_FALSE(matches("IP:ttl:63", packet));
    EXPECT_TRUE(matches("TCP:dport:80", packet));
    EXPECT_TRUE(matches("TCP:sport:40000", packet));
    EXPECT_TRUE(matches("IP:flags:0", packet));
}

TEST_F(TriggerMatcherTest, MatchesPayload)
{
    PacketSpec spec;
    spec.payload = "GET";
    Packet packet = buildTcpPacket(spec);

    EXPECT_TRUE(matches("TCP:load:GET", packet));
    EXPECT_FALSE(matches("TCP:load:GE", packet));
}

TEST_F(TriggerMatcherTest, MatchesTcpOptions)
{
    PacketSpec spec;
    spec.options = {0x02, 0x04, 0x05, 0xb4};
    Packet packet = buildTcpPacket(spec);

    EXPECT_TRUE(matches("TCP:options-mss:1460", packet));
    EXPECT_FALSE(matches("TCP:options-wscale:0", packet));
}

// ==================== No Match Cases ====================
TEST_F(TriggerMatcherTest, MissingLayerNeverMatches)
{
    Packet udp = buildUdpPacket();

    EXPECT_FALSE(matches("TCP:sport:40000", udp));
    EXPECT_FALSE(matches("TCP:flags:S", udp));
    EXPECT_TRUE(matches("IP:protocol:17", udp));
    EXPECT_FALSE(matches("IP:ttl:64", Packet()));
}

TEST_F(TriggerMatcherTest, UnrepresentableValueNeverMatches)
{
    Packet packet = buildTcpPacket();
    EXPECT_FALSE(matches("IP:ttl:1000", packet));
    EXPECT_FALSE(matches("TCP:flags:Q", packet));
}

TEST_F(TriggerMatcherTest, UnknownFieldInCustomRegistry)
{
    auto registry = std::make_shared<FieldRegistry>();
    registry->registerField(std::make_shared<PayloadFieldAccessor>(Protocol::TCP));
    TriggerMatcher custom(registry);

    PacketSpec spec;
    spec.payload = "x";
    Packet packet = buildTcpPacket(spec);

    EXPECT_TRUE(custom.matches(Trigger(Protocol::TCP, "load", "x"), packet, Direction::OUTBOUND));
    EXPECT_FALSE(custom.matches(Trigger(Protocol::TCP, "flags", "S"), packet, Direction::OUTBOUND));
    EXPECT_FALSE(TriggerMatcher(nullptr).matches(Trigger(Protocol::TCP, "load", "x"), packet,
                                                  Direction::OUTBOUND));
}

// ==================== First Match ====================
TEST_F(TriggerMatcherTest, FirstMatchingTreeWins)
{
    auto strategy = parser.parse("[TCP:flags:A]-drop-|[TCP:flags:S]-duplicate-|[IP:ttl:64]-drop-| \\/");
    ASSERT_NE(strategy, nullptr);
    const Forest &forest = strategy->getOutbound();

    const ActionTree *tree = matcher.findFirstMatch(forest, buildTcpPacket(), Direction::OUTBOUND);
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree, &forest[1]);
    EXPECT_EQ(tree->getAction().getType(), ActionType::DUPLICATE);

    PacketSpec spec;
    spec.flags = TH_FIN;
    spec.ttl = 1;
    EXPECT_EQ(matcher.findFirstMatch(forest, buildTcpPacket(spec), Direction::OUTBOUND), nullptr);
}

TEST_F(TriggerMatcherTest, EmptyForestNeverMatches)
{
    EXPECT_EQ(matcher.findFirstMatch(Forest(), buildTcpPacket(), Direction::INBOUND), nullptr);
}
