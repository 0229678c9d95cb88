// tests/engine/test_action_executor.cpp
#include <gtest/gtest.h>
#include "core/engine/action_executor.hpp"
#include "core/engine/strategy_parser.hpp"
#include "fixed_random_source.hpp"
#include "test_packets.hpp"

using namespace Geneva::Engine;
using Geneva::Common::Packet;
using GenevaTest::PacketSpec;
using GenevaTest::buildTcpPacket;
using GenevaTest::buildUdpPacket;
using GenevaTest::payloadOf;

// ==================== Test Fixture ====================
class ActionExecutorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        registry = FieldRegistry::createDefault();
        random = std::make_shared<SeededRandomSource>(42);
        spec.flags = TH_PUSH | TH_ACK;
        spec.payload = "abcdefghijklmnopqrst"; // 20 bytes
    }

    /**
     * @brief Runs the action of "[TCP:flags:PA]-<action>-| \/" on the packet
     */
    std::vector<Packet> run(const std::string &action, const Packet &packet)
    {
        strategy = parser.parse("[TCP:flags:PA]-" + action + "-| \\/");
        EXPECT_NE(strategy, nullptr) << parser.getError().toString();
        if (!strategy)
        {
            return {};
        }

        ActionExecutor executor(registry, random);
        executor.setStatistics(&statistics);
        return executor.execute(&strategy->getOutbound().front().getAction(), packet);
    }

    uint32_t seqOf(const Packet &packet)
    {
        return packet.readUint32(packet.tcpHeaderOffset() + Packet::TCP_OFF_SEQ);
    }

    std::shared_ptr<FieldRegistry> registry;
    std::shared_ptr<RandomSource> random;
    std::unique_ptr<Strategy> strategy;
    EngineStatistics statistics;
    Parser parser;
    PacketSpec spec;
};

// ==================== Terminal Actions ====================
TEST_F(ActionExecutorTest, SendReturnsPacketUnchanged)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("send", packet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], packet);
    EXPECT_EQ(out[0].getTimestamp(), packet.getTimestamp());
}

TEST_F(ActionExecutorTest, NullActionIsSend)
{
    ActionExecutor executor(registry, random);
    Packet packet = buildTcpPacket(spec);
    auto out = executor.execute(nullptr, packet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], packet);
}

TEST_F(ActionExecutorTest, DropReturnsNothing)
{
    EXPECT_TRUE(run("drop", buildTcpPacket(spec)).empty());
    EXPECT_EQ(statistics.drops.load(), 1u);
}

// ==================== Duplicate ====================
TEST_F(ActionExecutorTest, DuplicateSendsTwoCopies)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("duplicate", packet);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], packet);
    EXPECT_EQ(out[1], packet);
    EXPECT_EQ(statistics.duplicates.load(), 1u);
}

TEST_F(ActionExecutorTest, DuplicateBranchesAreIndependent)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("duplicate(tamper{TCP:flags:replace:R},)", packet);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].tcpFlags(), TH_RST);
    EXPECT_EQ(out[1], packet);
    EXPECT_TRUE(out[0].verifyTCPChecksum());
}

TEST_F(ActionExecutorTest, DuplicateWithDropBranch)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("duplicate(,drop)", packet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], packet);
}

TEST_F(ActionExecutorTest, NestedDuplicatesFanOut)
{
    auto out = run("duplicate(duplicate,duplicate(duplicate,))", buildTcpPacket(spec));
    EXPECT_EQ(out.size(), 5u);
}

// ==================== TCP Fragmentation ====================
TEST_F(ActionExecutorTest, TcpSegmentationInOrder)
{
    auto out = run("fragment{tcp:10:True}", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 2u);

    EXPECT_EQ(payloadOf(out[0]), "abcdefghij");
    EXPECT_EQ(payloadOf(out[1]), "klmnopqrst");
    EXPECT_EQ(seqOf(out[0]), 1000u);
    EXPECT_EQ(seqOf(out[1]), 1010u);

    for (const auto &segment : out)
    {
        EXPECT_EQ(segment.readUint16(Packet::IP_OFF_TOTAL_LENGTH), segment.size());
        EXPECT_TRUE(segment.verifyIPv4Checksum());
        EXPECT_TRUE(segment.verifyTCPChecksum());
    }
    EXPECT_EQ(statistics.fragments.load(), 1u);
}

TEST_F(ActionExecutorTest, TcpSegmentationReversed)
{
    auto out = run("fragment{tcp:10:False}", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(payloadOf(out[0]), "klmnopqrst");
    EXPECT_EQ(payloadOf(out[1]), "abcdefghij");
}

TEST_F(ActionExecutorTest, TcpSegmentationKeepsOptions)
{
    spec.options = {0x01, 0x01, 0x08, 0x0a, 0, 0, 0, 1, 0, 0, 0, 2};
    auto out = run("fragment{tcp:5:True}", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].tcpHeaderLength(), 32u);
    EXPECT_EQ(out[1].tcpHeaderLength(), 32u);
    EXPECT_EQ(payloadOf(out[1]), "fghijklmnopqrst");
}

TEST_F(ActionExecutorTest, SegmentsRunTheirOwnBranches)
{
    auto out = run("fragment{tcp:10:True}(tamper{TCP:load:replace:XX},drop)", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(payloadOf(out[0]), "XX");
    EXPECT_TRUE(out[0].verifyTCPChecksum());
}

// ==================== IP Fragmentation ====================
TEST_F(ActionExecutorTest, IpFragmentation)
{
    spec.frag_off = 0x4000; // DF
    Packet packet = buildTcpPacket(spec);
    auto out = run("fragment{ip:20:True}", packet);
    ASSERT_EQ(out.size(), 2u);

    // 20 + 20 bytes of IP payload, split at 16 (rounded down to 8)
    const Packet &first = out[0];
    const Packet &second = out[1];
    EXPECT_EQ(first.size(), 20u + 16u);
    EXPECT_EQ(second.size(), 20u + 24u);

    EXPECT_TRUE(first.ipMoreFragments());
    EXPECT_EQ(first.ipFragmentOffset(), 0u);
    EXPECT_FALSE(second.ipMoreFragments());
    EXPECT_EQ(second.ipFragmentOffset(), 2u);
    EXPECT_EQ(second.readUint16(Packet::IP_OFF_FLAGS_FRAG) & 0x4000, 0x4000);

    EXPECT_FALSE(second.hasTCP());
    EXPECT_TRUE(first.verifyIPv4Checksum());
    EXPECT_TRUE(second.verifyIPv4Checksum());

    // Reassembled payload equals the original
    std::vector<uint8_t> joined(first.data().begin() + 20, first.data().end());
    joined.insert(joined.end(), second.data().begin() + 20, second.data().end());
    EXPECT_EQ(joined, std::vector<uint8_t>(packet.data().begin() + 20, packet.data().end()));
}

TEST_F(ActionExecutorTest, IpFragmentOfFragment)
{
    Packet packet = buildTcpPacket(spec);
    Packet first;
    Packet second;
    ASSERT_TRUE(ActionExecutor::splitIP(packet, 24, first, second));

    Packet third;
    Packet fourth;
    ASSERT_TRUE(ActionExecutor::splitIP(second, 8, third, fourth));
    EXPECT_EQ(third.ipFragmentOffset(), 3u);
    EXPECT_TRUE(third.ipMoreFragments());
    EXPECT_EQ(fourth.ipFragmentOffset(), 4u);
    EXPECT_FALSE(fourth.ipMoreFragments());
}

// ==================== Unsplittable Packets ====================
TEST_F(ActionExecutorTest, OffsetPastPayloadRunsLeftBranchOnly)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("fragment{tcp:20:True}(,drop)", packet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], packet);
    EXPECT_EQ(statistics.unsplittable_fragments.load(), 1u);
    EXPECT_EQ(statistics.fragments.load(), 0u);
}

TEST_F(ActionExecutorTest, ZeroOffsetIsUnsplittable)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("fragment{tcp:0:True}(drop,)", packet);
    EXPECT_TRUE(out.empty());
}

TEST_F(ActionExecutorTest, IpOffsetBelowEightIsUnsplittable)
{
    Packet packet = buildTcpPacket(spec);
    auto out = run("fragment{ip:7:True}", packet);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], packet);
}

TEST_F(ActionExecutorTest, TcpFragmentOfUdpIsUnsplittable)
{
    Packet first;
    Packet second;
    EXPECT_FALSE(ActionExecutor::splitTCP(buildUdpPacket(spec), 4, first, second));
    EXPECT_TRUE(ActionExecutor::splitIP(buildUdpPacket(spec), 8, first, second));
}

// ==================== Tamper ====================
TEST_F(ActionExecutorTest, TamperReplaceTtl)
{
    spec.ttl = 3;
    auto out = run("tamper{IP:ttl:replace:64}", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].readUint8(Packet::IP_OFF_TTL), 64);
    EXPECT_TRUE(out[0].verifyIPv4Checksum());
    EXPECT_EQ(statistics.tampers.load(), 1u);
}

TEST_F(ActionExecutorTest, CorruptIsReproducibleWithSeed)
{
    Packet packet = buildTcpPacket(spec);
    auto first = run("tamper{IP:ttl:corrupt}", packet);

    random = std::make_shared<SeededRandomSource>(42);
    auto second = run("tamper{IP:ttl:corrupt}", packet);

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0], second[0]);
    EXPECT_NE(first[0].readUint8(Packet::IP_OFF_TTL), 64);
    EXPECT_TRUE(first[0].verifyIPv4Checksum());
}

TEST_F(ActionExecutorTest, CorruptChecksumStaysInvalid)
{
    auto out = run("tamper{TCP:chksum:corrupt}", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].verifyTCPChecksum());
    EXPECT_TRUE(out[0].verifyIPv4Checksum());
}

TEST_F(ActionExecutorTest, DuplicateTampersEachCopySeparately)
{
    auto out = run("duplicate(tamper{TCP:flags:replace:R},tamper{TCP:chksum:corrupt})", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 2u);

    EXPECT_EQ(out[0].tcpFlags(), TH_RST);
    EXPECT_TRUE(out[0].verifyTCPChecksum());

    EXPECT_EQ(out[1].tcpFlags(), TH_PUSH | TH_ACK);
    EXPECT_FALSE(out[1].verifyTCPChecksum());
}

TEST_F(ActionExecutorTest, NestedDuplicateWithDropKeepsTamperedCopy)
{
    auto out = run("duplicate(duplicate(tamper{TCP:flags:replace:R},drop),drop)", buildTcpPacket(spec));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].tcpFlags(), TH_RST);
    EXPECT_TRUE(out[0].verifyIPv4Checksum());
}

TEST_F(ActionExecutorTest, TamperWithoutLayerPassesThrough)
{
    Packet udp = buildUdpPacket(spec);
    strategy = parser.parse("[IP:ttl:64]-tamper{TCP:window:replace:1}-| \\/");
    ASSERT_NE(strategy, nullptr);

    ActionExecutor executor(registry, random);
    auto out = executor.execute(&strategy->getOutbound().front().getAction(), udp);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], udp);
}

// ==================== Errors ====================
TEST_F(ActionExecutorTest, OptionOverflowThrows)
{
    spec.options.assign(40, 0);
    spec.options[0] = 30;
    spec.options[1] = 40;
    EXPECT_THROW(run("tamper{TCP:options-mss:replace:1460}", buildTcpPacket(spec)), ExecutorError);
}

TEST_F(ActionExecutorTest, UnregisteredFieldThrows)
{
    registry = std::make_shared<FieldRegistry>();
    EXPECT_THROW(run("tamper{TCP:window:replace:1}", buildTcpPacket(spec)), ExecutorError);
}

TEST_F(ActionExecutorTest, CorruptWithoutRandomSourceThrows)
{
    random.reset();
    EXPECT_THROW(run("tamper{IP:ttl:corrupt}", buildTcpPacket(spec)), ExecutorError);
}

TEST_F(ActionExecutorTest, StatisticsAreOptional)
{
    strategy = parser.parse("[TCP:flags:PA]-duplicate(drop,fragment{tcp:4:True})-| \\/");
    ASSERT_NE(strategy, nullptr);

    ActionExecutor executor(registry, random);
    auto out = executor.execute(&strategy->getOutbound().front().getAction(), buildTcpPacket(spec));
    EXPECT_EQ(out.size(), 2u);
}
