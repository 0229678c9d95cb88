// tests/unit/test_common_utils.cpp
#include <gtest/gtest.h>
#include "common/utils.hpp"
#include <sstream>
#include <thread>
#include <chrono>

using namespace Geneva::Common;

class UtilsTest : public ::testing::Test {
};

// ==================== Time utilities tests ====================
TEST_F(UtilsTest, GetCurrentTimestamp) {
    std::string timestamp = Utils::getCurrentTimestamp();
    EXPECT_FALSE(timestamp.empty());
    EXPECT_GT(timestamp.length(), 19u); // "YYYY-MM-DD HH:MM:SS" + milliseconds

    EXPECT_EQ(timestamp[4], '-');
    EXPECT_EQ(timestamp[7], '-');
    EXPECT_EQ(timestamp[10], ' ');
    EXPECT_EQ(timestamp[13], ':');
    EXPECT_EQ(timestamp[16], ':');
}

TEST_F(UtilsTest, GetCurrentTimestampUs) {
    uint64_t timestamp1 = Utils::getCurrentTimestampUs();
    std::this_thread::sleep_for(std::chrono::microseconds(100));
    uint64_t timestamp2 = Utils::getCurrentTimestampUs();

    EXPECT_GT(timestamp1, 0u);
    EXPECT_GT(timestamp2, timestamp1);
    EXPECT_GE(timestamp2 - timestamp1, 100u);
}

// ==================== String utilities tests ====================
TEST_F(UtilsTest, SplitByChar) {
    auto result = Utils::split("tcp:flags:S", ':');

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "tcp");
    EXPECT_EQ(result[1], "flags");
    EXPECT_EQ(result[2], "S");
}

TEST_F(UtilsTest, SplitNoDelimiter) {
    auto result = Utils::split("hello", ',');
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], "hello");
}

TEST_F(UtilsTest, Trim) {
    EXPECT_EQ(Utils::trim("  hello  "), "hello");
    EXPECT_EQ(Utils::trim("\t\nhello\r\n"), "hello");
    EXPECT_EQ(Utils::trim("   "), "");
    EXPECT_EQ(Utils::trim("xxhixx", "x"), "hi");
}

TEST_F(UtilsTest, CaseConversion) {
    EXPECT_EQ(Utils::toLowerCase("TCP:Flags"), "tcp:flags");
    EXPECT_EQ(Utils::toUpperCase("ip"), "IP");
}

TEST_F(UtilsTest, StartsWith) {
    EXPECT_TRUE(Utils::startsWith("log.level", "log."));
    EXPECT_FALSE(Utils::startsWith("log", "log."));
}

TEST_F(UtilsTest, Join) {
    EXPECT_EQ(Utils::join({"a", "b", "c"}, " "), "a b c");
    EXPECT_EQ(Utils::join({}, ","), "");
}

// ==================== Conversion tests ====================
TEST_F(UtilsTest, IsUnsignedInteger) {
    EXPECT_TRUE(Utils::isUnsignedInteger("0"));
    EXPECT_TRUE(Utils::isUnsignedInteger("0064"));
    EXPECT_FALSE(Utils::isUnsignedInteger(""));
    EXPECT_FALSE(Utils::isUnsignedInteger("-1"));
    EXPECT_FALSE(Utils::isUnsignedInteger("12a"));
}

TEST_F(UtilsTest, ParseUnsigned) {
    uint64_t value = 0;
    EXPECT_TRUE(Utils::parseUnsigned("18446744073709551615", value));
    EXPECT_EQ(value, 18446744073709551615ULL);

    value = 7;
    EXPECT_FALSE(Utils::parseUnsigned("18446744073709551616", value));
    EXPECT_EQ(value, 7u);
    EXPECT_FALSE(Utils::parseUnsigned("abc", value));
}

TEST_F(UtilsTest, IntegerAndBool) {
    EXPECT_TRUE(Utils::isInteger("-42"));
    EXPECT_FALSE(Utils::isInteger("-"));
    EXPECT_EQ(Utils::stringToInt("42"), 42);
    EXPECT_EQ(Utils::stringToInt("nope", -1), -1);

    EXPECT_TRUE(Utils::stringToBool("yes"));
    EXPECT_FALSE(Utils::stringToBool("off", true));
    EXPECT_TRUE(Utils::stringToBool("maybe", true));
}

// ==================== Hex tests ====================
TEST_F(UtilsTest, BytesToHex) {
    const uint8_t data[] = {0x45, 0x00, 0xff};
    EXPECT_EQ(Utils::bytesToHex(data, sizeof(data)), "4500ff");
}

TEST_F(UtilsTest, HexToBytes) {
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(Utils::hexToBytes("45 00:FF", bytes));
    EXPECT_EQ(bytes, (std::vector<uint8_t>{0x45, 0x00, 0xff}));

    EXPECT_FALSE(Utils::hexToBytes("450", bytes));
    EXPECT_FALSE(Utils::hexToBytes("zz", bytes));
}

TEST_F(UtilsTest, HexDump) {
    const char text[] = "GET / HTTP/1.1";
    std::ostringstream os;
    Utils::hexDump(text, sizeof(text) - 1, os);

    std::string dump = os.str();
    EXPECT_NE(dump.find("00000000: 47 45 54"), std::string::npos);
    EXPECT_NE(dump.find("GET / HTTP/1.1"), std::string::npos);
}

// ==================== Network tests ====================
TEST_F(UtilsTest, Ipv4Conversion) {
    uint32_t address = 0;
    ASSERT_TRUE(Utils::ipv4FromString("10.0.0.1", address));
    EXPECT_EQ(address, 0x0A000001u);
    EXPECT_EQ(Utils::ipv4ToString(address), "10.0.0.1");

    EXPECT_FALSE(Utils::ipv4FromString("10.0.0", address));
    EXPECT_FALSE(Utils::ipv4FromString("example.com", address));
}

// ==================== Singleton tests ====================
namespace
{
    class Counter : public Singleton<Counter>
    {
        friend class Singleton<Counter>;

    public:
        int value = 0;

    private:
        Counter() = default;
    };
}

TEST_F(UtilsTest, SingletonReturnsSameInstance) {
    Counter::getInstance().value = 5;
    EXPECT_EQ(&Counter::getInstance(), &Counter::getInstance());
    EXPECT_EQ(Counter::getInstance().value, 5);
}
