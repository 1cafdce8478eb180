#include <gtest/gtest.h>
#include "utils.hpp"
#include <limits>
#include <stdexcept>

TEST(UtilsTest, ParseTrackerCommand) {
    TrackerCommand cmd = parse_tracker_command("register  alice 10.0.0.1   6001");
    EXPECT_EQ(cmd.name, "REGISTER");
    ASSERT_EQ(cmd.args.size(), 3u);
    EXPECT_EQ(cmd.args[0], "alice");
    EXPECT_EQ(cmd.args[2], "6001");

    EXPECT_TRUE(parse_tracker_command("").name.empty());
}

TEST(UtilsTest, FirstLine) {
    EXPECT_EQ(first_line("GET_PEERS\r\nleftover"), "GET_PEERS");
    EXPECT_EQ(first_line("  HEARTBEAT alice  "), "HEARTBEAT alice");
    EXPECT_EQ(first_line(""), "");
}

TEST(UtilsTest, ParsePort) {
    EXPECT_EQ(parse_port("5000"), 5000);
    EXPECT_EQ(parse_port("0"), 0);
    EXPECT_THROW(parse_port("65536"), std::invalid_argument);
    EXPECT_THROW(parse_port("-1"), std::invalid_argument);
    EXPECT_THROW(parse_port("80x"), std::invalid_argument);
    EXPECT_THROW(parse_port(""), std::invalid_argument);
}

TEST(UtilsTest, ParseSeconds) {
    EXPECT_EQ(parse_seconds("60"), 60);
    EXPECT_THROW(parse_seconds("0"), std::invalid_argument);
    EXPECT_THROW(parse_seconds("soon"), std::invalid_argument);
    EXPECT_EQ(parse_seconds("1000000"), 1000000);
    EXPECT_THROW(parse_seconds("3000000"), std::invalid_argument);
}

TEST(UtilsTest, SecondsToMsSaturates) {
    EXPECT_EQ(seconds_to_ms(10), 10000);
    EXPECT_EQ(seconds_to_ms(3000000), std::numeric_limits<int>::max());
}

TEST(UtilsTest, ValidUtf8) {
    EXPECT_TRUE(is_valid_utf8("alice"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xc3"));
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));
}

TEST(UtilsTest, DetectLocalIpIsNeverEmpty) {
    EXPECT_FALSE(detect_local_ip().empty());
}
