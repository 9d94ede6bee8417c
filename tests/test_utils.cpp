#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("-7"), -7);
    EXPECT_EQ(safe_stoi("", 5), 5);
    EXPECT_EQ(safe_stoi("12abc", -1), -1);
    EXPECT_EQ(safe_stoi("99999999999999", -1), -1);
}

TEST(Utils, SplitWhitespace) {
    EXPECT_EQ(split_ws("  a  b\tc \n"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split_ws("   ").empty());
}

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("/dev/ttyUSB0"), "'/dev/ttyUSB0'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, Trim) {
    std::string s = " \t hello world \r\n";
    trim(s);
    EXPECT_EQ(s, "hello world");

    std::string blank = "   ";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}

TEST(Utils, IsoTimestampsRoundTrip) {
    std::string now = now_iso();
    ASSERT_EQ(now.size(), 19u);
    EXPECT_EQ(now[10], 'T');
    EXPECT_NE(parse_iso_time(now), 0);
    EXPECT_EQ(parse_iso_time("garbage"), 0);
}

TEST(Utils, IsoTimestampsOrderLexically) {
    // Cache merges rely on string order matching time order
    EXPECT_LT(std::string("2025-01-15T09:59:59"), std::string("2025-01-15T10:00:00"));
    EXPECT_LT(parse_iso_time("2025-01-15T09:59:59"), parse_iso_time("2025-01-15T10:00:00"));
}
