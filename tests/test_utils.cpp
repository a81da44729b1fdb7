#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(Utils, SafeStoiParses) {
    EXPECT_EQ(safe_stoi("10000"), 10000);
    EXPECT_EQ(safe_stoi("-3"), -3);
}

TEST(Utils, SafeStoiFallback) {
    EXPECT_EQ(safe_stoi("", 7), 7);
    EXPECT_EQ(safe_stoi("abc", 7), 7);
    EXPECT_EQ(safe_stoi("10x", 7), 7);  // trailing garbage rejected
}

TEST(Utils, ReplaceAll) {
    EXPECT_EQ(replace_all("telnet {host} {port}", "{host}", "127.0.0.1"),
              "telnet 127.0.0.1 {port}");
    EXPECT_EQ(replace_all("{x}{x}", "{x}", "ab"), "abab");
    EXPECT_EQ(replace_all("unchanged", "", "z"), "unchanged");
}

TEST(Utils, SplitArgsWhitespace) {
    auto parts = split_args("  telnet\t127.0.0.1   10000 ");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "telnet");
    EXPECT_EQ(parts[1], "127.0.0.1");
    EXPECT_EQ(parts[2], "10000");
}

TEST(Utils, SplitArgsQuoted) {
    auto parts = split_args("/bin/sh \"/tmp/my server.sh\" \"\"");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "/tmp/my server.sh");
    EXPECT_EQ(parts[2], "");
}

TEST(Utils, SplitArgsEmpty) {
    EXPECT_TRUE(split_args("").empty());
    EXPECT_TRUE(split_args("   ").empty());
}

TEST(Utils, Trim) {
    std::string s = "  \t* OK ready\r\n";
    trim(s);
    EXPECT_EQ(s, "* OK ready");

    std::string blank = " \r\n";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}
