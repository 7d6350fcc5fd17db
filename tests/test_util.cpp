#include <gtest/gtest.h>
#include "gitpass/Util.hpp"
#include "gitpass/Errors.hpp"

#include <cstdlib>

using namespace gitpass;

TEST(Util, Trim) {
    EXPECT_EQ(trim("  host = x \t\r\n"), "host = x");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(Util, ReplaceAll) {
    EXPECT_EQ(replace_all("${host}/${host}", "${host}", "a"), "a/a");
    EXPECT_EQ(replace_all("abc", "", "x"), "abc");
}

TEST(Util, SplitLines) {
    EXPECT_EQ(split_lines("a\nb\r\nc\rd"), (std::vector<std::string>{"a", "b", "c", "d"}));
    EXPECT_EQ(split_lines("narf\n"), (std::vector<std::string>{"narf"}));
    EXPECT_EQ(split_lines("a\n\nb"), (std::vector<std::string>{"a", "", "b"}));
    EXPECT_TRUE(split_lines("").empty());
}

TEST(Util, SplitLinesOnUnicodeBoundaries) {
    EXPECT_EQ(split_lines("a\vb\fc\x1c" "d\x1d" "e\x1e" "f"),
              (std::vector<std::string>{"a", "b", "c", "d", "e", "f"}));
    // U+0085, U+2028, U+2029
    EXPECT_EQ(split_lines("a\xC2\x85" "b\xE2\x80\xA8" "c\xE2\x80\xA9"),
              (std::vector<std::string>{"a", "b", "c"}));
    // other code points with the same lead bytes are kept
    EXPECT_EQ(split_lines("\xC2\xA9 \xE2\x80\x94"), (std::vector<std::string>{"\xC2\xA9 \xE2\x80\x94"}));
}

TEST(Util, SkipChars) {
    EXPECT_EQ(skip_chars("testthis", 4), "this");
    EXPECT_EQ(skip_chars("testthis", 8), "");
    EXPECT_EQ(skip_chars("testthis", 10), "");
    EXPECT_EQ(skip_chars("t\xC3\xA4\xC3\x9F" "t", 2), "\xC3\x9F" "t");
}

TEST(Util, ParseIntOption) {
    EXPECT_EQ(parse_int_option("line", " 3 "), 3);
    EXPECT_EQ(parse_int_option("skip", "-1"), -1);
    EXPECT_THROW(parse_int_option("skip", "abc"), ConfigValueError);
    EXPECT_THROW(parse_int_option("skip", "3x"), ConfigValueError);
    EXPECT_THROW(parse_int_option("skip", ""), ConfigValueError);
}

TEST(Util, ExpandUser) {
    Environment env{{"HOME", "/home/tester"}};
    EXPECT_EQ(expand_user("~/some/dir", env), "/home/tester/some/dir");
    EXPECT_EQ(expand_user("~", env), "/home/tester");
    EXPECT_EQ(expand_user("/abs/dir", env), "/abs/dir");
    EXPECT_EQ(expand_user("~other/dir", env), "~other/dir");
}

TEST(Util, EnvironmentSnapshot) {
    setenv("GITPASS_UTIL_TEST", "value=with=equals", 1);
    Environment env = enumerate_environment();
    unsetenv("GITPASS_UTIL_TEST");

    EXPECT_EQ(get_env(env, "GITPASS_UTIL_TEST"), std::optional<std::string>("value=with=equals"));
    EXPECT_FALSE(get_env(env, "GITPASS_UTIL_TEST_MISSING").has_value());
}
