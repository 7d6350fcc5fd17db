#include <gtest/gtest.h>
#include "gitpass/Protocol.hpp"
#include "gitpass/Errors.hpp"

#include <sstream>

using namespace gitpass;

TEST(ParseRequest, KeyValueLines) {
    std::istringstream in("protocol=https\nhost=mytest.com\npath=sub/bar.git\n");
    Request r = parse_request(in);

    EXPECT_EQ(r.size(), 3u);
    EXPECT_EQ(r.at("protocol"), "https");
    EXPECT_EQ(r.at("host"), "mytest.com");
    EXPECT_EQ(r.at("path"), "sub/bar.git");
}

TEST(ParseRequest, BlankLinesAndWhitespace) {
    std::istringstream in("\n  \nhost = mytest.com \r\n\nusername=a=b\n");
    Request r = parse_request(in);

    EXPECT_EQ(r.at("host"), "mytest.com");
    // split happens on the first '=' only
    EXPECT_EQ(r.at("username"), "a=b");
}

TEST(ParseRequest, EmptyInput) {
    std::istringstream in("");
    EXPECT_TRUE(parse_request(in).empty());
}

TEST(ParseRequest, MalformedLine) {
    std::istringstream in("host=mytest.com\ngarbage\n");
    try {
        parse_request(in);
        FAIL() << "Expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.line(), "garbage");
    }
}

TEST(FormatResponse, PasswordAndUsername) {
    Credential c{std::string("pw"), std::string("user")};
    EXPECT_EQ(format_response(c, {{"host", "h"}}), "password=pw\nusername=user\n");
}

TEST(FormatResponse, UsernameNotEchoed) {
    Credential c{std::string("pw"), std::string("user")};
    EXPECT_EQ(format_response(c, {{"host", "h"}, {"username", "narf"}}), "password=pw\n");
}

TEST(FormatResponse, AbsentValuesOmitted) {
    EXPECT_EQ(format_response(Credential{}, {{"host", "h"}}), "");
    Credential only_user{std::nullopt, std::string("user")};
    EXPECT_EQ(format_response(only_user, {{"host", "h"}}), "username=user\n");
}

TEST(FormatResponse, EmptyValuesOmitted) {
    Credential c{std::string(""), std::string("")};
    EXPECT_EQ(format_response(c, {{"host", "h"}}), "");
}
