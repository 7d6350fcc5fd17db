/**
 * @file test_cli.cpp
 * @brief Unit tests for CLI functionality (GoogleTest)
 *
 * Covers run(), the part of pass-git-helper behind option parsing:
 * - get: answers with the credential, exit 0
 * - skip switch and unsupported actions: exit 1 without output
 * - request, mapping and resolution failures: message on stderr, exit 1
 *
 * Note: These tests verify the function used by the CLI, not the full
 * binary, with a fake password store in place of pass.
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "gitpass/Helper.hpp"
#include "test_helpers.hpp"

#include <sstream>

using namespace gitpass;
using gitpass_test::FakeStore;
using gitpass_test::TempDir;

// ============================================================================
// Test Utilities
// ============================================================================

class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        mapping_ = config_.create_file("git-pass-mapping.ini",
                                       "[mytest.com]\n"
                                       "target = dev/mytest\n");
        store_dir_.create_file("dev/mytest.gpg", "encrypted");
        store_.add("dev/mytest", "narf\nlogin-name");

        env_ = {{"HOME", config_.path()},
                {"PASSWORD_STORE_DIR", store_dir_.path()},
                {"XDG_CONFIG_HOME", config_.path()},
                {"XDG_CONFIG_DIRS", config_.path()}};
    }

    int invoke(const std::string& action, const std::optional<std::string>& mapping_file,
               const std::string& request = "host=mytest.com\n") {
        std::istringstream in(request);
        out_.str("");
        err_.str("");
        return run(action, mapping_file, in, out_, err_, env_, store_);
    }

    TempDir config_;
    TempDir store_dir_;
    FakeStore store_;
    Environment env_;
    std::string mapping_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================================
// get
// ============================================================================

TEST_F(CliTest, GetPrintsCredential) {
    EXPECT_EQ(invoke("get", mapping_), 0);
    EXPECT_EQ(out_.str(), "password=narf\nusername=login-name\n");
    EXPECT_EQ(err_.str(), "");
}

TEST_F(CliTest, GetUsesXdgMapping) {
    config_.create_file("pass-git-helper/git-pass-mapping.ini",
                        "[mytest.com]\ntarget = dev/mytest\n");

    EXPECT_EQ(invoke("get", std::nullopt), 0);
    EXPECT_EQ(out_.str(), "password=narf\nusername=login-name\n");
}

// ============================================================================
// Skipped and unsupported
// ============================================================================

TEST_F(CliTest, SkipSwitchExitsWithoutOutput) {
    env_["PASS_GIT_HELPER_SKIP"] = "";

    EXPECT_EQ(invoke("get", mapping_), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_EQ(err_.str(), "");
    EXPECT_TRUE(store_.calls().empty());
}

TEST_F(CliTest, UnsupportedAction) {
    EXPECT_EQ(invoke("store", mapping_), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_TRUE(store_.calls().empty());

    EXPECT_EQ(invoke("erase", mapping_), 1);
    EXPECT_EQ(out_.str(), "");
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(CliTest, MalformedRequest) {
    EXPECT_EQ(invoke("get", mapping_, "host=mytest.com\ngarbage\n"), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to parse request"), std::string::npos);
}

TEST_F(CliTest, MissingMappingFile) {
    EXPECT_EQ(invoke("get", config_.path() + "/missing.ini"), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to parse mapping file"), std::string::npos);
    EXPECT_NE(err_.str().find("missing.ini"), std::string::npos);
}

TEST_F(CliTest, NoMappingConfigured) {
    EXPECT_EQ(invoke("get", std::nullopt), 1);
    EXPECT_NE(err_.str().find("Unable to parse mapping file"), std::string::npos);
    EXPECT_NE(err_.str().find("Please create"), std::string::npos);
}

TEST_F(CliTest, UnparsableMapping) {
    std::string broken = config_.create_file("broken.ini", "[mytest.com\ntarget = x\n");

    EXPECT_EQ(invoke("get", broken), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to parse mapping file"), std::string::npos);
}

TEST_F(CliTest, UnknownExtractorNamesIt) {
    std::string mapping = config_.create_file("extractor.ini",
                                              "[mytest.com]\n"
                                              "target = dev/mytest\n"
                                              "username_extractor = doesntexist\n");

    EXPECT_EQ(invoke("get", mapping), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to retrieve credentials"), std::string::npos);
    EXPECT_NE(err_.str().find("doesntexist"), std::string::npos);
}

TEST_F(CliTest, NoMatchingSection) {
    EXPECT_EQ(invoke("get", mapping_, "host=unknown.org\n"), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to retrieve credentials"), std::string::npos);
    EXPECT_NE(err_.str().find("No mapping section"), std::string::npos);
}

TEST_F(CliTest, StoreFailure) {
    std::string mapping = config_.create_file("broken-entry.ini",
                                              "[mytest.com]\ntarget = dev/broken\n");
    store_dir_.create_file("dev/broken.gpg", "encrypted");

    EXPECT_EQ(invoke("get", mapping), 1);
    EXPECT_EQ(out_.str(), "");
    EXPECT_NE(err_.str().find("Unable to retrieve credentials"), std::string::npos);
}
