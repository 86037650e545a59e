// ARBITER - Configuration File Parser Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>

#include <arbiter/util/config.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace arbiter {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/arbiter_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    auto result = config_.ParseString("# comment\n; another\n\n   \n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseKeyValuePair) {
    ASSERT_TRUE(config_.ParseString("level = debug\n").success);
    EXPECT_EQ(config_.GetString("level", ""), "debug");
}

TEST_F(ConfigTest, ParseQuotedValue) {
    ASSERT_TRUE(config_.ParseString("a=\"two words\"\nb='single'\nc=\"line\\nbreak\"\n").success);
    EXPECT_EQ(config_.GetString("a", ""), "two words");
    EXPECT_EQ(config_.GetString("b", ""), "single");
    EXPECT_EQ(config_.GetString("c", ""), "line\nbreak");
}

TEST_F(ConfigTest, ParseSection) {
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=warn\n[store]\npath=/tmp/x\n").success);
    EXPECT_EQ(config_.GetString("level", "", "log"), "warn");
    EXPECT_EQ(config_.GetString("path", "", "store"), "/tmp/x");
    EXPECT_FALSE(config_.HasKey("level"));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "log");
    EXPECT_EQ(sections[1], "store");
}

TEST_F(ConfigTest, MissingBracketIsError) {
    auto result = config_.ParseString("ok=1\n[broken\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, "test.conf");
    EXPECT_EQ(result.errorLine, 2);
}

TEST_F(ConfigTest, LineWithoutEqualsIsError) {
    auto result = config_.ParseString("just-a-word\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, InvalidKeyCharacter) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, GetInt) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=\n").success);
    EXPECT_EQ(config_.GetInt("a", 0), 42);
    EXPECT_EQ(config_.GetInt("b", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 5), 5);
}

TEST_F(ConfigTest, GetBool) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=OFF\nc=1\nd=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.TryGetBool("d").has_value());
}

TEST_F(ConfigTest, GetListFromRepeatsAndCommas) {
    ASSERT_TRUE(config_.ParseString("[oracle]\nmanager=a, b\nmanager=c\n").success);
    auto list = config_.GetList("manager", "oracle");
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0], "a");
    EXPECT_EQ(list[1], "b");
    EXPECT_EQ(list[2], "c");
}

TEST_F(ConfigTest, ExpandEnvVars) {
    setenv("ARBITER_TEST_DIR", "/var/lib/arbiter", 1);
    ASSERT_TRUE(config_.ParseString("path=${ARBITER_TEST_DIR}/store\n").success);
    EXPECT_EQ(config_.GetString("path", ""), "/var/lib/arbiter/store");
    unsetenv("ARBITER_TEST_DIR");

    EXPECT_EQ(ConfigManager::ExpandEnvVars("x${ARBITER_UNSET_VARIABLE}y"), "xy");
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("[log]\nlevel=error\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString("level", "", "log"), "error");
}

TEST_F(ConfigTest, ParseNonexistentFile) {
    auto result = config_.ParseFile("/nonexistent/arbiter.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// Setting and Validation
// ============================================================================

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    config_.Set("level", "info", "log");
    config_.SetDefault("level", "trace", "log");
    config_.SetDefault("console", "true", "log");
    EXPECT_EQ(config_.GetString("level", "", "log"), "info");
    EXPECT_EQ(config_.GetString("console", "", "log"), "true");
}

TEST_F(ConfigTest, FileOverridesDefault) {
    config_.SetDefault("level", "trace", "log");
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=warn\n").success);
    EXPECT_EQ(config_.GetString("level", "", "log"), "warn");
    EXPECT_EQ(config_.GetList("level", "log").size(), 1u);
}

TEST_F(ConfigTest, RequiredKeyMissing) {
    config_.RequireKey("path", "store");
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("store.path"), std::string::npos);
}

TEST_F(ConfigTest, UnknownKeysReported) {
    config_.AllowKey("level", "log");
    ASSERT_TRUE(config_.ParseString("[log]\nlevel=info\nlevle=debug\n").success);
    auto errors = config_.Validate();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("log.levle"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace arbiter
