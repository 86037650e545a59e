// ARBITER - Protocol Options Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>

#include <arbiter/resolution/options.h>
#include <arbiter/resolution/store.h>
#include "fakes.h"

#include <memory>

namespace arbiter {
namespace resolution {
namespace test {
namespace {

class OptionsTest : public ::testing::Test {
protected:
    util::ConfigParseResult Load(const std::string& content) {
        auto parsed = config_.ParseString(content);
        EXPECT_TRUE(parsed.success) << parsed.errorMessage;
        return LoadProtocolOptions(config_, options_);
    }

    util::ConfigManager config_;
    ProtocolOptions options_;
};

TEST_F(OptionsTest, Defaults) {
    auto result = Load("");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(options_.managers.empty());
    EXPECT_EQ(options_.logLevel, util::LogLevel::Info);
    EXPECT_TRUE(options_.logToConsole);
    EXPECT_FALSE(options_.storeEnabled);
}

TEST_F(OptionsTest, FullConfiguration) {
    auto result = Load(
        "[oracle]\n"
        "manager=0x0101010101010101010101010101010101010101\n"
        "manager=0202020202020202020202020202020202020202, "
        "0303030303030303030303030303030303030303\n"
        "[log]\n"
        "level=debug\n"
        "console=false\n"
        "file=/tmp/arbiter.log\n"
        "[store]\n"
        "enabled=yes\n"
        "path=/tmp/arbiter-store\n");
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_TRUE(result.warnings.empty());

    EXPECT_EQ(options_.managers.size(), 3u);
    EXPECT_EQ(options_.managers.count(MakeAddress(0x02)), 1u);
    EXPECT_EQ(options_.logLevel, util::LogLevel::Debug);
    EXPECT_FALSE(options_.logToConsole);
    EXPECT_EQ(options_.logFile, "/tmp/arbiter.log");
    EXPECT_TRUE(options_.storeEnabled);
    EXPECT_EQ(options_.storePath, "/tmp/arbiter-store");
}

TEST_F(OptionsTest, MalformedManagerRejected) {
    options_.logFile = "untouched";
    auto result = Load("[oracle]\nmanager=0xabc\n");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("0xabc"), std::string::npos);
    EXPECT_EQ(options_.logFile, "untouched");

    EXPECT_FALSE(Load("[oracle]\nmanager=zz02020202020202020202020202020202020202\n").success);
}

TEST_F(OptionsTest, MalformedValuesRejected) {
    EXPECT_FALSE(Load("[log]\nlevel=loud\n").success);
    config_.Clear();
    EXPECT_FALSE(Load("[log]\nconsole=maybe\n").success);
    config_.Clear();
    EXPECT_FALSE(Load("[store]\nenabled=true\n").success);
}

TEST_F(OptionsTest, UnknownKeysWarn) {
    auto result = Load("[log]\nlevle=debug\n");
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_NE(result.warnings[0].find("log.levle"), std::string::npos);
}

TEST_F(OptionsTest, DisabledStoreOpensNothing) {
    std::unique_ptr<ResolutionStore> store;
    EXPECT_TRUE(OpenConfiguredStore(options_, store).ok());
    EXPECT_EQ(store, nullptr);
}

TEST_F(OptionsTest, LoggingToUnwritableFileFails) {
    options_.logToConsole = false;
    options_.logFile = "/nonexistent/dir/arbiter.log";
    EXPECT_FALSE(ApplyLoggingOptions(options_));
    util::Logger::Instance().ClearSinks();
}

} // namespace
} // namespace test
} // namespace resolution
} // namespace arbiter
