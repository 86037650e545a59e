// ARBITER - External Call Isolation Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>

#include <arbiter/resolution/notifier.h>
#include "fakes.h"

#include <stdexcept>
#include <vector>

namespace arbiter {
namespace resolution {
namespace test {
namespace {

TEST(IsolatedCallTest, Outcomes) {
    EXPECT_TRUE(IsolatedCall([] { return true; }).ok);

    auto refused = IsolatedCall([] { return false; });
    EXPECT_FALSE(refused);
    EXPECT_EQ(refused.error, "call returned false");

    auto thrown = IsolatedCall([]() -> bool { throw std::runtime_error("boom"); });
    EXPECT_FALSE(thrown);
    EXPECT_EQ(thrown.error, "boom");
}

class NotifierTest : public ::testing::Test {
protected:
    static constexpr MarketId MARKET = 7;

    void SetUp() override {
        market_.AddMarket(MARKET, 0, 2);
    }

    ExternalNotifier MakeNotifier(IPriceOracle* oracle) {
        return ExternalNotifier(market_, reputation_, oracle,
                                [this](ResolutionEvent event) { failures_.push_back(event); });
    }

    FakeMarket market_;
    FakeReputation reputation_;
    FakePriceOracle oracle_;
    std::vector<ResolutionEvent> failures_;
};

TEST_F(NotifierTest, AdvancePhaseReachesMarket) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    EXPECT_TRUE(notifier.AdvancePhase(MARKET, MarketPhase::Proposed, 100).ok);
    EXPECT_EQ(market_.phases[MARKET], MarketPhase::Proposed);
    EXPECT_TRUE(failures_.empty());
}

TEST_F(NotifierTest, FailureBecomesEvent) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    market_.advanceMode = FailMode::Throw;

    auto result = notifier.AdvancePhase(MARKET, MarketPhase::Disputed, 123);
    EXPECT_FALSE(result.ok);
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].type, EventType::ExternalCallFailed);
    EXPECT_EQ(failures_[0].market, MARKET);
    EXPECT_EQ(failures_[0].timestamp, 123);
    EXPECT_EQ(failures_[0].detail, "AdvanceResolutionPhase(disputed): advance reverted");
}

TEST_F(NotifierTest, SlashTakesShareOfBalance) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    Address delegate = MakeAddress(0xD1);
    reputation_.balances[delegate] = 1000 * COIN;

    auto result = notifier.SlashReputation(MARKET, delegate, 1000, 0);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.amount, 100 * COIN);
    EXPECT_EQ(reputation_.balances[delegate], 900 * COIN);
}

TEST_F(NotifierTest, SlashWithoutBalanceSkipsCall) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    reputation_.slashMode = FailMode::Throw;

    auto result = notifier.SlashReputation(MARKET, MakeAddress(0xD2), 1000, 0);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.amount, 0);
}

TEST_F(NotifierTest, RefusedSlashReported) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    Address delegate = MakeAddress(0xD1);
    reputation_.balances[delegate] = COIN;
    reputation_.slashMode = FailMode::ReturnFalse;

    EXPECT_FALSE(notifier.SlashReputation(MARKET, delegate, 1000, 0).ok);
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].actor, delegate);
}

TEST_F(NotifierTest, PriceReferenceOnlyForLinkedMarkets) {
    ExternalNotifier notifier = MakeNotifier(&oracle_);
    auto unlinked = notifier.RecordPriceReference(MARKET, 0);
    EXPECT_TRUE(unlinked.ok);
    EXPECT_EQ(unlinked.amount, 0);
    EXPECT_TRUE(oracle_.recorded.empty());

    market_.feeds[MARKET] = MakeHash(0xF0);
    market_.assets[MARKET] = "ETH";
    oracle_.currentPrice = 3150;
    auto linked = notifier.RecordPriceReference(MARKET, 0);
    EXPECT_TRUE(linked.ok);
    EXPECT_EQ(linked.amount, 1);
    EXPECT_EQ(oracle_.recordedFeeds[MARKET], MakeHash(0xF0));

    auto price = notifier.GetRecordedPrice(MARKET);
    ASSERT_TRUE(price.has_value());
    EXPECT_EQ(price->value, 3150);
    EXPECT_EQ(price->asset, "ETH");
}

TEST_F(NotifierTest, PriceReferenceWithoutOracle) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    market_.feeds[MARKET] = MakeHash(0xF0);
    auto result = notifier.RecordPriceReference(MARKET, 0);
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.amount, 0);
    EXPECT_FALSE(notifier.GetRecordedPrice(MARKET).has_value());
}

TEST_F(NotifierTest, StalePriceReported) {
    ExternalNotifier notifier = MakeNotifier(&oracle_);
    market_.feeds[MARKET] = MakeHash(0xF0);
    oracle_.recordMode = FailMode::Throw;

    auto result = notifier.RecordPriceReference(MARKET, 0);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.amount, 0);
    ASSERT_EQ(failures_.size(), 1u);
    EXPECT_EQ(failures_[0].detail, "RecordPrice: feed stale");
}

TEST_F(NotifierTest, RosterSnapshotDropsZeroWeight) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    FakeRoster roster;
    roster.weights[MakeAddress(1)] = 5;
    roster.weights[MakeAddress(2)] = 0;

    std::map<Address, uint64_t> snapshot;
    EXPECT_TRUE(notifier.SnapshotRoster(MARKET, roster, snapshot, 0).ok);
    ASSERT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot[MakeAddress(1)], 5u);
}

TEST_F(NotifierTest, RosterFailureLeavesSnapshotUntouched) {
    ExternalNotifier notifier = MakeNotifier(nullptr);
    FakeRoster roster;
    roster.throwOnList = true;

    std::map<Address, uint64_t> snapshot{{MakeAddress(9), 1}};
    EXPECT_FALSE(notifier.SnapshotRoster(MARKET, roster, snapshot, 0).ok);
    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(failures_.size(), 1u);
}

} // namespace
} // namespace test
} // namespace resolution
} // namespace arbiter
