// ARBITER - Resolution Audit Store Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>

#include <arbiter/core/serialize.h>
#include <arbiter/db/memory.h>
#include <arbiter/resolution/store.h>
#include "fakes.h"

#include <filesystem>
#include <memory>
#include <random>

namespace arbiter {
namespace resolution {
namespace test {
namespace {

MarketSnapshot SampleSnapshot() {
    MarketSnapshot snapshot;

    Resolution resolution;
    resolution.market = 11;
    resolution.proposer = MakeAddress(0xA1);
    resolution.outcome = 2;
    resolution.proposalTime = 1000;
    resolution.totalSupport = 15 * COIN;
    resolution.totalSupportWeight = 16 * COIN;
    resolution.status = ResolutionStatus::Approved;
    resolution.evidenceURI = "ipfs://evidence";
    resolution.evidenceHash = MakeHash(0xEE);
    resolution.proposerBonusBps = 500;
    snapshot.resolution = resolution;

    ResolutionCommit commit;
    commit.committer = MakeAddress(0xA1);
    commit.hash = MakeHash(0x01);
    commit.bond = COIN;
    commit.revealed = true;
    snapshot.commits.push_back(commit);

    Dispute dispute;
    dispute.challenger = MakeAddress(0xC1);
    dispute.outcome = 1;
    dispute.bond = 25 * COIN;
    dispute.status = DisputeStatus::Upheld;
    dispute.challengerPayout = 9 * COIN;
    snapshot.disputes.push_back(dispute);

    EvidenceChallenge challenge;
    challenge.challenger = MakeAddress(0xE1);
    challenge.reason = "source misquoted";
    challenge.stake = COIN;
    snapshot.challenges.push_back(challenge);

    Settlement settlement;
    settlement.finalOutcome = 1;
    settlement.fee = COIN / 4;
    settlement.winningDispute = 0;
    snapshot.settlement = settlement;
    return snapshot;
}

class StoreTest : public ::testing::Test {
protected:
    static constexpr MarketRound ROUND{11, 0};

    void SetUp() override {
        auto database = std::make_unique<db::MemoryDatabase>();
        raw_ = database.get();
        store_ = std::make_unique<ResolutionStore>(std::move(database));
        ASSERT_TRUE(store_->Initialize().ok());
    }

    db::MemoryDatabase* raw_{nullptr};
    std::unique_ptr<ResolutionStore> store_;
};

TEST_F(StoreTest, SnapshotRoundTrip) {
    MarketSnapshot saved = SampleSnapshot();
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, saved).ok());

    MarketSnapshot loaded;
    ASSERT_TRUE(store_->LoadSnapshot(ROUND, loaded).ok());
    ASSERT_TRUE(loaded.resolution.has_value());
    EXPECT_EQ(loaded.resolution->outcome, 2u);
    EXPECT_EQ(loaded.resolution->status, ResolutionStatus::Approved);
    EXPECT_EQ(loaded.resolution->evidenceURI, "ipfs://evidence");
    EXPECT_EQ(loaded.resolution->totalSupportWeight, 16 * COIN);
    ASSERT_EQ(loaded.commits.size(), 1u);
    EXPECT_TRUE(loaded.commits[0].revealed);
    ASSERT_EQ(loaded.disputes.size(), 1u);
    EXPECT_EQ(loaded.disputes[0].status, DisputeStatus::Upheld);
    EXPECT_EQ(loaded.disputes[0].challengerPayout, 9 * COIN);
    ASSERT_EQ(loaded.challenges.size(), 1u);
    EXPECT_EQ(loaded.challenges[0].reason, "source misquoted");
    ASSERT_TRUE(loaded.settlement.has_value());
    EXPECT_EQ(loaded.settlement->winningDispute, std::optional<uint32_t>(0));
}

TEST_F(StoreTest, NewerSnapshotOverwrites) {
    MarketSnapshot snapshot = SampleSnapshot();
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, snapshot).ok());
    snapshot.resolution->finalized = true;
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, snapshot).ok());

    MarketSnapshot loaded;
    ASSERT_TRUE(store_->LoadSnapshot(ROUND, loaded).ok());
    EXPECT_TRUE(loaded.resolution->finalized);
}

TEST_F(StoreTest, RoundsKeptSeparately) {
    MarketSnapshot first = SampleSnapshot();
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, first).ok());
    EXPECT_EQ(store_->LatestRound(11), std::optional<uint32_t>(0));

    MarketSnapshot second;
    second.resolution = first.resolution;
    second.resolution->round = 1;
    second.resolution->outcome = 0;
    ASSERT_TRUE(store_->SaveSnapshot(MarketRound{11, 1}, second).ok());
    EXPECT_EQ(store_->LatestRound(11), std::optional<uint32_t>(1));

    // A late write to the first round leaves the index on the newest one
    first.resolution->finalized = true;
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, first).ok());
    EXPECT_EQ(store_->LatestRound(11), std::optional<uint32_t>(1));

    MarketSnapshot loaded;
    ASSERT_TRUE(store_->LoadSnapshot(ROUND, loaded).ok());
    EXPECT_EQ(loaded.resolution->outcome, 2u);
    EXPECT_TRUE(loaded.resolution->finalized);
    ASSERT_TRUE(store_->LoadSnapshot(MarketRound{11, 1}, loaded).ok());
    EXPECT_EQ(loaded.resolution->round, 1u);
    EXPECT_EQ(loaded.resolution->outcome, 0u);
    EXPECT_FALSE(store_->LatestRound(12).has_value());
}

TEST_F(StoreTest, MissingSnapshot) {
    MarketSnapshot loaded;
    EXPECT_TRUE(store_->LoadSnapshot(MarketRound{99, 0}, loaded).IsNotFound());
}

TEST_F(StoreTest, TamperedSnapshotIsCorruption) {
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, SampleSnapshot()).ok());

    const std::string key = db::MakeKey(db::prefix::SNAPSHOT, 11, 0);
    std::string value;
    ASSERT_TRUE(raw_->Get(key, &value).ok());
    value[3] ^= 0x01;
    ASSERT_TRUE(raw_->Put(key, value).ok());

    MarketSnapshot loaded;
    EXPECT_TRUE(store_->LoadSnapshot(ROUND, loaded).IsCorruption());
}

TEST_F(StoreTest, TruncatedValueIsCorruption) {
    ASSERT_TRUE(raw_->Put(db::MakeKey(db::prefix::SNAPSHOT, 11, 0), "short").ok());
    MarketSnapshot loaded;
    EXPECT_TRUE(store_->LoadSnapshot(ROUND, loaded).IsCorruption());
}

TEST_F(StoreTest, ListMarketsAscending) {
    ASSERT_TRUE(store_->SaveSnapshot(MarketRound{300, 0}, MarketSnapshot()).ok());
    ASSERT_TRUE(store_->SaveSnapshot(MarketRound{2, 0}, MarketSnapshot()).ok());
    ASSERT_TRUE(store_->SaveSnapshot(ROUND, MarketSnapshot()).ok());
    ASSERT_TRUE(store_->SaveSnapshot(MarketRound{11, 1}, MarketSnapshot()).ok());

    std::vector<MarketId> markets = store_->ListMarkets();
    ASSERT_EQ(markets.size(), 3u);
    EXPECT_EQ(markets[0], 2u);
    EXPECT_EQ(markets[1], 11u);
    EXPECT_EQ(markets[2], 300u);
}

TEST_F(StoreTest, InitializeIsIdempotent) {
    EXPECT_TRUE(store_->Initialize().ok());
}

TEST_F(StoreTest, SchemaMismatchRejected) {
    DataStream ss;
    ss << uint32_t(ResolutionStore::SCHEMA_VERSION + 1);
    ASSERT_TRUE(raw_->Put(db::MakeKey(db::prefix::VERSION), ss.Str()).ok());
    EXPECT_EQ(store_->Initialize().code(), db::Status::NOT_SUPPORTED);
}

TEST(StoreOpenTest, PersistsOnDisk) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
                                ("arbiter_store_test_" + std::to_string(rd()));
    {
        auto [status, store] = ResolutionStore::Open(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(store->SaveSnapshot(MarketRound{5, 0}, SampleSnapshot()).ok());
    }
    {
        auto [status, store] = ResolutionStore::Open(dir);
        ASSERT_TRUE(status.ok()) << status.ToString();
        MarketSnapshot loaded;
        ASSERT_TRUE(store->LoadSnapshot(MarketRound{5, 0}, loaded).ok());
        EXPECT_EQ(loaded.resolution->proposer, MakeAddress(0xA1));
    }
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

} // namespace
} // namespace test
} // namespace resolution
} // namespace arbiter
