// ARBITER - Database Tests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <gtest/gtest.h>
#include <arbiter/db/database.h>
#include <arbiter/db/leveldb.h>
#include <arbiter/db/memory.h>
#include <filesystem>
#include <random>

using namespace arbiter::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("arbiter_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    /// Put, get and overwrite against any backend
    static void ExerciseBasicOps(Database& db) {
        ASSERT_TRUE(db.Put(Slice("key1"), Slice("value1")).ok());

        std::string value;
        ASSERT_TRUE(db.Get(Slice("key1"), &value).ok());
        EXPECT_EQ(value, "value1");

        ASSERT_TRUE(db.Put(Slice("key1"), Slice("value2")).ok());
        ASSERT_TRUE(db.Get(Slice("key1"), &value).ok());
        EXPECT_EQ(value, "value2");

        EXPECT_TRUE(db.Get(Slice("missing"), &value).IsNotFound());
    }

    static void ExerciseBatchAndIteration(Database& db) {
        WriteBatch batch;
        batch.Put(MakeKey(prefix::ROUND, 3), "three");
        batch.Put(MakeKey(prefix::ROUND, 1), "one");
        batch.Put(MakeKey(prefix::ROUND, 256), "many");
        batch.Put(MakeKey(prefix::VERSION), "v");
        EXPECT_EQ(batch.Count(), 4u);
        ASSERT_TRUE(db.Write(&batch).ok());

        std::string value;
        ASSERT_TRUE(db.Get(MakeKey(prefix::ROUND, 256), &value).ok());
        EXPECT_EQ(value, "many");

        std::vector<uint64_t> ids;
        const std::string roundPrefix = MakeKey(prefix::ROUND);
        auto it = db.NewIterator();
        for (it->Seek(roundPrefix); it->Valid() && it->key().starts_with(roundPrefix); it->Next()) {
            auto id = ParseIdKey(prefix::ROUND, it->key());
            ASSERT_TRUE(id.has_value());
            ids.push_back(*id);
        }
        EXPECT_TRUE(it->status().ok());
        ASSERT_EQ(ids.size(), 3u);
        EXPECT_EQ(ids[0], 1u);
        EXPECT_EQ(ids[1], 3u);
        EXPECT_EQ(ids[2], 256u);
    }
};

// ============================================================================
// Keys and Status
// ============================================================================

TEST(DatabaseKeyTest, BigEndianIds) {
    std::string key = MakeKey(prefix::SNAPSHOT, 0x0102);
    ASSERT_EQ(key.size(), 9u);
    EXPECT_EQ(key[0], 's');
    EXPECT_EQ(key[7], 0x01);
    EXPECT_EQ(key[8], 0x02);
    EXPECT_EQ(ParseIdKey(prefix::SNAPSHOT, key), std::optional<uint64_t>(0x0102));
}

TEST(DatabaseKeyTest, SubIdFollowsId) {
    std::string key = MakeKey(prefix::SNAPSHOT, 7, 0x0203);
    ASSERT_EQ(key.size(), 13u);
    EXPECT_EQ(key.substr(0, 9), MakeKey(prefix::SNAPSHOT, 7));
    EXPECT_EQ(key[11], 0x02);
    EXPECT_EQ(key[12], 0x03);
    EXPECT_LT(MakeKey(prefix::SNAPSHOT, 7, 1), MakeKey(prefix::SNAPSHOT, 7, 2));
    EXPECT_LT(MakeKey(prefix::SNAPSHOT, 7, 0xFFFFFFFF), MakeKey(prefix::SNAPSHOT, 8, 0));
}

TEST(DatabaseKeyTest, ParseRejectsOtherShapes) {
    EXPECT_FALSE(ParseIdKey(prefix::SNAPSHOT, MakeKey(prefix::VERSION, 1)).has_value());
    EXPECT_FALSE(ParseIdKey(prefix::SNAPSHOT, MakeKey(prefix::SNAPSHOT)).has_value());
    EXPECT_FALSE(ParseIdKey(prefix::SNAPSHOT, MakeKey(prefix::SNAPSHOT, 1, 0)).has_value());
}

TEST(DatabaseStatusTest, ToString) {
    EXPECT_EQ(Status::Ok().ToString(), "OK");
    EXPECT_EQ(Status::NotFound("k").ToString(), "NotFound: k");
    EXPECT_EQ(Status::Corruption("bad").ToString(), "Corruption: bad");
    EXPECT_TRUE(Status::Corruption().IsCorruption());
}

// ============================================================================
// MemoryDatabase
// ============================================================================

TEST_F(DatabaseTest, MemoryBasicOps) {
    MemoryDatabase db;
    ExerciseBasicOps(db);
    EXPECT_EQ(db.Size(), 1u);
}

TEST_F(DatabaseTest, MemoryBatchAndIteration) {
    MemoryDatabase db;
    ExerciseBatchAndIteration(db);
    EXPECT_EQ(db.Size(), 4u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSnapshot) {
    MemoryDatabase db;
    ASSERT_TRUE(db.Put(Slice("a"), Slice("1")).ok());
    auto it = db.NewIterator();
    ASSERT_TRUE(db.Put(Slice("b"), Slice("2")).ok());

    size_t count = 0;
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 1u);
}

// ============================================================================
// LevelDB
// ============================================================================

TEST_F(DatabaseTest, LevelDBOpenAndClose) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ASSERT_NE(db, nullptr);
}

TEST_F(DatabaseTest, LevelDBBasicOps) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ExerciseBasicOps(*db);
}

TEST_F(DatabaseTest, LevelDBBatchAndIteration) {
    auto [status, db] = OpenDatabase(testDir_ / "test_db");
    ASSERT_TRUE(status.ok()) << status.ToString();
    ExerciseBatchAndIteration(*db);
}

TEST_F(DatabaseTest, LevelDBPersistsAcrossReopen) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "persist");
        ASSERT_TRUE(status.ok());
        ASSERT_TRUE(db->Put(Slice("durable"), Slice("yes")).ok());
    }
    auto [status, db] = OpenDatabase(testDir_ / "persist");
    ASSERT_TRUE(status.ok());
    std::string value;
    ASSERT_TRUE(db->Get(Slice("durable"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, LevelDBErrorIfExists) {
    {
        auto [status, db] = OpenDatabase(testDir_ / "exists");
        ASSERT_TRUE(status.ok());
    }
    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "exists", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

