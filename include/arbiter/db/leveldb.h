// ARBITER - LevelDB Wrapper
// Copyright (c) 2024 ARBITER Developers
// MIT License

#ifndef ARBITER_DB_LEVELDB_H
#define ARBITER_DB_LEVELDB_H

#include <arbiter/db/database.h>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

namespace arbiter {
namespace db {

/// Convert a LevelDB status into ours
Status FromLevelDB(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDB(iter_->status()); }

private:
    std::unique_ptr<leveldb::Iterator> iter_;
};

class LevelDBDatabase : public Database {
public:
    using Database::Get;
    using Database::Put;
    using Database::Write;
    using Database::NewIterator;

    /// Takes ownership of db, cache and filter
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter);
    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

private:
    // Destruction order matters: the DB must close before its cache and filter
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace arbiter

#endif // ARBITER_DB_LEVELDB_H
