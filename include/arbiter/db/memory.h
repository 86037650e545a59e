// ARBITER - In-Memory Database
// Copyright (c) 2024 ARBITER Developers
// MIT License

#ifndef ARBITER_DB_MEMORY_H
#define ARBITER_DB_MEMORY_H

#include <arbiter/db/database.h>

#include <map>
#include <mutex>

namespace arbiter {
namespace db {

/**
 * Map-backed database for tests and for running without a store path.
 */
class MemoryDatabase : public Database {
public:
    using Database::Get;
    using Database::Put;
    using Database::Write;
    using Database::NewIterator;

    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;

    /// The iterator walks a copy taken at creation time
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;

    size_t Size() const;

private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
};

class MemoryIterator : public Iterator {
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }

    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace db
} // namespace arbiter

#endif // ARBITER_DB_MEMORY_H
