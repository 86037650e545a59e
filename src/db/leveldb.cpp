// ARBITER - LevelDB Wrapper Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/db/leveldb.h>

#include <leveldb/write_batch.h>

namespace arbiter {
namespace db {

Status FromLevelDB(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

leveldb::ReadOptions ToLevelDB(const ReadOptions& options) {
    leveldb::ReadOptions ro;
    ro.verify_checksums = options.verify_checksums;
    return ro;
}

leveldb::WriteOptions ToLevelDB(const WriteOptions& options) {
    leveldb::WriteOptions wo;
    wo.sync = options.sync;
    return wo;
}

} // namespace

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                                 const leveldb::FilterPolicy* filter)
    : cache_(cache), filterPolicy_(filter), db_(db) {}

LevelDBDatabase::~LevelDBDatabase() {
    db_.reset();
}

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key,
                            std::string* value) {
    return FromLevelDB(db_->Get(ToLevelDB(options), ToLevelDB(key), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key,
                            const Slice& value) {
    return FromLevelDB(db_->Put(ToLevelDB(options), ToLevelDB(key), ToLevelDB(value)));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::string& value) {
        lb.Put(key, value);
    });
    return FromLevelDB(db_->Write(ToLevelDB(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
}

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.write_buffer_size = options.write_buffer_size;

    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }

    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }

    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            delete cache;
            delete filter;
            return {Status::IOError(ec.message()), nullptr};
        }
    }

    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        return {FromLevelDB(s), nullptr};
    }

    return {Status::Ok(), std::make_unique<LevelDBDatabase>(db, cache, filter)};
}

} // namespace db
} // namespace arbiter
