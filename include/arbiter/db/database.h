// ARBITER - Database Abstraction Layer
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Key-value storage interface used by the resolution audit store.
// LevelDBDatabase persists to disk; MemoryDatabase keeps everything in a map.

#ifndef ARBITER_DB_DATABASE_H
#define ARBITER_DB_DATABASE_H

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbiter {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    Code code_;
    std::string message_;
};

// ============================================================================
// Slice - non-owning reference to a byte range
// ============================================================================

class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    /// Create the database if it doesn't exist
    bool create_if_missing = true;

    /// Fail if the database already exists
    bool error_if_exists = false;

    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;

    /// LRU block cache size (0 disables the cache)
    size_t block_cache_size = 8 * 1024 * 1024;

    /// Bloom filter bits per key (0 disables the filter)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
};

struct WriteOptions {
    /// Sync write to disk before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch - atomic batch of writes
// ============================================================================

class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }

private:
    std::vector<std::pair<std::string, std::string>> operations_;
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;

    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    /// Apply a batch of writes atomically
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open a LevelDB database at the specified path.
 * @return Pair of (status, database pointer); the pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

// ============================================================================
// Keys
// ============================================================================

namespace prefix {
    constexpr char SNAPSHOT = 's';   // market id, round -> snapshot of that round
    constexpr char ROUND = 'r';      // market id -> latest round with a snapshot
    constexpr char VERSION = 'V';    // -> store schema version
}

/// Prefixed key with a big-endian id so that iteration follows id order
inline std::string MakeKey(char prefix, uint64_t id) {
    std::string result(1, prefix);
    for (int shift = 56; shift >= 0; shift -= 8) {
        result.push_back(static_cast<char>((id >> shift) & 0xFF));
    }
    return result;
}

/// Id followed by a big-endian sub-id (market, round)
inline std::string MakeKey(char prefix, uint64_t id, uint32_t sub) {
    std::string result = MakeKey(prefix, id);
    for (int shift = 24; shift >= 0; shift -= 8) {
        result.push_back(static_cast<char>((sub >> shift) & 0xFF));
    }
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

/// Inverse of MakeKey(prefix, id); nullopt if the key has another shape
std::optional<uint64_t> ParseIdKey(char prefix, const Slice& key);

} // namespace db
} // namespace arbiter

#endif // ARBITER_DB_DATABASE_H
