// ARBITER - Resolution Audit Store
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/store.h>

#include <arbiter/core/serialize.h>
#include <arbiter/crypto/hash.h>
#include <arbiter/util/logging.h>

#include <ios>

namespace arbiter {
namespace resolution {

namespace {

std::string Seal(const DataStream& payload) {
    Hash256 checksum = SHA256Hash(payload.data(), payload.size());
    std::string value = payload.Str();
    value.append(reinterpret_cast<const char*>(checksum.data()), Hash256::SIZE);
    return value;
}

/// Strip and verify the checksum; false when the value was tampered with
bool Unseal(const std::string& value, DataStream& payload) {
    if (value.size() < Hash256::SIZE) {
        return false;
    }
    size_t bodySize = value.size() - Hash256::SIZE;
    const Byte* body = reinterpret_cast<const Byte*>(value.data());
    Hash256 expected(body + bodySize, Hash256::SIZE);
    if (SHA256Hash(body, bodySize) != expected) {
        return false;
    }
    payload = DataStream(body, bodySize);
    return true;
}

} // namespace

ResolutionStore::ResolutionStore(std::unique_ptr<db::Database> db)
    : db_(std::move(db)) {}

std::pair<db::Status, std::unique_ptr<ResolutionStore>> ResolutionStore::Open(
    const std::filesystem::path& path) {
    auto [status, database] = db::OpenDatabase(path);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "cannot open store at " << path.string()
                                            << ": " << status.ToString();
        return {status, nullptr};
    }

    auto store = std::make_unique<ResolutionStore>(std::move(database));
    db::Status init = store->Initialize();
    if (!init.ok()) {
        return {init, nullptr};
    }
    LOG_INFO(util::LogCategory::STORE) << "opened audit store at " << path.string();
    return {db::Status::Ok(), std::move(store)};
}

db::Status ResolutionStore::Initialize() {
    const std::string key = db::MakeKey(db::prefix::VERSION);
    std::string value;
    db::Status status = db_->Get(key, &value);
    if (status.IsNotFound()) {
        DataStream ss;
        ss << SCHEMA_VERSION;
        return db_->Put(key, ss.Str());
    }
    if (!status.ok()) {
        return status;
    }

    try {
        DataStream ss(value);
        uint32_t version = 0;
        ss >> version;
        if (version != SCHEMA_VERSION) {
            return db::Status::NotSupported("store schema version " + std::to_string(version));
        }
    } catch (const std::ios_base::failure& e) {
        return db::Status::Corruption(std::string("schema version: ") + e.what());
    }
    return db::Status::Ok();
}

db::Status ResolutionStore::SaveSnapshot(const MarketRound& key,
                                         const MarketSnapshot& snapshot) {
    DataStream ss;
    ss << snapshot;

    db::WriteBatch batch;
    batch.Put(db::MakeKey(db::prefix::SNAPSHOT, key.market, key.round), Seal(ss));

    // Late claims on an earlier round must not move the index back
    std::optional<uint32_t> latest = LatestRound(key.market);
    if (!latest || *latest < key.round) {
        DataStream index;
        index << key.round;
        batch.Put(db::MakeKey(db::prefix::ROUND, key.market), index.Str());
    }
    return db_->Write(&batch);
}

db::Status ResolutionStore::LoadSnapshot(const MarketRound& key, MarketSnapshot& out) const {
    std::string value;
    db::Status status =
        db_->Get(db::MakeKey(db::prefix::SNAPSHOT, key.market, key.round), &value);
    if (!status.ok()) {
        return status;
    }

    DataStream payload;
    if (!Unseal(value, payload)) {
        LOG_ERROR(util::LogCategory::STORE) << "checksum mismatch for market "
                                            << key.ToString();
        return db::Status::Corruption("snapshot checksum mismatch");
    }

    MarketSnapshot snapshot;
    try {
        payload >> snapshot;
    } catch (const std::ios_base::failure& e) {
        return db::Status::Corruption(std::string("snapshot decode: ") + e.what());
    }
    if (!payload.empty()) {
        return db::Status::Corruption("trailing bytes after snapshot");
    }
    out = std::move(snapshot);
    return db::Status::Ok();
}

std::optional<uint32_t> ResolutionStore::LatestRound(MarketId market) const {
    std::string value;
    db::Status status = db_->Get(db::MakeKey(db::prefix::ROUND, market), &value);
    if (!status.ok()) {
        if (!status.IsNotFound()) {
            LOG_ERROR(util::LogCategory::STORE) << "round index of market " << market << ": "
                                                << status.ToString();
        }
        return std::nullopt;
    }
    try {
        DataStream ss(value);
        uint32_t round = 0;
        ss >> round;
        return round;
    } catch (const std::ios_base::failure& e) {
        LOG_ERROR(util::LogCategory::STORE) << "round index of market " << market << ": "
                                            << e.what();
        return std::nullopt;
    }
}

std::vector<MarketId> ResolutionStore::ListMarkets() const {
    std::vector<MarketId> markets;
    const std::string prefix = db::MakeKey(db::prefix::ROUND);

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        if (auto market = db::ParseIdKey(db::prefix::ROUND, it->key())) {
            markets.push_back(*market);
        }
    }
    if (!it->status().ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "listing markets: " << it->status().ToString();
    }
    return markets;
}

} // namespace resolution
} // namespace arbiter
