// ARBITER - Resolution Audit Store
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Persists an audit snapshot of each market round after every successful
// state-mutating operation. Records are overwritten with newer snapshots
// but never deleted; earlier rounds of a market stay readable.
//
// Snapshot value layout: serialized MarketSnapshot | SHA-256(serialized snapshot)
// Round index value: latest round number of the market (uint32)

#ifndef ARBITER_RESOLUTION_STORE_H
#define ARBITER_RESOLUTION_STORE_H

#include <arbiter/db/database.h>
#include <arbiter/resolution/types.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace arbiter {
namespace resolution {

/// Everything recorded for one round of a market
struct MarketSnapshot {
    std::optional<Resolution> resolution;
    std::vector<ResolutionCommit> commits;
    std::vector<Dispute> disputes;
    std::vector<EvidenceChallenge> challenges;
    std::optional<Settlement> settlement;
};

template<typename Stream>
void Serialize(Stream& s, const MarketSnapshot& snapshot) {
    s << snapshot.resolution << snapshot.commits << snapshot.disputes;
    s << snapshot.challenges << snapshot.settlement;
}

template<typename Stream>
void Unserialize(Stream& s, MarketSnapshot& snapshot) {
    s >> snapshot.resolution >> snapshot.commits >> snapshot.disputes;
    s >> snapshot.challenges >> snapshot.settlement;
}

class ResolutionStore {
public:
    static constexpr uint32_t SCHEMA_VERSION = 2;

    explicit ResolutionStore(std::unique_ptr<db::Database> db);

    /// Open a LevelDB-backed store at path and check its schema version
    static std::pair<db::Status, std::unique_ptr<ResolutionStore>> Open(
        const std::filesystem::path& path);

    /// Write the schema version, or verify the one already stored
    db::Status Initialize();

    /// Write the snapshot and advance the market's round index in one batch
    db::Status SaveSnapshot(const MarketRound& key, const MarketSnapshot& snapshot);

    /// NotFound when nothing is stored; Corruption on a checksum or decode failure
    db::Status LoadSnapshot(const MarketRound& key, MarketSnapshot& out) const;

    /// Highest round of the market with a stored snapshot
    std::optional<uint32_t> LatestRound(MarketId market) const;

    /// Markets with a stored snapshot, ascending
    std::vector<MarketId> ListMarkets() const;

    db::Database& GetDatabase() { return *db_; }

private:
    std::unique_ptr<db::Database> db_;
};

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_STORE_H
