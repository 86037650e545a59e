// ARBITER - Resolution Records
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Records kept by the resolution protocol for every market round: the
// resolution itself, commitments, stakes, disputes, evidence challenges,
// delegate votes and the settlement computed at finalization.

#ifndef ARBITER_RESOLUTION_TYPES_H
#define ARBITER_RESOLUTION_TYPES_H

#include <arbiter/core/serialize.h>
#include <arbiter/core/types.h>

#include <cstdint>
#include <optional>
#include <string>

namespace arbiter {
namespace resolution {

// ============================================================================
// Call Context
// ============================================================================

/// Caller identity, sequencer-assigned time and funds attached to an operation
struct TxContext {
    Address sender;
    Timestamp now{0};
    Amount value{0};
};

// ============================================================================
// Status Enumerations
// ============================================================================

enum class ResolutionStatus : uint8_t {
    /// Proposed, not yet carried by stake or votes
    Pending,

    /// Advisory: support or a delegate supermajority backs the outcome
    Approved,

    /// Evidence challenge upheld, delegate override or winning dispute
    Rejected,
};

const char* ResolutionStatusToString(ResolutionStatus status);

enum class DisputeStatus : uint8_t {
    Active,
    Upheld,
    Rejected,
};

const char* DisputeStatusToString(DisputeStatus status);

// ============================================================================
// Resolution
// ============================================================================

struct Resolution {
    MarketId market{0};

    /// Proposal cycle of the market, starting at 0
    uint32_t round{0};
    Address proposer;
    uint32_t outcome{0};
    Timestamp proposalTime{0};
    Timestamp tradingEnd{0};

    /// Support and opposition stake
    Amount totalSupport{0};
    Amount totalSupportWeight{0};
    Amount totalOpposition{0};
    uint32_t supportCount{0};
    uint32_t oppositionCount{0};

    /// Delegate votes, by count and by snapshotted weight
    uint32_t legislatorSupportVotes{0};
    uint32_t legislatorOppositionVotes{0};
    uint64_t weightedSupportVotes{0};
    uint64_t weightedOppositionVotes{0};

    ResolutionStatus status{ResolutionStatus::Pending};
    bool disputed{false};
    bool finalized{false};

    std::string evidenceURI;
    Hash256 evidenceHash;

    /// Timing bonus applied to the proposer's own stake
    int64_t proposerBonusBps{0};
    bool priceReferenceRecorded{false};
    Timestamp finalizedAt{0};

    /// Accepting stake, evidence challenges and disputes
    bool IsOpen() const {
        return !finalized && status != ResolutionStatus::Rejected;
    }

    /// Settled as rejected; the market takes a fresh proposal round
    bool IsClosedRejected() const {
        return finalized && status == ResolutionStatus::Rejected;
    }

    MarketRound Key() const { return MarketRound{market, round}; }
};

// ============================================================================
// Commitments and Stakes
// ============================================================================

struct ResolutionCommit {
    Address committer;
    Hash256 hash;
    Timestamp commitTime{0};
    Amount bond{0};
    bool revealed{false};
    bool slashed{false};

    /// Revealed or slashed; a consumed commit can never be used again
    bool IsConsumed() const { return revealed || slashed; }
};

struct Stake {
    Amount amount{0};

    /// Amount scaled by the timing bonus (support only)
    Amount weight{0};
    Timestamp timestamp{0};
    bool withdrawn{false};
};

// ============================================================================
// Disputes
// ============================================================================

struct Dispute {
    Address challenger;
    uint32_t outcome{0};
    Amount bond{0};
    Amount supportStake{0};
    uint32_t supporterCount{0};
    uint32_t endorsements{0};
    DisputeStatus status{DisputeStatus::Active};
    std::string evidenceURI;
    Hash256 evidenceHash;
    Timestamp createdAt{0};

    /// Challenger payout or bond reclaim paid
    bool challengerClaimed{false};

    /// Set when the dispute is upheld: bond, bonus and the bond's share of
    /// the forfeited funds for the challenger; the backers' share on top of
    /// their principal
    Amount challengerPayout{0};
    Amount supporterRewardPool{0};

    Amount Pool() const { return bond + supportStake; }
};

// ============================================================================
// Evidence Challenges
// ============================================================================

struct EvidenceChallenge {
    Address challenger;
    std::string reason;
    Amount stake{0};
    Timestamp timestamp{0};
    bool resolved{false};
    bool upheld{false};
    Address resolver;
};

// ============================================================================
// Delegate Votes
// ============================================================================

struct LegislatorVoteCommit {
    Hash256 hash;
    Timestamp commitTime{0};
    bool revealed{false};

    /// Meaningful once revealed
    bool support{false};
    bool slashed{false};
};

// ============================================================================
// Settlement
// ============================================================================

/// Outcome of finalization and the reward rates derived from it
struct Settlement {
    bool approved{false};
    uint32_t finalOutcome{0};
    Amount fee{0};

    /// Surplus shared among supporters by weight (approved)
    Amount supportRewardPool{0};
    Amount supportWeight{0};

    /// Pool shared among opposition stakers by stake (rejected)
    Amount oppositionRewardPool{0};
    Amount oppositionTotal{0};

    std::optional<uint32_t> winningDispute;
    Timestamp finalizedAt{0};
};

// ============================================================================
// Events
// ============================================================================

enum class EventType : uint8_t {
    CommitSubmitted,
    ResolutionProposed,
    CommitSlashed,
    SupportAdded,
    OppositionAdded,
    ResolutionApproved,
    EvidenceChallenged,
    EvidenceChallengeResolved,
    VoteCommitted,
    VoteRevealed,
    LegislatorSlashed,
    VoteOverride,
    DisputeFiled,
    DisputeSupported,
    DisputeEndorsed,
    ResolutionFinalized,
    ResolutionRejected,
    DisputeUpheld,
    RewardClaimed,
    DisputeStakeReclaimed,
    ManagerGranted,
    ManagerRevoked,
    FeesWithdrawn,
    ExternalCallFailed,
    StoreWriteFailed,
};

const char* EventTypeToString(EventType type);

struct ResolutionEvent {
    EventType type{EventType::CommitSubmitted};
    MarketId market{0};
    uint32_t round{0};
    Address actor;
    Amount amount{0};

    /// Dispute or challenge index where relevant
    uint64_t index{0};
    std::string detail;
    Timestamp timestamp{0};
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Resolution& r) {
    s << r.market << r.round << r.proposer << r.outcome << r.proposalTime << r.tradingEnd;
    s << r.totalSupport << r.totalSupportWeight << r.totalOpposition;
    s << r.supportCount << r.oppositionCount;
    s << r.legislatorSupportVotes << r.legislatorOppositionVotes;
    s << r.weightedSupportVotes << r.weightedOppositionVotes;
    SerializeEnum(s, r.status);
    s << r.disputed << r.finalized << r.evidenceURI << r.evidenceHash;
    s << r.proposerBonusBps << r.priceReferenceRecorded << r.finalizedAt;
}

template<typename Stream>
void Unserialize(Stream& s, Resolution& r) {
    s >> r.market >> r.round >> r.proposer >> r.outcome >> r.proposalTime >> r.tradingEnd;
    s >> r.totalSupport >> r.totalSupportWeight >> r.totalOpposition;
    s >> r.supportCount >> r.oppositionCount;
    s >> r.legislatorSupportVotes >> r.legislatorOppositionVotes;
    s >> r.weightedSupportVotes >> r.weightedOppositionVotes;
    UnserializeEnum(s, r.status, ResolutionStatus::Rejected);
    s >> r.disputed >> r.finalized >> r.evidenceURI >> r.evidenceHash;
    s >> r.proposerBonusBps >> r.priceReferenceRecorded >> r.finalizedAt;
}

template<typename Stream>
void Serialize(Stream& s, const ResolutionCommit& c) {
    s << c.committer << c.hash << c.commitTime << c.bond << c.revealed << c.slashed;
}

template<typename Stream>
void Unserialize(Stream& s, ResolutionCommit& c) {
    s >> c.committer >> c.hash >> c.commitTime >> c.bond >> c.revealed >> c.slashed;
}

template<typename Stream>
void Serialize(Stream& s, const Dispute& d) {
    s << d.challenger << d.outcome << d.bond << d.supportStake;
    s << d.supporterCount << d.endorsements;
    SerializeEnum(s, d.status);
    s << d.evidenceURI << d.evidenceHash << d.createdAt;
    s << d.challengerClaimed << d.challengerPayout << d.supporterRewardPool;
}

template<typename Stream>
void Unserialize(Stream& s, Dispute& d) {
    s >> d.challenger >> d.outcome >> d.bond >> d.supportStake;
    s >> d.supporterCount >> d.endorsements;
    UnserializeEnum(s, d.status, DisputeStatus::Rejected);
    s >> d.evidenceURI >> d.evidenceHash >> d.createdAt;
    s >> d.challengerClaimed >> d.challengerPayout >> d.supporterRewardPool;
}

template<typename Stream>
void Serialize(Stream& s, const EvidenceChallenge& c) {
    s << c.challenger << c.reason << c.stake << c.timestamp;
    s << c.resolved << c.upheld << c.resolver;
}

template<typename Stream>
void Unserialize(Stream& s, EvidenceChallenge& c) {
    s >> c.challenger >> c.reason >> c.stake >> c.timestamp;
    s >> c.resolved >> c.upheld >> c.resolver;
}

template<typename Stream>
void Serialize(Stream& s, const Settlement& st) {
    s << st.approved << st.finalOutcome << st.fee;
    s << st.supportRewardPool << st.supportWeight;
    s << st.oppositionRewardPool << st.oppositionTotal;
    s << st.winningDispute << st.finalizedAt;
}

template<typename Stream>
void Unserialize(Stream& s, Settlement& st) {
    s >> st.approved >> st.finalOutcome >> st.fee;
    s >> st.supportRewardPool >> st.supportWeight;
    s >> st.oppositionRewardPool >> st.oppositionTotal;
    s >> st.winningDispute >> st.finalizedAt;
}

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_TYPES_H
