// ARBITER - Resolution Oracle
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Resolution and dispute settlement for prediction markets.
//
// Lifecycle of a market round:
//   CommitResolution -> ProposeResolution (reveal)
//   -> SupportResolution / OpposeResolution        (SUPPORT_PERIOD)
//   -> ChallengeEvidence / ResolveEvidenceChallenge (EVIDENCE_CHALLENGE_PERIOD)
//   -> CommitLegislatorVote -> RevealLegislatorVote (after the support window)
//   -> DisputeResolution / SupportDispute / EndorseDispute (DISPUTE_PERIOD)
//   -> FinalizeResolution
//   -> Claim* (each participant, any order)
//
// A market starts in round 0. Once a round is finalized as rejected the next
// commit opens round + 1; every record and ledger account of earlier rounds
// is kept, and their claims stay payable by passing the round explicitly.
// Operations without a round argument act on the market's current round.
//
// Every state-mutating operation is atomic: it either succeeds completely or
// returns an error and leaves all state untouched. Calls are serialized by a
// non-reentrant lock; a call that re-enters from an external callback fails
// with REENTRANT_CALL.

#ifndef ARBITER_RESOLUTION_ORACLE_H
#define ARBITER_RESOLUTION_ORACLE_H

#include <arbiter/core/status.h>
#include <arbiter/ledger/treasury.h>
#include <arbiter/resolution/interfaces.h>
#include <arbiter/resolution/notifier.h>
#include <arbiter/resolution/options.h>
#include <arbiter/resolution/params.h>
#include <arbiter/resolution/store.h>
#include <arbiter/resolution/types.h>
#include <arbiter/util/sync.h>

#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace arbiter {
namespace resolution {

class ResolutionOracle {
public:
    /// External systems; priceOracle may be null
    struct Collaborators {
        IMarket* market{nullptr};
        ILegislatorRoster* roster{nullptr};
        IReputationLedger* reputation{nullptr};
        IPriceOracle* priceOracle{nullptr};
        ledger::IPayoutSink* payouts{nullptr};
    };

    using EventListener = std::function<void(const ResolutionEvent&)>;

    /// Round selector; nullopt means the market's current round
    using Round = std::optional<uint32_t>;

    /// @throws std::invalid_argument if a required collaborator is missing
    explicit ResolutionOracle(const Collaborators& collaborators,
                              ProtocolOptions options = ProtocolOptions());

    ResolutionOracle(const ResolutionOracle&) = delete;
    ResolutionOracle& operator=(const ResolutionOracle&) = delete;

    // ========================================================================
    // Proposal
    // ========================================================================

    /**
     * Bond ctx.value behind a hidden outcome. Opens the next round when the
     * current one was finalized as rejected.
     */
    Status CommitResolution(const TxContext& ctx, MarketId market, const Hash256& commitHash);

    /**
     * Reveal a committed outcome. ctx.value is the proposal stake and becomes
     * the proposer's support. The commit bond is refunded.
     */
    Status ProposeResolution(const TxContext& ctx, MarketId market, uint32_t outcome,
                             const std::string& evidenceURI, const Hash256& evidenceHash,
                             const Hash256& salt);

    /// Burn the bond of a commit that missed its reveal deadline; the caller earns a bounty
    Status SlashUnrevealedCommit(const TxContext& ctx, MarketId market, const Address& committer,
                                 Round round = std::nullopt);

    // ========================================================================
    // Staking
    // ========================================================================

    Status SupportResolution(const TxContext& ctx, MarketId market);
    Status OpposeResolution(const TxContext& ctx, MarketId market);

    // ========================================================================
    // Evidence Challenges
    // ========================================================================

    Status ChallengeEvidence(const TxContext& ctx, MarketId market, const std::string& reason);

    /// Delegates and oracle managers only
    Status ResolveEvidenceChallenge(const TxContext& ctx, MarketId market, size_t index,
                                    bool upheld);

    // ========================================================================
    // Delegate Voting
    // ========================================================================

    Status CommitLegislatorVote(const TxContext& ctx, MarketId market, const Hash256& voteHash);
    Status RevealLegislatorVote(const TxContext& ctx, MarketId market, bool support,
                                const Hash256& salt);
    Status SlashNonRevealingLegislator(const TxContext& ctx, MarketId market,
                                       const Address& legislator, Round round = std::nullopt);

    // ========================================================================
    // Disputes
    // ========================================================================

    /// ctx.value is the bond and must cover GetRequiredDisputeBond
    Status DisputeResolution(const TxContext& ctx, MarketId market, uint32_t alternativeOutcome,
                             const std::string& evidenceURI, const Hash256& evidenceHash);
    Status SupportDispute(const TxContext& ctx, MarketId market, size_t index);
    Status EndorseDispute(const TxContext& ctx, MarketId market, size_t index);

    // ========================================================================
    // Finalization and Claims
    // ========================================================================

    /// A rejected resolution settles as soon as its evidence challenges are resolved
    Status FinalizeResolution(const TxContext& ctx, MarketId market);

    // Claims finalize the round first when the finalization buffer has passed
    Status ClaimResolutionReward(const TxContext& ctx, MarketId market,
                                 Round round = std::nullopt);
    Status ClaimOppositionReward(const TxContext& ctx, MarketId market,
                                 Round round = std::nullopt);
    Status ClaimDisputeReward(const TxContext& ctx, MarketId market, size_t index,
                              Round round = std::nullopt);
    Status ReclaimDisputeStake(const TxContext& ctx, MarketId market, size_t index,
                               Round round = std::nullopt);

    // ========================================================================
    // Oracle Managers
    // ========================================================================

    Status GrantManager(const TxContext& ctx, const Address& who);
    Status RevokeManager(const TxContext& ctx, const Address& who);
    Status WithdrawProtocolFees(const TxContext& ctx, const Address& to, Amount amount);
    bool IsManager(const Address& who) const;

    // ========================================================================
    // Views
    // ========================================================================

    /// Round new activity on the market applies to
    uint32_t GetCurrentRound(MarketId market) const;

    std::optional<Resolution> GetResolution(MarketId market, Round round = std::nullopt) const;
    std::optional<ResolutionCommit> GetCommit(MarketId market, const Address& committer,
                                              Round round = std::nullopt) const;
    std::optional<Stake> GetSupportStake(MarketId market, const Address& who,
                                         Round round = std::nullopt) const;
    std::optional<Stake> GetOppositionStake(MarketId market, const Address& who,
                                            Round round = std::nullopt) const;
    std::vector<Dispute> GetDisputes(MarketId market, Round round = std::nullopt) const;
    std::optional<Stake> GetDisputeStake(MarketId market, size_t index, const Address& who,
                                         Round round = std::nullopt) const;
    bool HasEndorsed(MarketId market, size_t index, const Address& legislator,
                     Round round = std::nullopt) const;
    std::vector<EvidenceChallenge> GetEvidenceChallenges(MarketId market,
                                                         Round round = std::nullopt) const;
    std::optional<LegislatorVoteCommit> GetVoteCommit(MarketId market,
                                                      const Address& legislator,
                                                      Round round = std::nullopt) const;
    bool IsEligibleLegislator(MarketId market, const Address& legislator,
                              Round round = std::nullopt) const;
    std::optional<Settlement> GetSettlement(MarketId market, Round round = std::nullopt) const;

    /// Bond a dispute filed at `now` must attach
    std::optional<Amount> GetRequiredDisputeBond(MarketId market, Timestamp now) const;
    std::optional<uint64_t> CalculateResolutionScore(MarketId market) const;
    std::optional<uint64_t> CalculateDisputeScore(MarketId market, size_t index) const;

    /// Price reference bound at proposal time (price-linked markets)
    std::optional<RecordedPrice> GetRecordedPrice(MarketId market);

    /// Copy of the ledger taken under the lock
    ledger::TreasuryLedger GetLedger() const;
    MarketSnapshot GetSnapshot(MarketId market, Round round = std::nullopt) const;

    // ========================================================================
    // Events, Store and Ledger Hooks
    // ========================================================================

    /// Listeners run after the operation completes and the lock is released
    void OnEvent(EventListener listener);

    /// Most recent events, oldest first
    std::vector<ResolutionEvent> GetRecentEvents(size_t max = MAX_EVENT_JOURNAL) const;

    /// Attach an audit store (not owned); null detaches
    void SetStore(ResolutionStore* store);

    void SetBalanceProvider(ledger::TreasuryLedger::BalanceProvider provider);

private:
    using ParticipantKey = std::pair<MarketRound, Address>;
    using DisputeKey = std::tuple<MarketRound, size_t, Address>;

    enum class Payable { No, Yes };

    /**
     * Run one operation: take the lock, check solvency and the attached
     * value, run body, persist the snapshot of the round it acted on and
     * dispatch events.
     */
    Status Execute(const char* operation, const TxContext& ctx,
                   std::optional<MarketId> market, Payable payable,
                   const std::function<Status()>& body, Round round = std::nullopt);

    /// Queue an event stamped with the running operation's time
    void Emit(EventType type, const MarketRound& key, const Address& actor, Amount amount = 0,
              uint64_t index = 0, const std::string& detail = "");
    void PersistSnapshot(const MarketRound& key, Timestamp now);

    // Rounds
    MarketRound CurrentRound(MarketId market) const;
    MarketRound SelectRound(MarketId market, Round round) const;

    /// Round a new commit or reveal belongs to
    MarketRound ProposalRound(MarketId market) const;

    // Lookups
    Resolution* FindResolution(const MarketRound& key);
    const Resolution* FindResolution(const MarketRound& key) const;
    Dispute* FindDispute(const MarketRound& key, size_t index);
    bool IsSnapshotLegislator(const MarketRound& key, const Address& who) const;
    bool IsCurrentLegislator(const Address& who);
    bool HasActiveDispute(const MarketRound& key) const;
    bool HasUnresolvedChallenge(const MarketRound& key) const;
    std::optional<MarketPhase> QueryPhase(MarketId market);
    std::optional<MarketInfo> QueryMarketInfo(MarketId market);
    MarketSnapshot BuildSnapshot(const MarketRound& key) const;

    // Funds reserved under a round that no settlement pool may touch
    Amount UnconsumedBonds(const MarketRound& key) const;
    Amount ActiveDisputePools(const MarketRound& key) const;

    // Staking and settlement internals
    Status AddStake(const TxContext& ctx, MarketId market, bool support);
    Status FinalizeInternal(const MarketRound& key, Timestamp now);
    void SettleApproved(Resolution& resolution, Timestamp now);
    void SettleRejected(Resolution& resolution, std::optional<size_t> winner, Timestamp now);
    Status EnsureFinalized(const MarketRound& key, Timestamp now);
    Status Pay(const MarketRound& key, const Address& to, Amount amount,
               ledger::PayoutKind kind);

    Collaborators collaborators_;
    std::set<Address> managers_;

    ledger::TreasuryLedger ledger_;
    ExternalNotifier notifier_;

    // Current round per market; absent means round 0
    std::map<MarketId, uint32_t> rounds_;

    // Per-round protocol state
    std::map<MarketRound, Resolution> resolutions_;
    std::map<ParticipantKey, ResolutionCommit> commits_;
    std::map<Address, Timestamp> lastCommitTime_;
    std::map<ParticipantKey, Stake> supportStakes_;
    std::map<ParticipantKey, Stake> oppositionStakes_;
    std::map<MarketRound, std::vector<Dispute>> disputes_;
    std::map<DisputeKey, Stake> disputeStakes_;
    std::set<DisputeKey> endorsements_;
    std::map<MarketRound, std::vector<EvidenceChallenge>> challenges_;
    std::map<MarketRound, std::map<Address, uint64_t>> rosterSnapshots_;
    std::map<ParticipantKey, LegislatorVoteCommit> voteCommits_;
    std::map<MarketRound, Settlement> settlements_;

    // Events queued by the running operation
    std::vector<ResolutionEvent> pending_;
    Timestamp operationTime_{0};
    std::deque<ResolutionEvent> journal_;
    std::vector<EventListener> listeners_;

    ResolutionStore* store_{nullptr};

    mutable util::NonReentrantMutex mutex_;
};

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_ORACLE_H
