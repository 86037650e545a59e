// ARBITER - Commit-Reveal Proposals
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/commitment.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

namespace arbiter {
namespace resolution {

// ============================================================================
// Commit
// ============================================================================

Status ResolutionOracle::CommitResolution(const TxContext& ctx, MarketId market,
                                          const Hash256& commitHash) {
    return Execute("CommitResolution", ctx, market, Payable::Yes, [&]() -> Status {
        if (commitHash.IsNull()) {
            return Status::Error(ErrorCode::INVALID_COMMITMENT, "empty commitment");
        }
        if (ctx.value < MIN_COMMIT_BOND) {
            return Status::Error(ErrorCode::INSUFFICIENT_VALUE, "bond below minimum");
        }
        const MarketRound round = ProposalRound(market);
        if (FindResolution(round)) {
            return Status::Error(ErrorCode::RESOLUTION_EXISTS, "market already has a resolution");
        }

        auto phase = QueryPhase(market);
        if (!phase) {
            return Status::Error(ErrorCode::MARKET_UNAVAILABLE, "market phase unknown");
        }
        if (*phase != MarketPhase::Settlement) {
            return Status::Error(ErrorCode::WRONG_MARKET_PHASE,
                                 std::string("market is in phase ") + MarketPhaseToString(*phase));
        }

        const ParticipantKey key{round, ctx.sender};
        auto existing = commits_.find(key);
        if (existing != commits_.end() && !existing->second.IsConsumed()) {
            return Status::Error(ErrorCode::COMMIT_EXISTS, "commit already pending");
        }
        auto last = lastCommitTime_.find(ctx.sender);
        if (last != lastCommitTime_.end() && ctx.now - last->second < COMMIT_COOLDOWN) {
            return Status::Error(ErrorCode::COMMIT_COOLDOWN, "commit cooldown active");
        }

        Status received = ledger_.Receive(round, ctx.value);
        if (!received.ok()) {
            return received;
        }

        ResolutionCommit commit;
        commit.committer = ctx.sender;
        commit.hash = commitHash;
        commit.commitTime = ctx.now;
        commit.bond = ctx.value;
        commits_[key] = commit;
        lastCommitTime_[ctx.sender] = ctx.now;
        rounds_[market] = round.round;

        LOG_DEBUG(util::LogCategory::RESOLUTION) << "commit on " << round.ToString() << " by "
                                                 << ctx.sender.ToHex();
        Emit(EventType::CommitSubmitted, round, ctx.sender, ctx.value);
        return Status::Ok();
    });
}

// ============================================================================
// Reveal
// ============================================================================

Status ResolutionOracle::ProposeResolution(const TxContext& ctx, MarketId market,
                                           uint32_t outcome, const std::string& evidenceURI,
                                           const Hash256& evidenceHash, const Hash256& salt) {
    return Execute("ProposeResolution", ctx, market, Payable::Yes, [&]() -> Status {
        const MarketRound round = ProposalRound(market);
        auto commitIt = commits_.find({round, ctx.sender});
        if (commitIt == commits_.end()) {
            return Status::Error(ErrorCode::COMMIT_NOT_FOUND, "no commit to reveal");
        }
        ResolutionCommit& commit = commitIt->second;
        if (commit.IsConsumed()) {
            return Status::Error(ErrorCode::COMMIT_CONSUMED, "commit already used");
        }
        if (ctx.now < commit.commitTime + MIN_REVEAL_DELAY) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "reveal too early");
        }
        if (ctx.now > commit.commitTime + MAX_REVEAL_DELAY) {
            return Status::Error(ErrorCode::WINDOW_CLOSED, "reveal deadline passed");
        }
        if (ComputeResolutionCommitment(outcome, evidenceURI, evidenceHash, salt, ctx.sender) !=
            commit.hash) {
            return Status::Error(ErrorCode::INVALID_COMMITMENT, "reveal does not match commit");
        }

        auto info = QueryMarketInfo(market);
        if (!info) {
            return Status::Error(ErrorCode::MARKET_UNAVAILABLE, "market info unavailable");
        }
        if (outcome >= info->outcomeCount) {
            return Status::Error(ErrorCode::INVALID_OUTCOME, "outcome out of range");
        }
        if (evidenceURI.empty() || evidenceURI.size() > MAX_EVIDENCE_URI_LENGTH) {
            return Status::Error(ErrorCode::INVALID_EVIDENCE, "evidence URI length");
        }
        if (evidenceHash.IsNull()) {
            return Status::Error(ErrorCode::INVALID_EVIDENCE, "empty evidence hash");
        }
        if (ctx.value < MIN_PROPOSAL_STAKE) {
            return Status::Error(ErrorCode::INSUFFICIENT_VALUE, "proposal stake below minimum");
        }
        if (ctx.now < info->tradingEnd) {
            return Status::Error(ErrorCode::TRADING_NOT_ENDED, "trading still open");
        }
        if (info->resolved) {
            return Status::Error(ErrorCode::WRONG_MARKET_PHASE, "market already resolved");
        }
        if (FindResolution(round)) {
            return Status::Error(ErrorCode::RESOLUTION_EXISTS, "market already has a resolution");
        }

        // The refund is the only step that can still fail
        Status refunded = Pay(round, ctx.sender, commit.bond, ledger::PayoutKind::Refund);
        if (!refunded.ok()) {
            return refunded;
        }
        commit.revealed = true;

        Status received = ledger_.Receive(round, ctx.value);
        if (!received.ok()) {
            LOG_ERROR(util::LogCategory::LEDGER) << "proposal stake not recorded: "
                                                 << received.ToString();
            return received;
        }

        Resolution& resolution = resolutions_[round];
        resolution.market = market;
        resolution.round = round.round;
        resolution.proposer = ctx.sender;
        resolution.outcome = outcome;
        resolution.proposalTime = ctx.now;
        resolution.tradingEnd = info->tradingEnd;
        resolution.evidenceURI = evidenceURI;
        resolution.evidenceHash = evidenceHash;
        resolution.proposerBonusBps = CalculateProposerBonusBps(info->tradingEnd, ctx.now);

        Stake& stake = supportStakes_[{round, ctx.sender}];
        stake.amount = ctx.value;
        stake.weight = ApplyBonus(ctx.value, resolution.proposerBonusBps);
        stake.timestamp = ctx.now;
        resolution.totalSupport = stake.amount;
        resolution.totalSupportWeight = stake.weight;
        resolution.supportCount = 1;

        ledger_.RecordResolution();
        Emit(EventType::ResolutionProposed, round, ctx.sender, ctx.value, outcome, evidenceURI);

        notifier_.SnapshotRoster(market, *collaborators_.roster, rosterSnapshots_[round], ctx.now);
        resolution.priceReferenceRecorded =
            notifier_.RecordPriceReference(market, ctx.now).amount > 0;
        notifier_.AdvancePhase(market, MarketPhase::Proposed, ctx.now);
        notifier_.AdvancePhase(market, MarketPhase::DisputeWindow, ctx.now);

        LOG_INFO(util::LogCategory::RESOLUTION)
            << round.ToString() << " proposed outcome " << outcome << " by "
            << ctx.sender.ToHex() << " with " << FormatAmount(ctx.value) << " stake, "
            << rosterSnapshots_[round].size() << " eligible delegate(s)";
        return Status::Ok();
    });
}

// ============================================================================
// Slash Unrevealed
// ============================================================================

Status ResolutionOracle::SlashUnrevealedCommit(const TxContext& ctx, MarketId market,
                                               const Address& committer, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("SlashUnrevealedCommit", ctx, market, Payable::No, [&]() -> Status {
        auto it = commits_.find({key, committer});
        if (it == commits_.end()) {
            return Status::Error(ErrorCode::COMMIT_NOT_FOUND, "no such commit");
        }
        ResolutionCommit& commit = it->second;
        if (commit.slashed) {
            return Status::Error(ErrorCode::ALREADY_SLASHED, "commit already slashed");
        }
        if (commit.revealed) {
            return Status::Error(ErrorCode::COMMIT_CONSUMED, "commit was revealed");
        }
        if (ctx.now <= commit.commitTime + MAX_REVEAL_DELAY) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "reveal deadline not passed");
        }
        if (ledger_.EarmarkedFor(key) < commit.bond) {
            return Status::Error(ErrorCode::INSUFFICIENT_FUNDS, "bond not covered");
        }

        Amount bounty = ApplyBps(commit.bond, UNREVEALED_BOUNTY_BPS);
        commit.slashed = true;
        if (bounty > 0) {
            Status paid = Pay(key, ctx.sender, bounty, ledger::PayoutKind::Bounty);
            if (!paid.ok()) {
                commit.slashed = false;
                return paid;
            }
        }

        Status collected = ledger_.CollectFee(key, commit.bond - bounty);
        if (!collected.ok()) {
            LOG_ERROR(util::LogCategory::LEDGER) << "slashed bond not collected: "
                                                 << collected.ToString();
        }
        ledger_.RecordSlashed(commit.bond);

        LOG_INFO(util::LogCategory::RESOLUTION)
            << "slashed unrevealed commit of " << committer.ToHex() << " on " << key.ToString()
            << ", bounty " << FormatAmount(bounty);
        Emit(EventType::CommitSlashed, key, committer, commit.bond, 0, ctx.sender.ToHex());
        return Status::Ok();
    }, round);
}

} // namespace resolution
} // namespace arbiter
