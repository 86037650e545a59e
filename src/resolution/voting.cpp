// ARBITER - Delegate Commit-Reveal Voting
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/resolution/commitment.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

namespace arbiter {
namespace resolution {

namespace {

// Voting opens once the support window closes
Timestamp VoteCommitStart(const Resolution& r) { return r.proposalTime + SUPPORT_PERIOD; }
Timestamp VoteCommitEnd(const Resolution& r) { return VoteCommitStart(r) + VOTE_COMMIT_PERIOD; }
Timestamp VoteRevealEnd(const Resolution& r) { return VoteCommitEnd(r) + VOTE_REVEAL_PERIOD; }

} // namespace

Status ResolutionOracle::CommitLegislatorVote(const TxContext& ctx, MarketId market,
                                              const Hash256& voteHash) {
    return Execute("CommitLegislatorVote", ctx, market, Payable::No, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        const Resolution* resolution = FindResolution(round);
        if (!resolution) {
            return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
        }
        if (resolution->finalized) {
            return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
        }
        if (!IsSnapshotLegislator(round, ctx.sender)) {
            return Status::Error(ErrorCode::NOT_ELIGIBLE, "not in the delegate snapshot");
        }
        if (ctx.now <= VoteCommitStart(*resolution)) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "support period still open");
        }
        if (ctx.now > VoteCommitEnd(*resolution)) {
            return Status::Error(ErrorCode::WINDOW_CLOSED, "vote commit period over");
        }
        if (voteHash.IsNull()) {
            return Status::Error(ErrorCode::INVALID_COMMITMENT, "empty vote commitment");
        }
        const ParticipantKey key{round, ctx.sender};
        if (voteCommits_.count(key) > 0) {
            return Status::Error(ErrorCode::ALREADY_VOTED, "vote already committed");
        }

        LegislatorVoteCommit commit;
        commit.hash = voteHash;
        commit.commitTime = ctx.now;
        voteCommits_[key] = commit;

        Emit(EventType::VoteCommitted, round, ctx.sender);
        return Status::Ok();
    });
}

Status ResolutionOracle::RevealLegislatorVote(const TxContext& ctx, MarketId market,
                                              bool support, const Hash256& salt) {
    return Execute("RevealLegislatorVote", ctx, market, Payable::No, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        Resolution* resolution = FindResolution(round);
        if (!resolution) {
            return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
        }
        auto it = voteCommits_.find({round, ctx.sender});
        if (it == voteCommits_.end()) {
            return Status::Error(ErrorCode::COMMIT_NOT_FOUND, "no vote committed");
        }
        LegislatorVoteCommit& commit = it->second;
        if (commit.revealed) {
            return Status::Error(ErrorCode::ALREADY_VOTED, "vote already revealed");
        }
        if (ctx.now <= VoteCommitEnd(*resolution)) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "vote commit period still open");
        }
        if (ctx.now > VoteRevealEnd(*resolution)) {
            return Status::Error(ErrorCode::WINDOW_CLOSED, "vote reveal period over");
        }
        if (ComputeVoteCommitment(market, support, salt, ctx.sender) != commit.hash) {
            return Status::Error(ErrorCode::INVALID_COMMITMENT, "reveal does not match vote");
        }
        if (resolution->finalized) {
            return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
        }

        commit.revealed = true;
        commit.support = support;
        uint64_t weight = rosterSnapshots_[round][ctx.sender];
        if (support) {
            ++resolution->legislatorSupportVotes;
            resolution->weightedSupportVotes += weight;
        } else {
            ++resolution->legislatorOppositionVotes;
            resolution->weightedOppositionVotes += weight;
        }
        Emit(EventType::VoteRevealed, round, ctx.sender, 0, weight,
             support ? "support" : "oppose");

        // Active disputes take precedence over a delegate override
        if (HasActiveDispute(round) || !resolution->IsOpen()) {
            return Status::Ok();
        }
        const uint64_t cast =
            uint64_t(resolution->legislatorSupportVotes) + resolution->legislatorOppositionVotes;
        if (ReachesSupermajority(resolution->legislatorOppositionVotes, cast)) {
            resolution->status = ResolutionStatus::Rejected;
            notifier_.AdvancePhase(market, MarketPhase::Settlement, ctx.now);
            LOG_INFO(util::LogCategory::VOTING) << "delegates overrode " << round.ToString()
                                                << " resolution: rejected";
            Emit(EventType::VoteOverride, round, ctx.sender, 0,
                 resolution->legislatorOppositionVotes, "reject");
            Emit(EventType::ResolutionRejected, round, ctx.sender, 0, 0, "delegate override");
        } else if (resolution->status == ResolutionStatus::Pending &&
                   ReachesSupermajority(resolution->legislatorSupportVotes, cast)) {
            resolution->status = ResolutionStatus::Approved;
            LOG_INFO(util::LogCategory::VOTING) << "delegates overrode " << round.ToString()
                                                << " resolution: approved";
            Emit(EventType::VoteOverride, round, ctx.sender, 0,
                 resolution->legislatorSupportVotes, "approve");
            Emit(EventType::ResolutionApproved, round, ctx.sender, resolution->totalSupport);
        }
        return Status::Ok();
    });
}

Status ResolutionOracle::SlashNonRevealingLegislator(const TxContext& ctx, MarketId market,
                                                     const Address& legislator, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("SlashNonRevealingLegislator", ctx, market, Payable::No, [&]() -> Status {
        const Resolution* resolution = FindResolution(key);
        if (!resolution) {
            return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
        }
        auto it = voteCommits_.find({key, legislator});
        if (it == voteCommits_.end()) {
            return Status::Error(ErrorCode::COMMIT_NOT_FOUND, "no vote committed");
        }
        LegislatorVoteCommit& commit = it->second;
        if (commit.revealed) {
            return Status::Error(ErrorCode::COMMIT_CONSUMED, "vote was revealed");
        }
        if (commit.slashed) {
            return Status::Error(ErrorCode::ALREADY_SLASHED, "delegate already slashed");
        }
        if (ctx.now <= VoteRevealEnd(*resolution)) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "vote reveal period still open");
        }

        commit.slashed = true;
        ExternalCallResult result =
            notifier_.SlashReputation(market, legislator, LEGISLATOR_SLASH_BPS, ctx.now);

        LOG_INFO(util::LogCategory::VOTING)
            << "delegate " << legislator.ToHex() << " slashed on " << key.ToString()
            << (result ? "" : " (reputation call failed)");
        Emit(EventType::LegislatorSlashed, key, legislator, result.amount, 0,
             ctx.sender.ToHex());
        return Status::Ok();
    }, round);
}

} // namespace resolution
} // namespace arbiter
