// ARBITER - Evidence Challenges
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/util/logging.h>

#include <algorithm>

namespace arbiter {
namespace resolution {

Status ResolutionOracle::ChallengeEvidence(const TxContext& ctx, MarketId market,
                                           const std::string& reason) {
    return Execute("ChallengeEvidence", ctx, market, Payable::Yes, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        Resolution* resolution = FindResolution(round);
        if (!resolution) {
            return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
        }
        if (resolution->finalized) {
            return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
        }
        if (!resolution->IsOpen()) {
            return Status::Error(ErrorCode::NOT_PENDING, "resolution rejected");
        }
        if (ctx.now > resolution->proposalTime + EVIDENCE_CHALLENGE_PERIOD) {
            return Status::Error(ErrorCode::WINDOW_CLOSED, "challenge period over");
        }
        if (reason.empty() || reason.size() > MAX_CHALLENGE_REASON_LENGTH) {
            return Status::Error(ErrorCode::INVALID_REASON, "reason length");
        }
        if (ctx.value < MIN_CHALLENGE_STAKE) {
            return Status::Error(ErrorCode::INSUFFICIENT_VALUE, "challenge stake below minimum");
        }
        auto existing = challenges_.find(round);
        if (existing != challenges_.end() && existing->second.size() >= MAX_EVIDENCE_CHALLENGES) {
            return Status::Error(ErrorCode::LIMIT_REACHED, "too many evidence challenges");
        }

        Status received = ledger_.Receive(round, ctx.value);
        if (!received.ok()) {
            return received;
        }

        EvidenceChallenge challenge;
        challenge.challenger = ctx.sender;
        challenge.reason = reason;
        challenge.stake = ctx.value;
        challenge.timestamp = ctx.now;
        auto& challenges = challenges_[round];
        challenges.push_back(challenge);

        LOG_INFO(util::LogCategory::EVIDENCE) << "evidence of " << round.ToString()
                                              << " challenged by " << ctx.sender.ToHex();
        Emit(EventType::EvidenceChallenged, round, ctx.sender, ctx.value,
             challenges.size() - 1, reason);
        return Status::Ok();
    });
}

Status ResolutionOracle::ResolveEvidenceChallenge(const TxContext& ctx, MarketId market,
                                                  size_t index, bool upheld) {
    return Execute("ResolveEvidenceChallenge", ctx, market, Payable::No, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        auto it = challenges_.find(round);
        if (it == challenges_.end() || index >= it->second.size()) {
            return Status::Error(ErrorCode::CHALLENGE_NOT_FOUND, "no such challenge");
        }
        EvidenceChallenge& challenge = it->second[index];
        if (challenge.resolved) {
            return Status::Error(ErrorCode::ALREADY_RESOLVED, "challenge already resolved");
        }
        if (!IsSnapshotLegislator(round, ctx.sender) && managers_.count(ctx.sender) == 0 &&
            !IsCurrentLegislator(ctx.sender)) {
            return Status::Error(ErrorCode::UNAUTHORIZED, "caller cannot resolve challenges");
        }

        Amount payout = challenge.stake;
        if (upheld) {
            // Double the stake, out of funds no other party has a claim on
            Amount reserved = UnconsumedBonds(round) + ActiveDisputePools(round);
            for (size_t i = 0; i < it->second.size(); ++i) {
                if (i != index && !it->second[i].resolved) {
                    reserved += it->second[i].stake;
                }
            }
            Amount available = std::max<Amount>(0, ledger_.EarmarkedFor(round) - reserved);
            payout = std::min(challenge.stake * 2, std::max(available, challenge.stake));
        }

        challenge.resolved = true;
        challenge.upheld = upheld;
        challenge.resolver = ctx.sender;
        Status paid = Pay(round, challenge.challenger, payout,
                          upheld ? ledger::PayoutKind::Reward : ledger::PayoutKind::Refund);
        if (!paid.ok()) {
            challenge.resolved = false;
            challenge.upheld = false;
            challenge.resolver = Address();
            return paid;
        }

        if (upheld) {
            Resolution* resolution = FindResolution(round);
            if (resolution && resolution->IsOpen()) {
                resolution->status = ResolutionStatus::Rejected;
                notifier_.AdvancePhase(market, MarketPhase::Settlement, ctx.now);
                LOG_INFO(util::LogCategory::EVIDENCE)
                    << round.ToString() << " resolution rejected on evidence challenge "
                    << index;
                Emit(EventType::ResolutionRejected, round, ctx.sender, 0, index,
                     "evidence challenge upheld");
            }
        }

        Emit(EventType::EvidenceChallengeResolved, round, challenge.challenger, payout, index,
             upheld ? "upheld" : "rejected");
        return Status::Ok();
    });
}

} // namespace resolution
} // namespace arbiter
