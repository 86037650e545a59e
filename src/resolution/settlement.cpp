// ARBITER - Finalization and Claims
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

#include <algorithm>

namespace arbiter {
namespace resolution {

// ============================================================================
// Finalization
// ============================================================================

Status ResolutionOracle::FinalizeResolution(const TxContext& ctx, MarketId market) {
    return Execute("FinalizeResolution", ctx, market, Payable::No, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        const Resolution* resolution = FindResolution(round);
        if (!resolution) {
            return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
        }
        if (resolution->finalized) {
            return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
        }
        if (ctx.now <= resolution->proposalTime + DISPUTE_PERIOD) {
            return Status::Error(ErrorCode::WINDOW_NOT_OPEN, "dispute period still open");
        }
        if (HasUnresolvedChallenge(round)) {
            return Status::Error(ErrorCode::CHALLENGES_PENDING, "evidence challenges unresolved");
        }
        return FinalizeInternal(round, ctx.now);
    });
}

Status ResolutionOracle::EnsureFinalized(const MarketRound& key, Timestamp now) {
    const Resolution* resolution = FindResolution(key);
    if (!resolution) {
        return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
    }
    if (resolution->finalized) {
        return Status::Ok();
    }
    if (now <= resolution->proposalTime + DISPUTE_PERIOD + FINALIZATION_BUFFER ||
        HasUnresolvedChallenge(key)) {
        return Status::Error(ErrorCode::NOT_FINALIZED, "market not finalized");
    }
    LOG_DEBUG(util::LogCategory::SETTLEMENT) << "auto-finalizing " << key.ToString();
    return FinalizeInternal(key, now);
}

Status ResolutionOracle::FinalizeInternal(const MarketRound& key, Timestamp now) {
    Resolution& resolution = *FindResolution(key);

    // Rejected by an evidence challenge or a delegate override
    if (resolution.status == ResolutionStatus::Rejected) {
        SettleRejected(resolution, std::nullopt, now);
        return Status::Ok();
    }

    auto found = disputes_.find(key);
    if (found == disputes_.end() || found->second.empty()) {
        SettleApproved(resolution, now);
        return Status::Ok();
    }
    auto& disputes = found->second;

    const uint64_t resolutionScore = ScoreResolution(resolution);
    std::optional<size_t> winner = SelectWinningDispute(resolutionScore, disputes);
    if (!winner) {
        for (auto& dispute : disputes) {
            dispute.status = DisputeStatus::Rejected;
        }
        LOG_INFO(util::LogCategory::DISPUTE) << key.ToString() << ": " << disputes.size()
                                             << " dispute(s) rejected, score "
                                             << resolutionScore << " stands";
        SettleApproved(resolution, now);
        return Status::Ok();
    }

    for (size_t i = 0; i < disputes.size(); ++i) {
        if (i != *winner) {
            disputes[i].status = DisputeStatus::Rejected;
        }
    }
    Dispute& upheld = disputes[*winner];
    upheld.status = DisputeStatus::Upheld;

    resolution.status = ResolutionStatus::Rejected;
    notifier_.AdvancePhase(key.market, MarketPhase::Settlement, now);

    LOG_INFO(util::LogCategory::DISPUTE)
        << key.ToString() << ": dispute " << *winner << " upheld for outcome "
        << upheld.outcome << " (score " << ScoreDispute(upheld) << " over " << resolutionScore
        << ")";
    Emit(EventType::DisputeUpheld, key, upheld.challenger, upheld.Pool(), *winner);
    Emit(EventType::ResolutionRejected, key, resolution.proposer, 0, *winner,
         "dispute upheld");

    SettleRejected(resolution, winner, now);
    return Status::Ok();
}

void ResolutionOracle::SettleApproved(Resolution& resolution, Timestamp now) {
    const MarketRound key = resolution.Key();
    const Amount pool = ledger_.EarmarkedFor(key) - UnconsumedBonds(key);

    Amount fee = ApplyBps(pool, PROTOCOL_FEE_BPS);
    Amount surplus = pool - fee - resolution.totalSupport;
    if (surplus < 0) {
        fee = std::max<Amount>(0, pool - resolution.totalSupport);
        surplus = 0;
    }

    Status collected = ledger_.CollectFee(key, fee);
    if (!collected.ok()) {
        LOG_ERROR(util::LogCategory::SETTLEMENT) << "fee of " << key.ToString()
                                                 << " not collected: " << collected.ToString();
        fee = 0;
    }
    ledger_.RecordSlashed(resolution.totalOpposition);

    Settlement& settlement = settlements_[key];
    settlement.approved = true;
    settlement.finalOutcome = resolution.outcome;
    settlement.fee = fee;
    settlement.supportRewardPool = surplus;
    settlement.supportWeight = resolution.totalSupportWeight;
    settlement.finalizedAt = now;

    resolution.finalized = true;
    resolution.finalizedAt = now;

    notifier_.SetFinalOutcome(key.market, resolution.outcome, now);
    notifier_.AdvancePhase(key.market, MarketPhase::Finalized, now);

    LOG_INFO(util::LogCategory::SETTLEMENT)
        << key.ToString() << " finalized on outcome " << resolution.outcome << ", fee "
        << FormatAmount(fee) << ", surplus " << FormatAmount(surplus);
    Emit(EventType::ResolutionFinalized, key, resolution.proposer, surplus,
         resolution.outcome, "approved");
}

/**
 * Split a rejected round. Stakes behind the rejected outcome are forfeited.
 * Opposition principal is returned first. An upheld dispute keeps its whole
 * pool, and its challenger takes the capped bonus out of the forfeit. The
 * protocol fee comes off what is left and the remainder is shared pro rata
 * between opposition stake and the upheld dispute's pool.
 */
void ResolutionOracle::SettleRejected(Resolution& resolution, std::optional<size_t> winner,
                                      Timestamp now) {
    const MarketRound key = resolution.Key();
    Dispute* upheld = winner ? FindDispute(key, *winner) : nullptr;

    // Bonds and live dispute pools are paid out separately
    Amount reserved = UnconsumedBonds(key) + ActiveDisputePools(key);
    uint32_t finalOutcome = resolution.outcome;
    Amount disputePool = 0;
    if (upheld) {
        disputePool = upheld->Pool();
        reserved += disputePool;
        finalOutcome = upheld->outcome;
    }
    const Amount available = std::max<Amount>(0, ledger_.EarmarkedFor(key) - reserved);

    const Amount oppositionPrincipal = std::min(resolution.totalOpposition, available);
    Amount forfeited = available - oppositionPrincipal;

    Amount bonus = 0;
    if (upheld) {
        bonus = std::min({ApplyBps(disputePool, CHALLENGER_BONUS_BPS),
                          ApplyBps(disputePool, CHALLENGER_BONUS_CAP_BPS), forfeited});
        forfeited -= bonus;
    }

    const Amount sharers = resolution.totalOpposition + disputePool;
    Amount fee = forfeited;
    if (sharers > 0) {
        fee = ApplyBps(forfeited, PROTOCOL_FEE_BPS);
    }

    Status collected = ledger_.CollectFee(key, fee);
    if (!collected.ok()) {
        LOG_ERROR(util::LogCategory::SETTLEMENT) << "fee of " << key.ToString()
                                                 << " not collected: " << collected.ToString();
        fee = 0;
    }
    const Amount rewards = sharers > 0 ? forfeited - fee : 0;
    const Amount oppositionShare = MulDiv(rewards, resolution.totalOpposition, sharers);

    if (upheld) {
        const Amount disputeShare = rewards - oppositionShare;
        const Amount challengerShare = MulDiv(disputeShare, upheld->bond, disputePool);
        upheld->challengerPayout = upheld->bond + bonus + challengerShare;
        upheld->supporterRewardPool = disputeShare - challengerShare;
    }
    ledger_.RecordSlashed(resolution.totalSupport);

    Settlement& settlement = settlements_[key];
    settlement.approved = false;
    settlement.finalOutcome = finalOutcome;
    settlement.fee = fee;
    settlement.oppositionRewardPool = oppositionPrincipal + oppositionShare;
    settlement.oppositionTotal = resolution.totalOpposition;
    if (winner) {
        settlement.winningDispute = static_cast<uint32_t>(*winner);
    }
    settlement.finalizedAt = now;

    resolution.finalized = true;
    resolution.finalizedAt = now;

    LOG_INFO(util::LogCategory::SETTLEMENT)
        << key.ToString() << " closed as rejected, opposition pool "
        << FormatAmount(settlement.oppositionRewardPool) << ", fee " << FormatAmount(fee);
    Emit(EventType::ResolutionFinalized, key, resolution.proposer,
         settlement.oppositionRewardPool, winner ? *winner : 0, "rejected");
}

// ============================================================================
// Claims
// ============================================================================

Status ResolutionOracle::ClaimResolutionReward(const TxContext& ctx, MarketId market, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("ClaimResolutionReward", ctx, market, Payable::No, [&]() -> Status {
        Status finalized = EnsureFinalized(key, ctx.now);
        if (!finalized.ok()) {
            return finalized;
        }
        const Settlement& settlement = settlements_[key];
        auto it = supportStakes_.find({key, ctx.sender});
        if (!settlement.approved || it == supportStakes_.end()) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "no winning support stake");
        }
        Stake& stake = it->second;
        if (stake.withdrawn) {
            return Status::Error(ErrorCode::ALREADY_CLAIMED, "support already claimed");
        }

        Amount payout = stake.amount + MulDiv(stake.weight, settlement.supportRewardPool,
                                              settlement.supportWeight);
        stake.withdrawn = true;
        Status paid = Pay(key, ctx.sender, payout, ledger::PayoutKind::Reward);
        if (!paid.ok()) {
            stake.withdrawn = false;
            return paid;
        }
        Emit(EventType::RewardClaimed, key, ctx.sender, payout, 0, "support");
        return Status::Ok();
    }, round);
}

Status ResolutionOracle::ClaimOppositionReward(const TxContext& ctx, MarketId market, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("ClaimOppositionReward", ctx, market, Payable::No, [&]() -> Status {
        Status finalized = EnsureFinalized(key, ctx.now);
        if (!finalized.ok()) {
            return finalized;
        }
        const Settlement& settlement = settlements_[key];
        auto it = oppositionStakes_.find({key, ctx.sender});
        if (settlement.approved || it == oppositionStakes_.end()) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "no winning opposition stake");
        }
        Stake& stake = it->second;
        if (stake.withdrawn) {
            return Status::Error(ErrorCode::ALREADY_CLAIMED, "opposition already claimed");
        }
        Amount payout = MulDiv(stake.amount, settlement.oppositionRewardPool,
                               settlement.oppositionTotal);
        if (payout <= 0) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "opposition share is zero");
        }

        stake.withdrawn = true;
        Status paid = Pay(key, ctx.sender, payout, ledger::PayoutKind::Reward);
        if (!paid.ok()) {
            stake.withdrawn = false;
            return paid;
        }
        Emit(EventType::RewardClaimed, key, ctx.sender, payout, 0, "opposition");
        return Status::Ok();
    }, round);
}

Status ResolutionOracle::ClaimDisputeReward(const TxContext& ctx, MarketId market,
                                            size_t index, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("ClaimDisputeReward", ctx, market, Payable::No, [&]() -> Status {
        if (!FindDispute(key, index)) {
            return Status::Error(ErrorCode::DISPUTE_NOT_FOUND, "no such dispute");
        }
        Status finalized = EnsureFinalized(key, ctx.now);
        if (!finalized.ok()) {
            return finalized;
        }
        Dispute& dispute = *FindDispute(key, index);
        if (dispute.status != DisputeStatus::Upheld) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "dispute was not upheld");
        }

        if (ctx.sender == dispute.challenger) {
            if (dispute.challengerClaimed) {
                return Status::Error(ErrorCode::ALREADY_CLAIMED, "challenger already paid");
            }
            dispute.challengerClaimed = true;
            Status paid = Pay(key, ctx.sender, dispute.challengerPayout,
                              ledger::PayoutKind::Reward);
            if (!paid.ok()) {
                dispute.challengerClaimed = false;
                return paid;
            }
            Emit(EventType::RewardClaimed, key, ctx.sender, dispute.challengerPayout, index,
                 "challenger");
            return Status::Ok();
        }

        auto it = disputeStakes_.find({key, index, ctx.sender});
        if (it == disputeStakes_.end()) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "no stake on dispute");
        }
        Stake& stake = it->second;
        if (stake.withdrawn) {
            return Status::Error(ErrorCode::ALREADY_CLAIMED, "dispute stake already claimed");
        }
        Amount payout = stake.amount + MulDiv(stake.amount, dispute.supporterRewardPool,
                                              dispute.supportStake);
        if (payout <= 0) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "dispute share is zero");
        }

        stake.withdrawn = true;
        Status paid = Pay(key, ctx.sender, payout, ledger::PayoutKind::Reward);
        if (!paid.ok()) {
            stake.withdrawn = false;
            return paid;
        }
        Emit(EventType::RewardClaimed, key, ctx.sender, payout, index, "dispute supporter");
        return Status::Ok();
    }, round);
}

Status ResolutionOracle::ReclaimDisputeStake(const TxContext& ctx, MarketId market,
                                             size_t index, Round round) {
    const MarketRound key = SelectRound(market, round);
    return Execute("ReclaimDisputeStake", ctx, market, Payable::No, [&]() -> Status {
        if (!FindDispute(key, index)) {
            return Status::Error(ErrorCode::DISPUTE_NOT_FOUND, "no such dispute");
        }
        Status finalized = EnsureFinalized(key, ctx.now);
        if (!finalized.ok()) {
            return finalized;
        }
        // Only disputes left undecided by an earlier rejection are refunded
        Dispute& dispute = *FindDispute(key, index);
        if (dispute.status != DisputeStatus::Active) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "dispute was decided");
        }

        if (ctx.sender == dispute.challenger) {
            if (dispute.challengerClaimed) {
                return Status::Error(ErrorCode::ALREADY_CLAIMED, "bond already reclaimed");
            }
            dispute.challengerClaimed = true;
            Status paid = Pay(key, ctx.sender, dispute.bond, ledger::PayoutKind::Refund);
            if (!paid.ok()) {
                dispute.challengerClaimed = false;
                return paid;
            }
            Emit(EventType::DisputeStakeReclaimed, key, ctx.sender, dispute.bond, index);
            return Status::Ok();
        }

        auto it = disputeStakes_.find({key, index, ctx.sender});
        if (it == disputeStakes_.end()) {
            return Status::Error(ErrorCode::NOTHING_TO_CLAIM, "no stake on dispute");
        }
        Stake& stake = it->second;
        if (stake.withdrawn) {
            return Status::Error(ErrorCode::ALREADY_CLAIMED, "dispute stake already reclaimed");
        }
        stake.withdrawn = true;
        Status paid = Pay(key, ctx.sender, stake.amount, ledger::PayoutKind::Refund);
        if (!paid.ok()) {
            stake.withdrawn = false;
            return paid;
        }
        Emit(EventType::DisputeStakeReclaimed, key, ctx.sender, stake.amount, index);
        return Status::Ok();
    }, round);
}

} // namespace resolution
} // namespace arbiter
