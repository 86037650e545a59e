// ARBITER - Support and Opposition Staking
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

namespace arbiter {
namespace resolution {

Status ResolutionOracle::SupportResolution(const TxContext& ctx, MarketId market) {
    return Execute("SupportResolution", ctx, market, Payable::Yes,
                   [&]() { return AddStake(ctx, market, true); });
}

Status ResolutionOracle::OpposeResolution(const TxContext& ctx, MarketId market) {
    return Execute("OpposeResolution", ctx, market, Payable::Yes,
                   [&]() { return AddStake(ctx, market, false); });
}

Status ResolutionOracle::AddStake(const TxContext& ctx, MarketId market, bool support) {
    const MarketRound round = CurrentRound(market);
    Resolution* resolution = FindResolution(round);
    if (!resolution) {
        return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
    }
    if (resolution->finalized) {
        return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
    }
    if (resolution->status == ResolutionStatus::Rejected) {
        return Status::Error(ErrorCode::NOT_PENDING, "resolution rejected");
    }
    if (ctx.now > resolution->proposalTime + SUPPORT_PERIOD) {
        return Status::Error(ErrorCode::WINDOW_CLOSED, "support period over");
    }
    if (ctx.value < MIN_STAKE_AMOUNT) {
        return Status::Error(ErrorCode::INSUFFICIENT_VALUE, "stake below minimum");
    }

    auto& stakes = support ? supportStakes_ : oppositionStakes_;
    const ParticipantKey key{round, ctx.sender};
    auto existing = stakes.find(key);
    if (existing != stakes.end() && existing->second.withdrawn) {
        return Status::Error(ErrorCode::STAKE_WITHDRAWN, "stake already withdrawn");
    }

    Status received = ledger_.Receive(round, ctx.value);
    if (!received.ok()) {
        return received;
    }

    const bool firstStake = existing == stakes.end();
    Stake& stake = stakes[key];
    stake.amount += ctx.value;
    stake.timestamp = ctx.now;

    if (support) {
        int64_t bonusBps = CalculateSupportBonusBps(resolution->proposalTime, ctx.now);
        Amount weight = ApplyBonus(ctx.value, bonusBps);
        stake.weight += weight;
        resolution->totalSupport += ctx.value;
        resolution->totalSupportWeight += weight;
        if (firstStake) {
            ++resolution->supportCount;
        }

        if (resolution->status == ResolutionStatus::Pending &&
            ReachesApproval(resolution->totalSupport, resolution->totalOpposition)) {
            resolution->status = ResolutionStatus::Approved;
            LOG_INFO(util::LogCategory::STAKING) << round.ToString() << " resolution approved "
                                                 << "by stake";
            Emit(EventType::ResolutionApproved, round, ctx.sender, resolution->totalSupport);
        }
        Emit(EventType::SupportAdded, round, ctx.sender, ctx.value,
             static_cast<uint64_t>(bonusBps));
    } else {
        resolution->totalOpposition += ctx.value;
        if (firstStake) {
            ++resolution->oppositionCount;
        }
        Emit(EventType::OppositionAdded, round, ctx.sender, ctx.value);
    }

    LOG_DEBUG(util::LogCategory::STAKING)
        << (support ? "support " : "opposition ") << FormatAmount(ctx.value) << " on "
        << round.ToString() << " from " << ctx.sender.ToHex();
    return Status::Ok();
}

} // namespace resolution
} // namespace arbiter
