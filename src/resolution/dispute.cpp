// ARBITER - Dispute Engine
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

namespace arbiter {
namespace resolution {

namespace {

Status CheckDisputeWindow(const Resolution* resolution, Timestamp now) {
    if (!resolution) {
        return Status::Error(ErrorCode::RESOLUTION_NOT_FOUND, "no resolution for market");
    }
    if (resolution->finalized) {
        return Status::Error(ErrorCode::ALREADY_FINALIZED, "resolution finalized");
    }
    if (resolution->status == ResolutionStatus::Rejected) {
        return Status::Error(ErrorCode::NOT_PENDING, "resolution rejected");
    }
    if (now > resolution->proposalTime + DISPUTE_PERIOD) {
        return Status::Error(ErrorCode::WINDOW_CLOSED, "dispute period over");
    }
    return Status::Ok();
}

} // namespace

// ============================================================================
// Filing
// ============================================================================

Status ResolutionOracle::DisputeResolution(const TxContext& ctx, MarketId market,
                                           uint32_t alternativeOutcome,
                                           const std::string& evidenceURI,
                                           const Hash256& evidenceHash) {
    return Execute("DisputeResolution", ctx, market, Payable::Yes, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        Resolution* resolution = FindResolution(round);
        Status window = CheckDisputeWindow(resolution, ctx.now);
        if (!window.ok()) {
            return window;
        }
        if (alternativeOutcome == resolution->outcome) {
            return Status::Error(ErrorCode::INVALID_OUTCOME, "dispute repeats proposed outcome");
        }
        auto info = QueryMarketInfo(market);
        if (!info) {
            return Status::Error(ErrorCode::MARKET_UNAVAILABLE, "market info unavailable");
        }
        if (alternativeOutcome >= info->outcomeCount) {
            return Status::Error(ErrorCode::INVALID_OUTCOME, "outcome out of range");
        }
        if (evidenceURI.empty() || evidenceURI.size() > MAX_EVIDENCE_URI_LENGTH ||
            evidenceHash.IsNull()) {
            return Status::Error(ErrorCode::INVALID_EVIDENCE, "dispute evidence missing");
        }
        auto existing = disputes_.find(round);
        if (existing != disputes_.end() && existing->second.size() >= MAX_DISPUTES_PER_MARKET) {
            return Status::Error(ErrorCode::LIMIT_REACHED, "too many disputes");
        }
        Amount required =
            CalculateRequiredDisputeBond(resolution->totalSupport, resolution->proposalTime,
                                         ctx.now);
        if (ctx.value < required) {
            return Status::Error(ErrorCode::INSUFFICIENT_VALUE,
                                 "dispute bond below " + FormatAmount(required));
        }

        Status received = ledger_.Receive(round, ctx.value);
        if (!received.ok()) {
            return received;
        }

        Dispute dispute;
        dispute.challenger = ctx.sender;
        dispute.outcome = alternativeOutcome;
        dispute.bond = ctx.value;
        dispute.evidenceURI = evidenceURI;
        dispute.evidenceHash = evidenceHash;
        dispute.createdAt = ctx.now;
        auto& disputes = disputes_[round];
        disputes.push_back(dispute);
        const size_t index = disputes.size() - 1;

        const bool first = !resolution->disputed;
        resolution->disputed = true;
        ledger_.RecordDispute();

        LOG_INFO(util::LogCategory::DISPUTE)
            << round.ToString() << " dispute " << index << " for outcome "
            << alternativeOutcome << " by " << ctx.sender.ToHex() << ", bond "
            << FormatAmount(ctx.value);
        Emit(EventType::DisputeFiled, round, ctx.sender, ctx.value, index, evidenceURI);

        if (first) {
            notifier_.AdvancePhase(market, MarketPhase::Disputed, ctx.now);
        }
        return Status::Ok();
    });
}

// ============================================================================
// Backing
// ============================================================================

Status ResolutionOracle::SupportDispute(const TxContext& ctx, MarketId market, size_t index) {
    return Execute("SupportDispute", ctx, market, Payable::Yes, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        Dispute* dispute = FindDispute(round, index);
        if (!dispute) {
            return Status::Error(ErrorCode::DISPUTE_NOT_FOUND, "no such dispute");
        }
        if (dispute->status != DisputeStatus::Active) {
            return Status::Error(ErrorCode::NOT_PENDING, "dispute already decided");
        }
        Status window = CheckDisputeWindow(FindResolution(round), ctx.now);
        if (!window.ok()) {
            return window;
        }
        if (dispute->challenger == ctx.sender) {
            return Status::Error(ErrorCode::SELF_SUPPORT, "challenger cannot back own dispute");
        }
        if (ctx.value < MIN_STAKE_AMOUNT) {
            return Status::Error(ErrorCode::INSUFFICIENT_VALUE, "stake below minimum");
        }
        const DisputeKey key{round, index, ctx.sender};
        auto existing = disputeStakes_.find(key);
        if (existing != disputeStakes_.end() && existing->second.withdrawn) {
            return Status::Error(ErrorCode::STAKE_WITHDRAWN, "stake already withdrawn");
        }

        Status received = ledger_.Receive(round, ctx.value);
        if (!received.ok()) {
            return received;
        }

        if (existing == disputeStakes_.end()) {
            ++dispute->supporterCount;
        }
        Stake& stake = disputeStakes_[key];
        stake.amount += ctx.value;
        stake.weight += ctx.value;
        stake.timestamp = ctx.now;
        dispute->supportStake += ctx.value;

        LOG_DEBUG(util::LogCategory::DISPUTE) << "dispute " << index << " on " << round.ToString()
                                              << " backed with " << FormatAmount(ctx.value);
        Emit(EventType::DisputeSupported, round, ctx.sender, ctx.value, index);
        return Status::Ok();
    });
}

Status ResolutionOracle::EndorseDispute(const TxContext& ctx, MarketId market, size_t index) {
    return Execute("EndorseDispute", ctx, market, Payable::No, [&]() -> Status {
        const MarketRound round = CurrentRound(market);
        Dispute* dispute = FindDispute(round, index);
        if (!dispute) {
            return Status::Error(ErrorCode::DISPUTE_NOT_FOUND, "no such dispute");
        }
        if (dispute->status != DisputeStatus::Active) {
            return Status::Error(ErrorCode::NOT_PENDING, "dispute already decided");
        }
        Status window = CheckDisputeWindow(FindResolution(round), ctx.now);
        if (!window.ok()) {
            return window;
        }
        if (!IsSnapshotLegislator(round, ctx.sender)) {
            return Status::Error(ErrorCode::NOT_ELIGIBLE, "not in the delegate snapshot");
        }
        if (!endorsements_.insert({round, index, ctx.sender}).second) {
            return Status::Error(ErrorCode::ALREADY_ENDORSED, "dispute already endorsed");
        }
        ++dispute->endorsements;

        Emit(EventType::DisputeEndorsed, round, ctx.sender, 0, index);
        return Status::Ok();
    });
}

} // namespace resolution
} // namespace arbiter
