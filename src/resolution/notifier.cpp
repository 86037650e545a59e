// ARBITER - External Call Isolation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/notifier.h>

#include <arbiter/core/amount.h>
#include <arbiter/util/logging.h>

namespace arbiter {
namespace resolution {

const char* MarketPhaseToString(MarketPhase phase) {
    switch (phase) {
        case MarketPhase::Trading: return "trading";
        case MarketPhase::Settlement: return "settlement";
        case MarketPhase::Proposed: return "proposed";
        case MarketPhase::DisputeWindow: return "dispute-window";
        case MarketPhase::Disputed: return "disputed";
        case MarketPhase::Finalized: return "finalized";
        default: return "unknown";
    }
}

ExternalNotifier::ExternalNotifier(IMarket& market, IReputationLedger& reputation,
                                   IPriceOracle* priceOracle, FailureHandler onFailure)
    : market_(market), reputation_(reputation), priceOracle_(priceOracle),
      onFailure_(std::move(onFailure)) {}

ExternalCallResult ExternalNotifier::Report(ExternalCallResult result, MarketId market,
                                            const Address& actor, const std::string& call,
                                            Timestamp now) {
    if (result.ok) {
        return result;
    }

    LOG_WARN(util::LogCategory::EXTERNAL) << call << " failed for market " << market
                                          << ": " << result.error;
    if (onFailure_) {
        ResolutionEvent event;
        event.type = EventType::ExternalCallFailed;
        event.market = market;
        event.actor = actor;
        event.detail = call + ": " + result.error;
        event.timestamp = now;
        onFailure_(std::move(event));
    }
    return result;
}

ExternalCallResult ExternalNotifier::AdvancePhase(MarketId market, MarketPhase phase,
                                                  Timestamp now) {
    auto result = IsolatedCall([&] { return market_.AdvanceResolutionPhase(market, phase); });
    return Report(std::move(result), market, Address(),
                  std::string("AdvanceResolutionPhase(") + MarketPhaseToString(phase) + ")",
                  now);
}

ExternalCallResult ExternalNotifier::SetFinalOutcome(MarketId market, uint32_t outcome,
                                                     Timestamp now) {
    auto result = IsolatedCall([&] { return market_.SetFinalOutcome(market, outcome); });
    return Report(std::move(result), market, Address(), "SetFinalOutcome", now);
}

ExternalCallResult ExternalNotifier::RecordPriceReference(MarketId market, Timestamp now) {
    if (!priceOracle_) {
        return ExternalCallResult::Success();
    }

    std::optional<Hash256> feedId;
    std::optional<std::string> asset;
    auto lookup = IsolatedCall([&] {
        feedId = market_.GetPriceFeedId(market);
        if (feedId) {
            asset = market_.GetPriceAsset(market);
        }
        return true;
    });
    if (!lookup) {
        return Report(std::move(lookup), market, Address(), "GetPriceFeedId", now);
    }
    if (!feedId || feedId->IsNull()) {
        return ExternalCallResult::Success();
    }

    const std::string assetName = asset.value_or("");
    auto result = IsolatedCall([&] {
        return priceOracle_->RecordPrice(market, *feedId, assetName);
    });
    if (result.ok) {
        result.amount = 1;
    }
    return Report(std::move(result), market, Address(), "RecordPrice", now);
}

ExternalCallResult ExternalNotifier::SlashReputation(MarketId market, const Address& who,
                                                     int64_t bps, Timestamp now) {
    Amount penalty = 0;
    auto result = IsolatedCall([&] {
        Amount balance = reputation_.BalanceOf(who);
        penalty = ApplyBps(balance, bps);
        if (penalty == 0) {
            return true;
        }
        return reputation_.Slash(who, penalty);
    });
    if (result.ok) {
        result.amount = penalty;
    }
    return Report(std::move(result), market, who, "Slash", now);
}

ExternalCallResult ExternalNotifier::SnapshotRoster(MarketId market,
                                                    ILegislatorRoster& roster,
                                                    std::map<Address, uint64_t>& out,
                                                    Timestamp now) {
    std::map<Address, uint64_t> snapshot;
    auto result = IsolatedCall([&] {
        for (const Address& legislator : roster.GetLegislators()) {
            uint64_t weight = roster.GetVotingWeight(legislator);
            if (weight > 0) {
                snapshot[legislator] = weight;
            }
        }
        return true;
    });
    if (result.ok) {
        out = std::move(snapshot);
    }
    return Report(std::move(result), market, Address(), "GetLegislators", now);
}

std::optional<RecordedPrice> ExternalNotifier::GetRecordedPrice(MarketId market) {
    if (!priceOracle_) {
        return std::nullopt;
    }
    std::optional<RecordedPrice> price;
    auto result = IsolatedCall([&] {
        price = priceOracle_->GetRecordedPrice(market);
        return true;
    });
    if (!result) {
        LOG_WARN(util::LogCategory::EXTERNAL) << "GetRecordedPrice failed for market "
                                              << market << ": " << result.error;
        return std::nullopt;
    }
    return price;
}

} // namespace resolution
} // namespace arbiter
