// ARBITER - External Call Isolation
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Best-effort calls into external collaborators. A failed call (false
// return, empty result or thrown std::exception) is logged at Warn and
// reported as an ExternalCallFailed event; it never aborts the protocol
// operation that issued it.

#ifndef ARBITER_RESOLUTION_NOTIFIER_H
#define ARBITER_RESOLUTION_NOTIFIER_H

#include <arbiter/resolution/interfaces.h>
#include <arbiter/resolution/types.h>

#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace arbiter {
namespace resolution {

struct ExternalCallResult {
    bool ok{false};
    std::string error;

    /// Amount moved by the call (reputation slashes)
    Amount amount{0};

    static ExternalCallResult Success(Amount amount = 0) {
        ExternalCallResult r;
        r.ok = true;
        r.amount = amount;
        return r;
    }
    static ExternalCallResult Failure(const std::string& error) {
        ExternalCallResult r;
        r.error = error;
        return r;
    }

    explicit operator bool() const { return ok; }
};

/// Run fn, turning a false return or a thrown std::exception into a failure
template<typename Func>
ExternalCallResult IsolatedCall(Func&& fn) {
    try {
        if (fn()) {
            return ExternalCallResult::Success();
        }
        return ExternalCallResult::Failure("call returned false");
    } catch (const std::exception& e) {
        return ExternalCallResult::Failure(e.what());
    }
}

/**
 * Mirrors protocol progress into the external market and applies penalties
 * through the reputation ledger and price oracle.
 */
class ExternalNotifier {
public:
    /// Receives one ExternalCallFailed event per failed call
    using FailureHandler = std::function<void(ResolutionEvent)>;

    /**
     * @param market Required
     * @param reputation Required for delegate slashing
     * @param priceOracle Optional; price references are skipped when null
     */
    ExternalNotifier(IMarket& market, IReputationLedger& reputation,
                     IPriceOracle* priceOracle, FailureHandler onFailure);

    ExternalCallResult AdvancePhase(MarketId market, MarketPhase phase, Timestamp now);
    ExternalCallResult SetFinalOutcome(MarketId market, uint32_t outcome, Timestamp now);

    /**
     * Bind a price reference when the market is price-linked.
     * Succeeds without a call when the market has no feed or no oracle is set.
     * @return Success with amount 1 when a price was recorded
     */
    ExternalCallResult RecordPriceReference(MarketId market, Timestamp now);

    /// Slash bps of who's reputation; the slashed amount is returned in the result
    ExternalCallResult SlashReputation(MarketId market, const Address& who,
                                       int64_t bps, Timestamp now);

    /// Delegates with positive weight, or a failure when the roster cannot be read
    ExternalCallResult SnapshotRoster(MarketId market, ILegislatorRoster& roster,
                                      std::map<Address, uint64_t>& out, Timestamp now);

    std::optional<RecordedPrice> GetRecordedPrice(MarketId market);

private:
    ExternalCallResult Report(ExternalCallResult result, MarketId market,
                              const Address& actor, const std::string& call,
                              Timestamp now);

    IMarket& market_;
    IReputationLedger& reputation_;
    IPriceOracle* priceOracle_;
    FailureHandler onFailure_;
};

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_NOTIFIER_H
