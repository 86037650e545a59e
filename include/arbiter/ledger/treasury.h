// ARBITER - Treasury Ledger
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Internal accounting for funds held by the resolution protocol.
//
// Every amount a participant attaches to an operation is received into the
// ledger and earmarked under its market round. Payouts leave through Disburse,
// protocol fees through CollectFee and WithdrawFees. The ledger is never
// touched directly by protocol code: counters only move through these
// checked operations.
//
// Invariants:
// - custodied >= earmarked + protocolFees
// - per round: deposited - paidOut - feesCollected == earmarked

#ifndef ARBITER_LEDGER_TREASURY_H
#define ARBITER_LEDGER_TREASURY_H

#include <arbiter/core/status.h>
#include <arbiter/core/types.h>

#include <functional>
#include <map>

namespace arbiter {
namespace ledger {

// ============================================================================
// Payout Sink
// ============================================================================

/**
 * Destination of value leaving the ledger (native transfers in a deployment).
 * Returns false or throws std::exception when the transfer did not happen.
 */
class IPayoutSink {
public:
    virtual ~IPayoutSink() = default;
    virtual bool Transfer(const Address& to, Amount amount) = 0;
};

/// What a disbursement pays for (drives the metrics)
enum class PayoutKind {
    Refund,
    Reward,
    Bounty,
};

const char* PayoutKindToString(PayoutKind kind);

// ============================================================================
// Accounts and Metrics
// ============================================================================

/// Per-round accounting
struct MarketAccount {
    Amount deposited{0};
    Amount paidOut{0};
    Amount feesCollected{0};
    Amount earmarked{0};
};

/// Cumulative protocol statistics
struct ProtocolMetrics {
    uint64_t totalResolutions{0};
    uint64_t totalDisputes{0};
    Amount totalSlashed{0};
    Amount totalRewardsPaid{0};
    Amount totalBountiesPaid{0};
    Amount totalRefunded{0};
    Amount totalFeesCollected{0};
};

// ============================================================================
// Treasury Ledger
// ============================================================================

/**
 * Accounting service owned by the resolution oracle.
 *
 * Not internally synchronized: the owner serializes every call.
 */
class TreasuryLedger {
public:
    /// Reports the actually held balance; when unset the internal counter is used
    using BalanceProvider = std::function<Amount()>;

    TreasuryLedger() = default;

    /// Take custody of funds attached to an operation for a market round
    Status Receive(const MarketRound& account, Amount amount);

    /// True when Receive(amount) would succeed
    bool CanReceive(Amount amount) const;

    /**
     * Pay funds earmarked under a market round to a participant.
     * Counters are restored when the sink refuses or throws.
     */
    Status Disburse(const MarketRound& account, const Address& to, Amount amount,
                    IPayoutSink& sink, PayoutKind kind);

    /// Move earmarked round funds into the protocol fee pot
    Status CollectFee(const MarketRound& account, Amount amount);

    /// Pay out accumulated protocol fees
    Status WithdrawFees(const Address& to, Amount amount, IPayoutSink& sink);

    /// Fails with INSOLVENT unless held funds cover earmarks and fees
    Status CheckSolvency() const;

    // Counters
    Amount Custodied() const;
    Amount Earmarked() const { return earmarked_; }
    Amount ProtocolFees() const { return protocolFees_; }
    Amount EarmarkedFor(const MarketRound& account) const;
    MarketAccount GetAccount(const MarketRound& account) const;

    /// Sum over every round of the market
    Amount EarmarkedFor(MarketId market) const;

    // Metrics
    const ProtocolMetrics& Metrics() const { return metrics_; }
    void RecordResolution() { ++metrics_.totalResolutions; }
    void RecordDispute() { ++metrics_.totalDisputes; }
    void RecordSlashed(Amount amount);

    void SetBalanceProvider(BalanceProvider provider) { balanceProvider_ = std::move(provider); }

private:
    bool Send(IPayoutSink& sink, const Address& to, Amount amount);

    Amount custodied_{0};
    Amount earmarked_{0};
    Amount protocolFees_{0};
    std::map<MarketRound, MarketAccount> accounts_;
    ProtocolMetrics metrics_;
    BalanceProvider balanceProvider_;
};

} // namespace ledger
} // namespace arbiter

#endif // ARBITER_LEDGER_TREASURY_H
