// ARBITER - Treasury Ledger Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/ledger/treasury.h>

#include <arbiter/core/amount.h>
#include <arbiter/util/logging.h>

#include <exception>

namespace arbiter {
namespace ledger {

const char* PayoutKindToString(PayoutKind kind) {
    switch (kind) {
        case PayoutKind::Refund: return "refund";
        case PayoutKind::Reward: return "reward";
        case PayoutKind::Bounty: return "bounty";
        default: return "unknown";
    }
}

// ============================================================================
// Receipts
// ============================================================================

Status TreasuryLedger::Receive(const MarketRound& account, Amount amount) {
    if (!MoneyRange(amount)) {
        return Status::Error(ErrorCode::INVALID_ARGUMENT, "amount out of range");
    }
    auto custodied = CheckedAdd(custodied_, amount);
    auto earmarked = CheckedAdd(earmarked_, amount);
    if (!custodied || !earmarked) {
        return Status::Error(ErrorCode::INVALID_ARGUMENT, "ledger overflow");
    }

    custodied_ = *custodied;
    earmarked_ = *earmarked;
    MarketAccount& entry = accounts_[account];
    entry.deposited += amount;
    entry.earmarked += amount;

    LOG_TRACE(util::LogCategory::LEDGER) << "received " << FormatAmount(amount)
                                         << " for market " << account.ToString();
    return Status::Ok();
}

bool TreasuryLedger::CanReceive(Amount amount) const {
    return MoneyRange(amount) && CheckedAdd(custodied_, amount) &&
           CheckedAdd(earmarked_, amount);
}

// ============================================================================
// Payouts
// ============================================================================

bool TreasuryLedger::Send(IPayoutSink& sink, const Address& to, Amount amount) {
    try {
        return sink.Transfer(to, amount);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "transfer to " << to.ToHex()
                                            << " threw: " << e.what();
        return false;
    }
}

Status TreasuryLedger::Disburse(const MarketRound& account, const Address& to, Amount amount,
                                IPayoutSink& sink, PayoutKind kind) {
    if (amount <= 0 || !MoneyRange(amount)) {
        return Status::Error(ErrorCode::INVALID_ARGUMENT, "payout amount out of range");
    }
    auto it = accounts_.find(account);
    if (it == accounts_.end() || it->second.earmarked < amount) {
        LOG_ERROR(util::LogCategory::LEDGER)
            << "market " << account.ToString() << " cannot cover " << FormatAmount(amount);
        return Status::Error(ErrorCode::INSUFFICIENT_FUNDS, "market earmark too small");
    }
    if (Custodied() < amount) {
        LOG_ERROR(util::LogCategory::LEDGER)
            << "custody " << FormatAmount(Custodied()) << " cannot cover " << FormatAmount(amount);
        return Status::Error(ErrorCode::INSUFFICIENT_FUNDS, "custodied balance too small");
    }

    MarketAccount& entry = it->second;
    custodied_ -= amount;
    earmarked_ -= amount;
    entry.earmarked -= amount;
    entry.paidOut += amount;

    if (!Send(sink, to, amount)) {
        custodied_ += amount;
        earmarked_ += amount;
        entry.earmarked += amount;
        entry.paidOut -= amount;
        return Status::Error(ErrorCode::TRANSFER_FAILED,
                             std::string(PayoutKindToString(kind)) + " transfer failed");
    }

    switch (kind) {
        case PayoutKind::Refund: metrics_.totalRefunded += amount; break;
        case PayoutKind::Reward: metrics_.totalRewardsPaid += amount; break;
        case PayoutKind::Bounty: metrics_.totalBountiesPaid += amount; break;
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << PayoutKindToString(kind) << " of "
                                         << FormatAmount(amount) << " to " << to.ToHex()
                                         << " from market " << account.ToString();
    return Status::Ok();
}

// ============================================================================
// Fees
// ============================================================================

Status TreasuryLedger::CollectFee(const MarketRound& account, Amount amount) {
    if (amount < 0) {
        return Status::Error(ErrorCode::INVALID_ARGUMENT, "negative fee");
    }
    if (amount == 0) {
        return Status::Ok();
    }
    auto it = accounts_.find(account);
    if (it == accounts_.end() || it->second.earmarked < amount) {
        return Status::Error(ErrorCode::INSUFFICIENT_FUNDS, "market earmark too small");
    }

    it->second.earmarked -= amount;
    it->second.feesCollected += amount;
    earmarked_ -= amount;
    protocolFees_ += amount;
    metrics_.totalFeesCollected += amount;
    return Status::Ok();
}

Status TreasuryLedger::WithdrawFees(const Address& to, Amount amount, IPayoutSink& sink) {
    if (amount <= 0) {
        return Status::Error(ErrorCode::INVALID_ARGUMENT, "withdrawal must be positive");
    }
    if (amount > protocolFees_ || amount > Custodied()) {
        return Status::Error(ErrorCode::INSUFFICIENT_FUNDS, "not enough protocol fees");
    }

    protocolFees_ -= amount;
    custodied_ -= amount;
    if (!Send(sink, to, amount)) {
        protocolFees_ += amount;
        custodied_ += amount;
        return Status::Error(ErrorCode::TRANSFER_FAILED, "fee withdrawal failed");
    }

    LOG_INFO(util::LogCategory::LEDGER) << "withdrew " << FormatAmount(amount)
                                        << " protocol fees to " << to.ToHex();
    return Status::Ok();
}

// ============================================================================
// Solvency
// ============================================================================

Amount TreasuryLedger::Custodied() const {
    return balanceProvider_ ? balanceProvider_() : custodied_;
}

Status TreasuryLedger::CheckSolvency() const {
    Amount held = Custodied();
    auto owed = CheckedAdd(earmarked_, protocolFees_);
    if (!owed || held < *owed) {
        LOG_ERROR(util::LogCategory::LEDGER)
            << "ledger insolvent: held " << FormatAmount(held) << ", earmarked "
            << FormatAmount(earmarked_) << ", fees " << FormatAmount(protocolFees_);
        return Status::Error(ErrorCode::INSOLVENT, "custodied funds below earmarked funds");
    }
    return Status::Ok();
}

Amount TreasuryLedger::EarmarkedFor(const MarketRound& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.earmarked;
}

Amount TreasuryLedger::EarmarkedFor(MarketId market) const {
    Amount total = 0;
    for (auto it = accounts_.lower_bound(MarketRound{market, 0});
         it != accounts_.end() && it->first.market == market; ++it) {
        total += it->second.earmarked;
    }
    return total;
}

MarketAccount TreasuryLedger::GetAccount(const MarketRound& account) const {
    auto it = accounts_.find(account);
    return it == accounts_.end() ? MarketAccount() : it->second;
}

void TreasuryLedger::RecordSlashed(Amount amount) {
    if (amount > 0) {
        metrics_.totalSlashed += amount;
    }
}

} // namespace ledger
} // namespace arbiter
