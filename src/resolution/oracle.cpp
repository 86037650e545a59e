// ARBITER - Resolution Oracle
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/oracle.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/scoring.h>
#include <arbiter/util/logging.h>

#include <algorithm>
#include <stdexcept>

namespace arbiter {
namespace resolution {

namespace {

const ResolutionOracle::Collaborators& RequireCollaborators(
    const ResolutionOracle::Collaborators& c) {
    if (!c.market || !c.roster || !c.reputation || !c.payouts) {
        throw std::invalid_argument("ResolutionOracle: market, roster, reputation "
                                    "and payouts are required");
    }
    return c;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

ResolutionOracle::ResolutionOracle(const Collaborators& collaborators,
                                   ProtocolOptions options)
    : collaborators_(RequireCollaborators(collaborators)),
      managers_(std::move(options.managers)),
      notifier_(*collaborators.market, *collaborators.reputation, collaborators.priceOracle,
                [this](ResolutionEvent event) {
                    event.round = CurrentRound(event.market).round;
                    pending_.push_back(std::move(event));
                }) {
    LOG_INFO(util::LogCategory::RESOLUTION) << "resolution oracle ready with "
                                            << managers_.size() << " manager(s)";
}

// ============================================================================
// Operation Envelope
// ============================================================================

Status ResolutionOracle::Execute(const char* operation, const TxContext& ctx,
                                 std::optional<MarketId> market, Payable payable,
                                 const std::function<Status()>& body, Round round) {
    std::vector<ResolutionEvent> events;
    std::vector<EventListener> listeners;
    Status status;
    {
        util::NonReentrantGuard guard(mutex_);
        if (!guard.entered()) {
            LOG_DEBUG(util::LogCategory::RESOLUTION) << operation << " rejected: re-entrant call";
            return Status::Error(ErrorCode::REENTRANT_CALL, operation);
        }

        status = ledger_.CheckSolvency();
        if (status.ok()) {
            if (ctx.value < 0 || (payable == Payable::No && ctx.value != 0)) {
                status = Status::Error(ErrorCode::INVALID_ARGUMENT,
                                       "operation does not accept this value");
            } else if (!ledger_.CanReceive(ctx.value)) {
                status = Status::Error(ErrorCode::INVALID_ARGUMENT, "value out of range");
            }
        }

        pending_.clear();
        operationTime_ = ctx.now;
        if (status.ok()) {
            status = body();
        }

        if (!status.ok()) {
            LOG_DEBUG(util::LogCategory::RESOLUTION)
                << operation << " rejected: " << status.ToString();
        }

        // A failed claim may still have finalized its round first
        if (market && (status.ok() || !pending_.empty())) {
            PersistSnapshot(SelectRound(*market, round), ctx.now);
        }

        for (const auto& event : pending_) {
            journal_.push_back(event);
            if (journal_.size() > MAX_EVENT_JOURNAL) {
                journal_.pop_front();
            }
        }
        events.swap(pending_);
        listeners = listeners_;
    }

    for (const auto& event : events) {
        for (const auto& listener : listeners) {
            try {
                listener(event);
            } catch (const std::exception& e) {
                LOG_WARN(util::LogCategory::RESOLUTION) << "event listener threw: " << e.what();
            }
        }
    }
    return status;
}

void ResolutionOracle::Emit(EventType type, const MarketRound& key, const Address& actor,
                            Amount amount, uint64_t index, const std::string& detail) {
    ResolutionEvent event;
    event.type = type;
    event.market = key.market;
    event.round = key.round;
    event.actor = actor;
    event.amount = amount;
    event.index = index;
    event.detail = detail;
    event.timestamp = operationTime_;
    pending_.push_back(std::move(event));
}

void ResolutionOracle::PersistSnapshot(const MarketRound& key, Timestamp now) {
    if (!store_) {
        return;
    }
    db::Status status = store_->SaveSnapshot(key, BuildSnapshot(key));
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::STORE) << "snapshot of " << key.ToString()
                                            << " not saved: " << status.ToString();
        ResolutionEvent event;
        event.type = EventType::StoreWriteFailed;
        event.market = key.market;
        event.round = key.round;
        event.detail = status.ToString();
        event.timestamp = now;
        pending_.push_back(std::move(event));
    }
}

// ============================================================================
// Rounds
// ============================================================================

MarketRound ResolutionOracle::CurrentRound(MarketId market) const {
    auto it = rounds_.find(market);
    return MarketRound{market, it == rounds_.end() ? 0u : it->second};
}

MarketRound ResolutionOracle::SelectRound(MarketId market, Round round) const {
    return round ? MarketRound{market, *round} : CurrentRound(market);
}

MarketRound ResolutionOracle::ProposalRound(MarketId market) const {
    MarketRound key = CurrentRound(market);
    const Resolution* resolution = FindResolution(key);
    if (resolution && resolution->IsClosedRejected()) {
        ++key.round;
    }
    return key;
}

// ============================================================================
// Lookups
// ============================================================================

Resolution* ResolutionOracle::FindResolution(const MarketRound& key) {
    auto it = resolutions_.find(key);
    return it == resolutions_.end() ? nullptr : &it->second;
}

const Resolution* ResolutionOracle::FindResolution(const MarketRound& key) const {
    auto it = resolutions_.find(key);
    return it == resolutions_.end() ? nullptr : &it->second;
}

Dispute* ResolutionOracle::FindDispute(const MarketRound& key, size_t index) {
    auto it = disputes_.find(key);
    if (it == disputes_.end() || index >= it->second.size()) {
        return nullptr;
    }
    return &it->second[index];
}

bool ResolutionOracle::IsSnapshotLegislator(const MarketRound& key, const Address& who) const {
    auto it = rosterSnapshots_.find(key);
    return it != rosterSnapshots_.end() && it->second.count(who) > 0;
}

bool ResolutionOracle::IsCurrentLegislator(const Address& who) {
    bool member = false;
    auto result = IsolatedCall([&] {
        member = collaborators_.roster->IsLegislator(who);
        return true;
    });
    if (!result) {
        LOG_WARN(util::LogCategory::EXTERNAL) << "IsLegislator failed: " << result.error;
        return false;
    }
    return member;
}

bool ResolutionOracle::HasActiveDispute(const MarketRound& key) const {
    auto it = disputes_.find(key);
    if (it == disputes_.end()) {
        return false;
    }
    for (const auto& dispute : it->second) {
        if (dispute.status == DisputeStatus::Active) {
            return true;
        }
    }
    return false;
}

bool ResolutionOracle::HasUnresolvedChallenge(const MarketRound& key) const {
    auto it = challenges_.find(key);
    if (it == challenges_.end()) {
        return false;
    }
    for (const auto& challenge : it->second) {
        if (!challenge.resolved) {
            return true;
        }
    }
    return false;
}

std::optional<MarketPhase> ResolutionOracle::QueryPhase(MarketId market) {
    try {
        return collaborators_.market->GetResolutionPhase(market);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::EXTERNAL) << "GetResolutionPhase failed: " << e.what();
        return std::nullopt;
    }
}

std::optional<MarketInfo> ResolutionOracle::QueryMarketInfo(MarketId market) {
    try {
        return collaborators_.market->GetMarketInfo(market);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::EXTERNAL) << "GetMarketInfo failed: " << e.what();
        return std::nullopt;
    }
}

Amount ResolutionOracle::UnconsumedBonds(const MarketRound& key) const {
    Amount total = 0;
    for (auto it = commits_.lower_bound({key, Address()});
         it != commits_.end() && it->first.first == key; ++it) {
        if (!it->second.IsConsumed()) {
            total += it->second.bond;
        }
    }
    return total;
}

Amount ResolutionOracle::ActiveDisputePools(const MarketRound& key) const {
    Amount total = 0;
    auto it = disputes_.find(key);
    if (it != disputes_.end()) {
        for (const auto& dispute : it->second) {
            if (dispute.status == DisputeStatus::Active) {
                total += dispute.Pool();
            }
        }
    }
    return total;
}

Status ResolutionOracle::Pay(const MarketRound& key, const Address& to, Amount amount,
                             ledger::PayoutKind kind) {
    return ledger_.Disburse(key, to, amount, *collaborators_.payouts, kind);
}

MarketSnapshot ResolutionOracle::BuildSnapshot(const MarketRound& key) const {
    MarketSnapshot snapshot;
    if (const Resolution* resolution = FindResolution(key)) {
        snapshot.resolution = *resolution;
    }
    for (auto it = commits_.lower_bound({key, Address()});
         it != commits_.end() && it->first.first == key; ++it) {
        snapshot.commits.push_back(it->second);
    }
    if (auto it = disputes_.find(key); it != disputes_.end()) {
        snapshot.disputes = it->second;
    }
    if (auto it = challenges_.find(key); it != challenges_.end()) {
        snapshot.challenges = it->second;
    }
    if (auto it = settlements_.find(key); it != settlements_.end()) {
        snapshot.settlement = it->second;
    }
    return snapshot;
}

// ============================================================================
// Oracle Managers
// ============================================================================

Status ResolutionOracle::GrantManager(const TxContext& ctx, const Address& who) {
    return Execute("GrantManager", ctx, std::nullopt, Payable::No, [&]() -> Status {
        if (managers_.count(ctx.sender) == 0) {
            return Status::Error(ErrorCode::UNAUTHORIZED, "caller is not a manager");
        }
        if (who.IsNull()) {
            return Status::Error(ErrorCode::INVALID_ARGUMENT, "null address");
        }
        if (!managers_.insert(who).second) {
            return Status::Error(ErrorCode::INVALID_ARGUMENT, "already a manager");
        }
        LOG_INFO(util::LogCategory::RESOLUTION) << "manager granted to " << who.ToHex();
        Emit(EventType::ManagerGranted, MarketRound(), who);
        return Status::Ok();
    });
}

Status ResolutionOracle::RevokeManager(const TxContext& ctx, const Address& who) {
    return Execute("RevokeManager", ctx, std::nullopt, Payable::No, [&]() -> Status {
        if (managers_.count(ctx.sender) == 0) {
            return Status::Error(ErrorCode::UNAUTHORIZED, "caller is not a manager");
        }
        if (managers_.erase(who) == 0) {
            return Status::Error(ErrorCode::INVALID_ARGUMENT, "not a manager");
        }
        LOG_INFO(util::LogCategory::RESOLUTION) << "manager revoked from " << who.ToHex();
        Emit(EventType::ManagerRevoked, MarketRound(), who);
        return Status::Ok();
    });
}

Status ResolutionOracle::WithdrawProtocolFees(const TxContext& ctx, const Address& to,
                                              Amount amount) {
    return Execute("WithdrawProtocolFees", ctx, std::nullopt, Payable::No, [&]() -> Status {
        if (managers_.count(ctx.sender) == 0) {
            return Status::Error(ErrorCode::UNAUTHORIZED, "caller is not a manager");
        }
        if (to.IsNull()) {
            return Status::Error(ErrorCode::INVALID_ARGUMENT, "null recipient");
        }
        Status status = ledger_.WithdrawFees(to, amount, *collaborators_.payouts);
        if (!status.ok()) {
            return status;
        }
        Emit(EventType::FeesWithdrawn, MarketRound(), to, amount);
        return Status::Ok();
    });
}

bool ResolutionOracle::IsManager(const Address& who) const {
    util::NonReentrantGuard guard(mutex_);
    return managers_.count(who) > 0;
}

// ============================================================================
// Views
// ============================================================================

uint32_t ResolutionOracle::GetCurrentRound(MarketId market) const {
    util::NonReentrantGuard guard(mutex_);
    return CurrentRound(market).round;
}

std::optional<Resolution> ResolutionOracle::GetResolution(MarketId market, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    if (const Resolution* resolution = FindResolution(SelectRound(market, round))) {
        return *resolution;
    }
    return std::nullopt;
}

std::optional<ResolutionCommit> ResolutionOracle::GetCommit(MarketId market,
                                                            const Address& committer,
                                                            Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = commits_.find({SelectRound(market, round), committer});
    if (it == commits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Stake> ResolutionOracle::GetSupportStake(MarketId market, const Address& who,
                                                       Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = supportStakes_.find({SelectRound(market, round), who});
    if (it == supportStakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Stake> ResolutionOracle::GetOppositionStake(MarketId market, const Address& who,
                                                          Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = oppositionStakes_.find({SelectRound(market, round), who});
    if (it == oppositionStakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Dispute> ResolutionOracle::GetDisputes(MarketId market, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = disputes_.find(SelectRound(market, round));
    return it == disputes_.end() ? std::vector<Dispute>() : it->second;
}

std::optional<Stake> ResolutionOracle::GetDisputeStake(MarketId market, size_t index,
                                                       const Address& who, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = disputeStakes_.find({SelectRound(market, round), index, who});
    if (it == disputeStakes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ResolutionOracle::HasEndorsed(MarketId market, size_t index, const Address& legislator,
                                   Round round) const {
    util::NonReentrantGuard guard(mutex_);
    return endorsements_.count({SelectRound(market, round), index, legislator}) > 0;
}

std::vector<EvidenceChallenge> ResolutionOracle::GetEvidenceChallenges(MarketId market,
                                                                       Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = challenges_.find(SelectRound(market, round));
    return it == challenges_.end() ? std::vector<EvidenceChallenge>() : it->second;
}

std::optional<LegislatorVoteCommit> ResolutionOracle::GetVoteCommit(
    MarketId market, const Address& legislator, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = voteCommits_.find({SelectRound(market, round), legislator});
    if (it == voteCommits_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ResolutionOracle::IsEligibleLegislator(MarketId market, const Address& legislator,
                                            Round round) const {
    util::NonReentrantGuard guard(mutex_);
    return IsSnapshotLegislator(SelectRound(market, round), legislator);
}

std::optional<Settlement> ResolutionOracle::GetSettlement(MarketId market, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = settlements_.find(SelectRound(market, round));
    if (it == settlements_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Amount> ResolutionOracle::GetRequiredDisputeBond(MarketId market,
                                                               Timestamp now) const {
    util::NonReentrantGuard guard(mutex_);
    const Resolution* resolution = FindResolution(CurrentRound(market));
    if (!resolution) {
        return std::nullopt;
    }
    return CalculateRequiredDisputeBond(resolution->totalSupport, resolution->proposalTime, now);
}

std::optional<uint64_t> ResolutionOracle::CalculateResolutionScore(MarketId market) const {
    util::NonReentrantGuard guard(mutex_);
    const Resolution* resolution = FindResolution(CurrentRound(market));
    if (!resolution) {
        return std::nullopt;
    }
    return ScoreResolution(*resolution);
}

std::optional<uint64_t> ResolutionOracle::CalculateDisputeScore(MarketId market,
                                                                size_t index) const {
    util::NonReentrantGuard guard(mutex_);
    auto it = disputes_.find(CurrentRound(market));
    if (it == disputes_.end() || index >= it->second.size()) {
        return std::nullopt;
    }
    return ScoreDispute(it->second[index]);
}

std::optional<RecordedPrice> ResolutionOracle::GetRecordedPrice(MarketId market) {
    util::NonReentrantGuard guard(mutex_);
    const Resolution* resolution = FindResolution(CurrentRound(market));
    if (!resolution || !resolution->priceReferenceRecorded) {
        return std::nullopt;
    }
    return notifier_.GetRecordedPrice(market);
}

ledger::TreasuryLedger ResolutionOracle::GetLedger() const {
    util::NonReentrantGuard guard(mutex_);
    return ledger_;
}

MarketSnapshot ResolutionOracle::GetSnapshot(MarketId market, Round round) const {
    util::NonReentrantGuard guard(mutex_);
    return BuildSnapshot(SelectRound(market, round));
}

// ============================================================================
// Events, Store and Ledger Hooks
// ============================================================================

void ResolutionOracle::OnEvent(EventListener listener) {
    util::NonReentrantGuard guard(mutex_);
    listeners_.push_back(std::move(listener));
}

std::vector<ResolutionEvent> ResolutionOracle::GetRecentEvents(size_t max) const {
    util::NonReentrantGuard guard(mutex_);
    size_t count = std::min(max, journal_.size());
    return std::vector<ResolutionEvent>(journal_.end() - count, journal_.end());
}

void ResolutionOracle::SetStore(ResolutionStore* store) {
    util::NonReentrantGuard guard(mutex_);
    store_ = store;
}

void ResolutionOracle::SetBalanceProvider(ledger::TreasuryLedger::BalanceProvider provider) {
    util::NonReentrantGuard guard(mutex_);
    ledger_.SetBalanceProvider(std::move(provider));
}

} // namespace resolution
} // namespace arbiter
