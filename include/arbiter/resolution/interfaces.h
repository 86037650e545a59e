// ARBITER - External Collaborators
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Interfaces to the systems the resolution protocol talks to but does not
// own: the prediction market, the elected delegate roster, the reputation
// ledger and the price oracle. Implementations may return false (or an
// empty optional) or throw std::exception on failure.

#ifndef ARBITER_RESOLUTION_INTERFACES_H
#define ARBITER_RESOLUTION_INTERFACES_H

#include <arbiter/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace arbiter {
namespace resolution {

// ============================================================================
// Market
// ============================================================================

/// Resolution state machine of the external market
enum class MarketPhase : uint8_t {
    Trading,
    Settlement,
    Proposed,
    DisputeWindow,
    Disputed,
    Finalized,
};

const char* MarketPhaseToString(MarketPhase phase);

struct MarketInfo {
    Timestamp tradingEnd{0};
    bool resolved{false};
    Amount totalStake{0};
    uint32_t outcomeCount{0};
};

class IMarket {
public:
    virtual ~IMarket() = default;

    virtual std::optional<MarketPhase> GetResolutionPhase(MarketId market) = 0;

    /// Move the market's resolution state machine to phase
    virtual bool AdvanceResolutionPhase(MarketId market, MarketPhase phase) = 0;

    virtual bool SetFinalOutcome(MarketId market, uint32_t outcome) = 0;

    virtual std::optional<MarketInfo> GetMarketInfo(MarketId market) = 0;

    /// Price feed of a price-linked market; nullopt for other markets
    virtual std::optional<Hash256> GetPriceFeedId(MarketId market) = 0;
    virtual std::optional<std::string> GetPriceAsset(MarketId market) = 0;
};

// ============================================================================
// Delegate Roster
// ============================================================================

class ILegislatorRoster {
public:
    virtual ~ILegislatorRoster() = default;

    virtual bool IsLegislator(const Address& who) = 0;
    virtual uint64_t GetVotingWeight(const Address& who) = 0;
    virtual std::vector<Address> GetLegislators() = 0;
};

// ============================================================================
// Reputation
// ============================================================================

class IReputationLedger {
public:
    virtual ~IReputationLedger() = default;

    virtual Amount BalanceOf(const Address& who) = 0;
    virtual bool Slash(const Address& who, Amount amount) = 0;
};

// ============================================================================
// Price Oracle
// ============================================================================

struct RecordedPrice {
    int64_t value{0};
    Timestamp timestamp{0};
    uint64_t round{0};
    std::string asset;
    bool recorded{false};
    bool stale{false};
};

class IPriceOracle {
public:
    virtual ~IPriceOracle() = default;

    /// Bind the current price of feedId as the reference for market
    virtual bool RecordPrice(MarketId market, const Hash256& feedId,
                             const std::string& asset) = 0;
    virtual std::optional<RecordedPrice> GetRecordedPrice(MarketId market) = 0;
};

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_INTERFACES_H
