// ARBITER - Test Doubles for External Collaborators
// Copyright (c) 2024 ARBITER Developers
// MIT License

#ifndef ARBITER_TESTS_RESOLUTION_FAKES_H
#define ARBITER_TESTS_RESOLUTION_FAKES_H

#include <arbiter/ledger/treasury.h>
#include <arbiter/resolution/interfaces.h>

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace arbiter {
namespace resolution {
namespace test {

inline Address MakeAddress(Byte value) {
    std::array<Byte, 20> data{};
    data.fill(value);
    return Address(data);
}

inline Hash256 MakeHash(Byte value) {
    std::array<Byte, 32> data{};
    data.fill(value);
    return Hash256(data);
}

/// How a fake reacts to a call
enum class FailMode { None, ReturnFalse, Throw };

// ============================================================================
// Market
// ============================================================================

class FakeMarket : public IMarket {
public:
    void AddMarket(MarketId market, Timestamp tradingEnd, uint32_t outcomeCount,
                   MarketPhase phase = MarketPhase::Settlement) {
        MarketInfo info;
        info.tradingEnd = tradingEnd;
        info.outcomeCount = outcomeCount;
        infos[market] = info;
        phases[market] = phase;
    }

    std::optional<MarketPhase> GetResolutionPhase(MarketId market) override {
        if (throwOnQuery) {
            throw std::runtime_error("market unreachable");
        }
        auto it = phases.find(market);
        if (it == phases.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool AdvanceResolutionPhase(MarketId market, MarketPhase phase) override {
        if (onAdvance) {
            onAdvance();
        }
        if (advanceMode == FailMode::Throw) {
            throw std::runtime_error("advance reverted");
        }
        if (advanceMode == FailMode::ReturnFalse) {
            return false;
        }
        phases[market] = phase;
        advances.emplace_back(market, phase);
        return true;
    }

    bool SetFinalOutcome(MarketId market, uint32_t outcome) override {
        finalOutcomes[market] = outcome;
        infos[market].resolved = true;
        return true;
    }

    std::optional<MarketInfo> GetMarketInfo(MarketId market) override {
        if (throwOnQuery) {
            throw std::runtime_error("market unreachable");
        }
        auto it = infos.find(market);
        if (it == infos.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<Hash256> GetPriceFeedId(MarketId market) override {
        auto it = feeds.find(market);
        if (it == feeds.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<std::string> GetPriceAsset(MarketId market) override {
        auto it = assets.find(market);
        if (it == assets.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::map<MarketId, MarketPhase> phases;
    std::map<MarketId, MarketInfo> infos;
    std::map<MarketId, Hash256> feeds;
    std::map<MarketId, std::string> assets;
    std::map<MarketId, uint32_t> finalOutcomes;
    std::vector<std::pair<MarketId, MarketPhase>> advances;

    FailMode advanceMode{FailMode::None};
    bool throwOnQuery{false};

    /// Runs inside AdvanceResolutionPhase, before it takes effect
    std::function<void()> onAdvance;
};

// ============================================================================
// Delegate Roster
// ============================================================================

class FakeRoster : public ILegislatorRoster {
public:
    bool IsLegislator(const Address& who) override {
        return weights.count(who) > 0;
    }

    uint64_t GetVotingWeight(const Address& who) override {
        auto it = weights.find(who);
        return it == weights.end() ? 0 : it->second;
    }

    std::vector<Address> GetLegislators() override {
        if (throwOnList) {
            throw std::runtime_error("roster unavailable");
        }
        std::vector<Address> result;
        for (const auto& [who, weight] : weights) {
            result.push_back(who);
        }
        return result;
    }

    std::map<Address, uint64_t> weights;
    bool throwOnList{false};
};

// ============================================================================
// Reputation
// ============================================================================

class FakeReputation : public IReputationLedger {
public:
    Amount BalanceOf(const Address& who) override {
        auto it = balances.find(who);
        return it == balances.end() ? 0 : it->second;
    }

    bool Slash(const Address& who, Amount amount) override {
        if (slashMode == FailMode::Throw) {
            throw std::runtime_error("slash reverted");
        }
        if (slashMode == FailMode::ReturnFalse) {
            return false;
        }
        balances[who] -= amount;
        slashed[who] += amount;
        return true;
    }

    std::map<Address, Amount> balances;
    std::map<Address, Amount> slashed;
    FailMode slashMode{FailMode::None};
};

// ============================================================================
// Price Oracle
// ============================================================================

class FakePriceOracle : public IPriceOracle {
public:
    bool RecordPrice(MarketId market, const Hash256& feedId, const std::string& asset) override {
        if (recordMode == FailMode::Throw) {
            throw std::runtime_error("feed stale");
        }
        if (recordMode == FailMode::ReturnFalse) {
            return false;
        }
        RecordedPrice price;
        price.value = currentPrice;
        price.timestamp = 1;
        price.round = ++round;
        price.asset = asset;
        price.recorded = true;
        recorded[market] = price;
        recordedFeeds[market] = feedId;
        return true;
    }

    std::optional<RecordedPrice> GetRecordedPrice(MarketId market) override {
        auto it = recorded.find(market);
        if (it == recorded.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    int64_t currentPrice{0};
    uint64_t round{0};
    std::map<MarketId, RecordedPrice> recorded;
    std::map<MarketId, Hash256> recordedFeeds;
    FailMode recordMode{FailMode::None};
};

// ============================================================================
// Payouts
// ============================================================================

class FakePayoutSink : public ledger::IPayoutSink {
public:
    bool Transfer(const Address& to, Amount amount) override {
        if (onTransfer) {
            onTransfer(to, amount);
        }
        if (refuse.count(to) > 0) {
            return false;
        }
        if (throwFor.count(to) > 0) {
            throw std::runtime_error("recipient reverted");
        }
        received[to] += amount;
        total += amount;
        return true;
    }

    Amount ReceivedBy(const Address& who) const {
        auto it = received.find(who);
        return it == received.end() ? 0 : it->second;
    }

    std::map<Address, Amount> received;
    Amount total{0};
    std::set<Address> refuse;
    std::set<Address> throwFor;

    /// Runs inside Transfer, before the recipient is credited
    std::function<void(const Address&, Amount)> onTransfer;
};

} // namespace test
} // namespace resolution
} // namespace arbiter

#endif // ARBITER_TESTS_RESOLUTION_FAKES_H
