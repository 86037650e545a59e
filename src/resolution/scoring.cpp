// ARBITER - Timing Bonuses, Dispute Bonds and Scores
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/scoring.h>

#include <arbiter/core/amount.h>
#include <arbiter/resolution/params.h>

#include <algorithm>

namespace arbiter {
namespace resolution {

namespace {

/// Full bonus up to fullPeriod, then linear decay to zero at period
int64_t DecayingBonus(Timestamp elapsed, Timestamp fullPeriod, Timestamp period,
                      int64_t maxBps) {
    if (elapsed < 0 || elapsed >= period) {
        return 0;
    }
    if (elapsed <= fullPeriod) {
        return maxBps;
    }
    return maxBps * (period - elapsed) / (period - fullPeriod);
}

} // namespace

// ============================================================================
// Timing Bonuses
// ============================================================================

int64_t CalculateSupportBonusBps(Timestamp proposalTime, Timestamp now) {
    return DecayingBonus(now - proposalTime, EARLY_BONUS_FULL_PERIOD, SUPPORT_PERIOD,
                         MAX_SUPPORT_BONUS_BPS);
}

int64_t CalculateProposerBonusBps(Timestamp tradingEnd, Timestamp proposalTime) {
    return DecayingBonus(proposalTime - tradingEnd, EARLY_BONUS_FULL_PERIOD,
                         PROPOSER_BONUS_PERIOD, MAX_PROPOSER_BONUS_BPS);
}

Amount ApplyBonus(Amount amount, int64_t bonusBps) {
    return MulDiv(amount, BPS_DENOMINATOR + bonusBps, BPS_DENOMINATOR);
}

// ============================================================================
// Dispute Bond
// ============================================================================

Amount CalculateRequiredDisputeBond(Amount totalSupport, Timestamp proposalTime,
                                    Timestamp now) {
    Timestamp elapsed = std::clamp<Timestamp>(now - proposalTime, 0, DISPUTE_PERIOD);
    Amount base = MulDiv(totalSupport, 2, 1);
    int64_t multiplier = BPS_DENOMINATOR + BPS_DENOMINATOR * elapsed / DISPUTE_PERIOD;
    Amount bond = MulDiv(base, multiplier, BPS_DENOMINATOR);
    return std::clamp(bond, MIN_DISPUTE_BOND, MAX_DISPUTE_BOND);
}

// ============================================================================
// Scores
// ============================================================================

uint64_t CalculateScore(Amount stake, uint64_t backers, uint64_t votes) {
    uint64_t wholeUnits = stake > 0 ? static_cast<uint64_t>(stake / COIN) : 0;
    uint64_t stakeTerm = ISqrt(wholeUnits) * std::min(backers, MAX_SCORED_BACKERS);
    uint64_t voteTerm = votes * LEGISLATOR_VOTE_WEIGHT;
    return stakeTerm * STAKE_SCORE_WEIGHT_BPS + voteTerm * VOTE_SCORE_WEIGHT_BPS;
}

uint64_t ScoreResolution(const Resolution& resolution) {
    return CalculateScore(resolution.totalSupport, resolution.supportCount,
                          resolution.legislatorSupportVotes);
}

uint64_t ScoreDispute(const Dispute& dispute) {
    // The challenger counts as a backer
    return CalculateScore(dispute.Pool(), uint64_t(dispute.supporterCount) + 1,
                          dispute.endorsements);
}

std::optional<size_t> SelectWinningDispute(uint64_t resolutionScore,
                                           const std::vector<Dispute>& disputes) {
    std::optional<size_t> winner;
    uint64_t best = resolutionScore;
    for (size_t i = 0; i < disputes.size(); ++i) {
        if (disputes[i].status != DisputeStatus::Active) {
            continue;
        }
        uint64_t score = ScoreDispute(disputes[i]);
        if (score > best) {
            best = score;
            winner = i;
        }
    }
    return winner;
}

// ============================================================================
// Thresholds
// ============================================================================

bool ReachesApproval(Amount support, Amount opposition) {
    Amount total = support + opposition;
    if (total <= 0) {
        return false;
    }
    return static_cast<__int128>(support) * BPS_DENOMINATOR >=
           static_cast<__int128>(total) * APPROVAL_THRESHOLD_BPS;
}

bool ReachesSupermajority(uint64_t votes, uint64_t total) {
    if (total == 0) {
        return false;
    }
    return static_cast<unsigned __int128>(votes) * BPS_DENOMINATOR >=
           static_cast<unsigned __int128>(total) * SUPERMAJORITY_BPS;
}

} // namespace resolution
} // namespace arbiter
