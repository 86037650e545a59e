// ARBITER - Timing Bonuses, Dispute Bonds and Scores
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Pure integer functions shared by the protocol operations and its views.

#ifndef ARBITER_RESOLUTION_SCORING_H
#define ARBITER_RESOLUTION_SCORING_H

#include <arbiter/resolution/types.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace arbiter {
namespace resolution {

// ============================================================================
// Timing Bonuses
// ============================================================================

/**
 * Bonus for support staked at `now`.
 *
 * Full MAX_SUPPORT_BONUS_BPS within EARLY_BONUS_FULL_PERIOD of the proposal,
 * linear decay to zero at SUPPORT_PERIOD, zero before the proposal.
 */
int64_t CalculateSupportBonusBps(Timestamp proposalTime, Timestamp now);

/// Bonus for proposing soon after trading ended; same shape over PROPOSER_BONUS_PERIOD
int64_t CalculateProposerBonusBps(Timestamp tradingEnd, Timestamp proposalTime);

/// amount * (BPS + bonusBps) / BPS
Amount ApplyBonus(Amount amount, int64_t bonusBps);

// ============================================================================
// Dispute Bond
// ============================================================================

/**
 * Bond required to dispute at `now`.
 *
 * Twice the current support, scaled from 100% to 200% across the dispute
 * window, clamped to [MIN_DISPUTE_BOND, MAX_DISPUTE_BOND].
 */
Amount CalculateRequiredDisputeBond(Amount totalSupport, Timestamp proposalTime,
                                    Timestamp now);

// ============================================================================
// Scores
// ============================================================================

/// isqrt(stake / COIN) * min(backers, 10) * 6000 + votes * 10 * 4000
uint64_t CalculateScore(Amount stake, uint64_t backers, uint64_t votes);

uint64_t ScoreResolution(const Resolution& resolution);
uint64_t ScoreDispute(const Dispute& dispute);

/**
 * Pick the winning dispute among the active ones.
 *
 * Scans in index order and replaces the leader only on a strictly higher
 * score, so the earlier index wins a tie. The winner must also strictly
 * exceed the resolution's score.
 */
std::optional<size_t> SelectWinningDispute(uint64_t resolutionScore,
                                           const std::vector<Dispute>& disputes);

// ============================================================================
// Thresholds
// ============================================================================

/// support >= 75% of support + opposition
bool ReachesApproval(Amount support, Amount opposition);

/// votes >= 66.66% of total (total > 0)
bool ReachesSupermajority(uint64_t votes, uint64_t total);

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_SCORING_H
