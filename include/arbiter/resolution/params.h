// ARBITER - Resolution Protocol Parameters
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Durations, thresholds and minimum amounts of the resolution protocol.
// These are fixed for every market and never configurable per call.

#ifndef ARBITER_RESOLUTION_PARAMS_H
#define ARBITER_RESOLUTION_PARAMS_H

#include <arbiter/core/amount.h>
#include <arbiter/core/types.h>

namespace arbiter {
namespace resolution {

constexpr Timestamp MINUTE = 60;
constexpr Timestamp HOUR = 60 * MINUTE;

// ============================================================================
// Minimum Amounts
// ============================================================================

/// Bond attached to a resolution commitment
constexpr Amount MIN_COMMIT_BOND = COIN / 10;

/// Stake attached to the reveal; becomes the proposer's support
constexpr Amount MIN_PROPOSAL_STAKE = COIN;

/// Support, opposition and dispute-support contributions
constexpr Amount MIN_STAKE_AMOUNT = COIN / 100;

constexpr Amount MIN_CHALLENGE_STAKE = COIN / 2;

constexpr Amount MIN_DISPUTE_BOND = COIN;
constexpr Amount MAX_DISPUTE_BOND = 1000 * COIN;

// ============================================================================
// Windows
// ============================================================================

constexpr Timestamp MIN_REVEAL_DELAY = 5 * MINUTE;
constexpr Timestamp MAX_REVEAL_DELAY = 24 * HOUR;

/// Minimum spacing between two commitments by the same caller, any market
constexpr Timestamp COMMIT_COOLDOWN = HOUR;

constexpr Timestamp SUPPORT_PERIOD = 24 * HOUR;
constexpr Timestamp EARLY_BONUS_FULL_PERIOD = HOUR;
constexpr Timestamp PROPOSER_BONUS_PERIOD = 24 * HOUR;
constexpr Timestamp EVIDENCE_CHALLENGE_PERIOD = 24 * HOUR;

/// Vote commits open when the support window closes
constexpr Timestamp VOTE_COMMIT_PERIOD = 24 * HOUR;
constexpr Timestamp VOTE_REVEAL_PERIOD = 24 * HOUR;

/// Measured from proposal time
constexpr Timestamp DISPUTE_PERIOD = 72 * HOUR;

/// Extra delay before claims may finalize on their own
constexpr Timestamp FINALIZATION_BUFFER = HOUR;

// ============================================================================
// Limits
// ============================================================================

constexpr size_t MAX_EVIDENCE_CHALLENGES = 10;
constexpr size_t MAX_DISPUTES_PER_MARKET = 20;
constexpr size_t MAX_EVIDENCE_URI_LENGTH = 512;
constexpr size_t MAX_CHALLENGE_REASON_LENGTH = 1024;

// ============================================================================
// Rates (basis points)
// ============================================================================

constexpr int64_t MAX_SUPPORT_BONUS_BPS = 1000;
constexpr int64_t MAX_PROPOSER_BONUS_BPS = 500;
constexpr int64_t UNREVEALED_BOUNTY_BPS = 1000;
constexpr int64_t APPROVAL_THRESHOLD_BPS = 7500;
constexpr int64_t SUPERMAJORITY_BPS = 6666;
constexpr int64_t LEGISLATOR_SLASH_BPS = 1000;
constexpr int64_t PROTOCOL_FEE_BPS = 250;
constexpr int64_t STAKE_SCORE_WEIGHT_BPS = 6000;
constexpr int64_t VOTE_SCORE_WEIGHT_BPS = 4000;
constexpr int64_t CHALLENGER_BONUS_BPS = 3000;
constexpr int64_t CHALLENGER_BONUS_CAP_BPS = 5000;

// ============================================================================
// Scoring
// ============================================================================

/// Backer count is capped before it multiplies the stake term
constexpr uint64_t MAX_SCORED_BACKERS = 10;

/// Score contributed by a single delegate vote or endorsement
constexpr uint64_t LEGISLATOR_VOTE_WEIGHT = 10;

/// Entries kept in the in-memory event journal
constexpr size_t MAX_EVENT_JOURNAL = 4096;

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_PARAMS_H
