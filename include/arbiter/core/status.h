// ARBITER - Operation Status
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Result type returned by every state-mutating protocol operation.
// A failed operation never changes protocol state.

#ifndef ARBITER_CORE_STATUS_H
#define ARBITER_CORE_STATUS_H

#include <string>

namespace arbiter {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    OK = 0,

    // Input validation
    INVALID_ARGUMENT,
    INVALID_COMMITMENT,
    INVALID_OUTCOME,
    INVALID_EVIDENCE,
    INVALID_REASON,
    INSUFFICIENT_VALUE,

    // Phase and window checks
    WRONG_MARKET_PHASE,
    TRADING_NOT_ENDED,
    WINDOW_NOT_OPEN,
    WINDOW_CLOSED,
    COMMIT_COOLDOWN,
    NOT_PENDING,
    ALREADY_FINALIZED,
    NOT_FINALIZED,
    CHALLENGES_PENDING,

    // Record lookups
    COMMIT_NOT_FOUND,
    COMMIT_EXISTS,
    COMMIT_CONSUMED,
    RESOLUTION_NOT_FOUND,
    RESOLUTION_EXISTS,
    DISPUTE_NOT_FOUND,
    CHALLENGE_NOT_FOUND,
    LIMIT_REACHED,

    // Identity and permissions
    UNAUTHORIZED,
    NOT_ELIGIBLE,
    SELF_SUPPORT,
    ALREADY_VOTED,
    ALREADY_ENDORSED,
    ALREADY_RESOLVED,
    ALREADY_SLASHED,

    // Claims
    NOTHING_TO_CLAIM,
    ALREADY_CLAIMED,
    STAKE_WITHDRAWN,

    // Funds
    INSUFFICIENT_FUNDS,
    INSOLVENT,
    TRANSFER_FAILED,

    // Execution
    MARKET_UNAVAILABLE,
    REENTRANT_CALL,
};

/// Stable human-readable name of an error code
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Status
// ============================================================================

class Status {
public:
    Status() : code_(ErrorCode::OK) {}
    Status(ErrorCode code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status Error(ErrorCode code, const std::string& msg = "") { return Status(code, msg); }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return ok(); }

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;

private:
    ErrorCode code_;
    std::string message_;
};

} // namespace arbiter

#endif // ARBITER_CORE_STATUS_H
