// ARBITER - Operation Status Implementation
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/core/status.h>

namespace arbiter {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";

        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::INVALID_COMMITMENT: return "Invalid commitment";
        case ErrorCode::INVALID_OUTCOME: return "Invalid outcome";
        case ErrorCode::INVALID_EVIDENCE: return "Invalid evidence";
        case ErrorCode::INVALID_REASON: return "Invalid reason";
        case ErrorCode::INSUFFICIENT_VALUE: return "Insufficient value attached";

        case ErrorCode::WRONG_MARKET_PHASE: return "Wrong market phase";
        case ErrorCode::TRADING_NOT_ENDED: return "Trading not ended";
        case ErrorCode::WINDOW_NOT_OPEN: return "Window not open";
        case ErrorCode::WINDOW_CLOSED: return "Window closed";
        case ErrorCode::COMMIT_COOLDOWN: return "Commit cooldown active";
        case ErrorCode::NOT_PENDING: return "Resolution not pending";
        case ErrorCode::ALREADY_FINALIZED: return "Already finalized";
        case ErrorCode::NOT_FINALIZED: return "Not finalized";
        case ErrorCode::CHALLENGES_PENDING: return "Evidence challenges pending";

        case ErrorCode::COMMIT_NOT_FOUND: return "Commit not found";
        case ErrorCode::COMMIT_EXISTS: return "Commit already exists";
        case ErrorCode::COMMIT_CONSUMED: return "Commit already consumed";
        case ErrorCode::RESOLUTION_NOT_FOUND: return "Resolution not found";
        case ErrorCode::RESOLUTION_EXISTS: return "Resolution already exists";
        case ErrorCode::DISPUTE_NOT_FOUND: return "Dispute not found";
        case ErrorCode::CHALLENGE_NOT_FOUND: return "Challenge not found";
        case ErrorCode::LIMIT_REACHED: return "Limit reached";

        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::NOT_ELIGIBLE: return "Not eligible";
        case ErrorCode::SELF_SUPPORT: return "Cannot support own dispute";
        case ErrorCode::ALREADY_VOTED: return "Already voted";
        case ErrorCode::ALREADY_ENDORSED: return "Already endorsed";
        case ErrorCode::ALREADY_RESOLVED: return "Already resolved";
        case ErrorCode::ALREADY_SLASHED: return "Already slashed";

        case ErrorCode::NOTHING_TO_CLAIM: return "Nothing to claim";
        case ErrorCode::ALREADY_CLAIMED: return "Already claimed";
        case ErrorCode::STAKE_WITHDRAWN: return "Stake withdrawn";

        case ErrorCode::INSUFFICIENT_FUNDS: return "Insufficient funds";
        case ErrorCode::INSOLVENT: return "Ledger insolvent";
        case ErrorCode::TRANSFER_FAILED: return "Transfer failed";

        case ErrorCode::MARKET_UNAVAILABLE: return "Market unavailable";
        case ErrorCode::REENTRANT_CALL: return "Reentrant call";

        default: return "Unknown error";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = ErrorCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace arbiter
