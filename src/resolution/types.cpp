// ARBITER - Resolution Records
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/types.h>

namespace arbiter {
namespace resolution {

const char* ResolutionStatusToString(ResolutionStatus status) {
    switch (status) {
        case ResolutionStatus::Pending: return "pending";
        case ResolutionStatus::Approved: return "approved";
        case ResolutionStatus::Rejected: return "rejected";
        default: return "unknown";
    }
}

const char* DisputeStatusToString(DisputeStatus status) {
    switch (status) {
        case DisputeStatus::Active: return "active";
        case DisputeStatus::Upheld: return "upheld";
        case DisputeStatus::Rejected: return "rejected";
        default: return "unknown";
    }
}

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::CommitSubmitted: return "CommitSubmitted";
        case EventType::ResolutionProposed: return "ResolutionProposed";
        case EventType::CommitSlashed: return "CommitSlashed";
        case EventType::SupportAdded: return "SupportAdded";
        case EventType::OppositionAdded: return "OppositionAdded";
        case EventType::ResolutionApproved: return "ResolutionApproved";
        case EventType::EvidenceChallenged: return "EvidenceChallenged";
        case EventType::EvidenceChallengeResolved: return "EvidenceChallengeResolved";
        case EventType::VoteCommitted: return "VoteCommitted";
        case EventType::VoteRevealed: return "VoteRevealed";
        case EventType::LegislatorSlashed: return "LegislatorSlashed";
        case EventType::VoteOverride: return "VoteOverride";
        case EventType::DisputeFiled: return "DisputeFiled";
        case EventType::DisputeSupported: return "DisputeSupported";
        case EventType::DisputeEndorsed: return "DisputeEndorsed";
        case EventType::ResolutionFinalized: return "ResolutionFinalized";
        case EventType::ResolutionRejected: return "ResolutionRejected";
        case EventType::DisputeUpheld: return "DisputeUpheld";
        case EventType::RewardClaimed: return "RewardClaimed";
        case EventType::DisputeStakeReclaimed: return "DisputeStakeReclaimed";
        case EventType::ManagerGranted: return "ManagerGranted";
        case EventType::ManagerRevoked: return "ManagerRevoked";
        case EventType::FeesWithdrawn: return "FeesWithdrawn";
        case EventType::ExternalCallFailed: return "ExternalCallFailed";
        case EventType::StoreWriteFailed: return "StoreWriteFailed";
        default: return "Unknown";
    }
}

} // namespace resolution
} // namespace arbiter
