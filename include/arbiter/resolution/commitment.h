// ARBITER - Commitment Digests
// Copyright (c) 2024 ARBITER Developers
// MIT License
//
// Commit-reveal digests. Clients compute the same digest off-line and submit
// it before revealing the preimage.
//
// Encoding (little-endian, strings length-prefixed):
//   resolution: outcome(u32) | evidenceURI | evidenceHash(32) | salt(32) | committer(20)
//   vote:       market(u64) | support(u8) | salt(32) | legislator(20)
// The digest is SHA3-256 of the encoding.

#ifndef ARBITER_RESOLUTION_COMMITMENT_H
#define ARBITER_RESOLUTION_COMMITMENT_H

#include <arbiter/core/types.h>

#include <string>

namespace arbiter {
namespace resolution {

Hash256 ComputeResolutionCommitment(uint32_t outcome,
                                    const std::string& evidenceURI,
                                    const Hash256& evidenceHash,
                                    const Hash256& salt,
                                    const Address& committer);

Hash256 ComputeVoteCommitment(MarketId market,
                              bool support,
                              const Hash256& salt,
                              const Address& legislator);

} // namespace resolution
} // namespace arbiter

#endif // ARBITER_RESOLUTION_COMMITMENT_H
