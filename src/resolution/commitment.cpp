// ARBITER - Commitment Digests
// Copyright (c) 2024 ARBITER Developers
// MIT License

#include <arbiter/resolution/commitment.h>

#include <arbiter/core/serialize.h>
#include <arbiter/crypto/hash.h>

namespace arbiter {
namespace resolution {

Hash256 ComputeResolutionCommitment(uint32_t outcome,
                                    const std::string& evidenceURI,
                                    const Hash256& evidenceHash,
                                    const Hash256& salt,
                                    const Address& committer) {
    DataStream ss;
    ss << outcome << evidenceURI << evidenceHash << salt << committer;
    return SHA3Hash(ss);
}

Hash256 ComputeVoteCommitment(MarketId market,
                              bool support,
                              const Hash256& salt,
                              const Address& legislator) {
    DataStream ss;
    ss << market << support << salt << legislator;
    return SHA3Hash(ss);
}

} // namespace resolution
} // namespace arbiter
