#pragma once

#include "powchain/transaction.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace powchain {

/// Source of wall-clock time for block timestamps
class IClock {
public:
    virtual ~IClock() = default;

    /// Seconds since the Unix epoch; non-decreasing within a process run
    virtual uint64_t get_unix_time() const = 0;
};

/// Commitment over an ordered transaction list
class IMerkleCommitment {
public:
    virtual ~IMerkleCommitment() = default;

    /// Deterministic, order-sensitive root of transactions
    virtual std::string get_merkle_root(const std::vector<transaction::Transaction>& transactions) const = 0;
};

/// Clock backed by std::chrono::system_clock
class SystemClock : public IClock {
public:
    uint64_t get_unix_time() const override;
};

/// Binary SHA-256 Merkle tree over transaction hashes, hex encoded.
/// An empty list commits to the empty string.
class Sha256MerkleCommitment : public IMerkleCommitment {
public:
    std::string get_merkle_root(const std::vector<transaction::Transaction>& transactions) const override;
};

/// Process-wide default collaborators
const IClock& system_clock();
const IMerkleCommitment& default_merkle_commitment();

} // namespace powchain
