#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace powchain {

/// Raised by modular arithmetic when an operation is undefined for its inputs
/// (non-coprime inverse, non-positive modulus).
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

/// Block operation and validation outcome
enum class BlockResult {
    SUCCESS = 0,
    EXHAUSTED_NONCE,        ///< Nonce already at its maximum value
    OVERSIZED_BLOCK,        ///< More transactions than the per-block limit
    INVALID_SIGNATURE,      ///< A non-reward transaction failed verification
    HASH_MISMATCH,          ///< Stored hash differs from the recomputed digest
    DIFFICULTY_NOT_MET,     ///< Hash fails the nibble-wise target
    MERKLE_MISMATCH,        ///< Stored merkle root differs from the transactions
    DUPLICATE_REWARD,       ///< More than one reward transaction in the block
    REWARD_ALREADY_PRESENT, ///< reward_miner called on a block that has a reward
    HEIGHT_MISMATCH,        ///< Height is not predecessor height + 1
    PREV_HASH_MISMATCH      ///< prev_hash does not link to the predecessor
};

/// Short name of a result code for diagnostics
const char* to_string(BlockResult result);

/// Verdict of a full block validation
struct ValidationResult {
    BlockResult result = BlockResult::SUCCESS;
    std::string reason;

    bool ok() const { return result == BlockResult::SUCCESS; }

    static ValidationResult success() { return {}; }
    static ValidationResult failure(BlockResult result, std::string reason) {
        return ValidationResult{result, std::move(reason)};
    }
};

} // namespace powchain
