#pragma once

#include "powchain/transaction.hpp"
#include "powchain/crypto.hpp"
#include "powchain/collaborators.hpp"
#include "powchain/errors.hpp"
#include <atomic>
#include <functional>
#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include <thread>

namespace powchain {
namespace block {

using namespace crypto;
using namespace transaction;

/// Block validation rules
namespace validation {
    /// Maximum transactions per block, reward included
    constexpr size_t MAX_TRANSACTIONS_PER_BLOCK = 5000;

    /// Genesis difficulty: every nibble at 0xF accepts any hash
    constexpr uint32_t GENESIS_DIFFICULTY = 0xFFFFFFFF;
}

/**
 * @brief Chained, hashable, mineable unit of the ledger
 *
 * The hash is always the SHA-256 hex digest of get_message(). Fields that
 * feed the message are private and every mutator rehashes as its last step.
 * Copies are independent, so mining workers can each own one.
 */
class Block {
public:
    /// Default constructor (empty, unhashed; used as a storage out-parameter)
    Block() = default;

    /// Create genesis block: height 0, no predecessor, maximal difficulty
    static Block create_genesis(const IClock& clock = system_clock());

    /// Create successor of prev carrying transactions. Inherits prev's
    /// difficulty and does not search for a satisfying nonce.
    static Block create_next(const Block& prev,
                             std::vector<Transaction> transactions,
                             const IClock& clock = system_clock(),
                             const IMerkleCommitment& merkle = default_merkle_commitment());

    /// Rebuild a block from stored fields. The hash is kept exactly as given.
    static Block restore(uint64_t height, std::string hash, uint64_t timestamp,
                         std::string prev_hash, uint32_t nonce, uint32_t difficulty,
                         std::string merkle_root, std::vector<Transaction> transactions);

    /// Append a reward paying miner_address unless the block already has one
    BlockResult reward_miner(const PublicKey& miner_address,
                             const IMerkleCommitment& merkle = default_merkle_commitment());

    /// Replace difficulty and rehash. Does not re-mine.
    void set_difficulty(uint32_t difficulty);

    /// Advance nonce by one and rehash. Returns EXHAUSTED_NONCE, leaving the
    /// block untouched, when the nonce is already at its maximum.
    BlockResult increment_and_hash();

    /// Advance nonce by step and rehash. Returns EXHAUSTED_NONCE, leaving the
    /// block untouched, when the result would not fit in 32 bits.
    BlockResult advance_nonce(uint32_t step);

    uint64_t get_height() const { return height_; }
    const std::string& get_hash() const { return hash_; }
    uint64_t get_timestamp() const { return timestamp_; }
    const std::string& get_prev_hash() const { return prev_hash_; }
    uint32_t get_nonce() const { return nonce_; }
    uint32_t get_difficulty() const { return difficulty_; }
    const std::string& get_merkle_root() const { return merkle_root_; }
    const std::vector<Transaction>& get_transactions() const { return transactions_; }
    size_t get_transaction_count() const { return transactions_.size(); }

    /// Number of transactions sent by the identity sentinel
    size_t get_reward_count() const;

    /// Check if block has a reward transaction
    bool has_reward() const { return get_reward_count() > 0; }

    /// Canonical message the hash is computed over
    std::string get_message() const;

    /// Size limit and signature of every non-reward transaction
    bool verify_transactions() const;

    /// Stored hash equals the digest of the current fields
    bool verify_hash() const;

    /// Stored merkle root equals the commitment recomputed from transactions
    bool verify_merkle_root(const IMerkleCommitment& merkle = default_merkle_commitment()) const;

    /// Hash satisfies the block's own difficulty
    bool meets_difficulty() const;

    /// Serialize block to bytes
    std::vector<uint8_t> serialize() const;

    /// Deserialize block from bytes
    static std::optional<Block> deserialize(const std::vector<uint8_t>& data);

    /// Multi-line field dump
    std::string to_string() const;

private:
    uint64_t height_ = 0;
    std::string hash_;
    uint64_t timestamp_ = 0;
    std::string prev_hash_;
    uint32_t nonce_ = 0;
    uint32_t difficulty_ = 0;
    std::string merkle_root_;
    std::vector<Transaction> transactions_;

    void set_hash();
};

/// Block validation rules
namespace validation {
    /// Transaction count within MAX_TRANSACTIONS_PER_BLOCK
    bool validate_block_size(const Block& block);

    /// At most one reward transaction
    bool validate_reward_count(const Block& block);

    /// Height and prev_hash link to prev_block (genesis when prev_block is null)
    bool validate_linkage(const Block& block, const Block* prev_block);

    /// Full block validation: size, hash, difficulty, merkle root, reward
    /// count, signatures and linkage. Returns the first failure.
    ValidationResult validate_block(const Block& block, const Block* prev_block,
                                    const IMerkleCommitment& merkle = default_merkle_commitment());
}

/// Mining utilities
namespace mining {
    /// Mining result
    struct MiningResult {
        bool success = false;
        uint32_t nonce = 0;
        std::string hash;
        uint64_t iterations = 0;
        double hash_rate = 0.0; // hashes per second
        BlockResult result = BlockResult::SUCCESS;
    };

    /// Check a hex hash against a difficulty word nibble by nibble.
    /// Each of the eight nibbles of the hash's last 4 bytes must be <= the
    /// difficulty nibble at the same position.
    bool verify_difficulty(const std::string& hash_hex, uint32_t difficulty);

    /// Advance the nonce from its current value until the difficulty is met
    MiningResult mine_block(Block& block, uint64_t max_iterations = UINT64_MAX);

    /// Run work(0) .. work(worker_count - 1) on their own threads and join
    /// them all. A failing worker sets stop and its exception is rethrown
    /// after the join. If a thread cannot be started, stop is set, the
    /// threads already running are joined and the error propagates.
    void run_workers(unsigned worker_count, std::atomic<bool>& stop,
                     const std::function<void(unsigned)>& work);

    /// Race worker_count threads over disjoint nonce residues. Each worker
    /// mines a private copy; the first winner is copied back into block.
    /// Errors from the workers propagate with block left unchanged.
    MiningResult mine_block_parallel(Block& block,
                                     unsigned worker_count = std::thread::hardware_concurrency());

    /// Calculate hash rate from mining result
    double calculate_hash_rate(uint64_t iterations, double time_seconds);
}

/// Block utilities
namespace utils {
    /// Convert block to JSON for debugging
    std::string block_to_json(const Block& block);

    /// Parse block from hex string
    std::optional<Block> parse_block_hex(const std::string& hex);

    /// Convert block to hex string
    std::string block_to_hex(const Block& block);

    /// Difficulty as 0x-prefixed 8-digit hex
    std::string format_difficulty(uint32_t difficulty);
}

} // namespace block
} // namespace powchain
