#include "powchain/block.hpp"
#include "powchain/serialize.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <sstream>
#include <thread>

namespace powchain {

const char* to_string(BlockResult result) {
    switch (result) {
        case BlockResult::SUCCESS: return "SUCCESS";
        case BlockResult::EXHAUSTED_NONCE: return "EXHAUSTED_NONCE";
        case BlockResult::OVERSIZED_BLOCK: return "OVERSIZED_BLOCK";
        case BlockResult::INVALID_SIGNATURE: return "INVALID_SIGNATURE";
        case BlockResult::HASH_MISMATCH: return "HASH_MISMATCH";
        case BlockResult::DIFFICULTY_NOT_MET: return "DIFFICULTY_NOT_MET";
        case BlockResult::MERKLE_MISMATCH: return "MERKLE_MISMATCH";
        case BlockResult::DUPLICATE_REWARD: return "DUPLICATE_REWARD";
        case BlockResult::REWARD_ALREADY_PRESENT: return "REWARD_ALREADY_PRESENT";
        case BlockResult::HEIGHT_MISMATCH: return "HEIGHT_MISMATCH";
        case BlockResult::PREV_HASH_MISMATCH: return "PREV_HASH_MISMATCH";
    }
    return "UNKNOWN";
}

namespace block {

using namespace crypto;
using namespace serialize;

// Block implementation
Block Block::create_genesis(const IClock& clock) {
    Block genesis;
    genesis.height_ = 0;
    genesis.timestamp_ = clock.get_unix_time();
    genesis.nonce_ = 0;
    genesis.difficulty_ = validation::GENESIS_DIFFICULTY;

    genesis.set_hash();
    return genesis;
}

Block Block::create_next(const Block& prev,
                         std::vector<Transaction> transactions,
                         const IClock& clock,
                         const IMerkleCommitment& merkle) {
    Block block;
    block.height_ = prev.height_ + 1;
    block.timestamp_ = clock.get_unix_time();
    block.prev_hash_ = prev.hash_;
    block.nonce_ = 0;
    block.difficulty_ = prev.difficulty_;
    block.merkle_root_ = merkle.get_merkle_root(transactions);
    block.transactions_ = std::move(transactions);

    block.set_hash();
    return block;
}

Block Block::restore(uint64_t height, std::string hash, uint64_t timestamp,
                     std::string prev_hash, uint32_t nonce, uint32_t difficulty,
                     std::string merkle_root, std::vector<Transaction> transactions) {
    Block block;
    block.height_ = height;
    block.hash_ = std::move(hash);
    block.timestamp_ = timestamp;
    block.prev_hash_ = std::move(prev_hash);
    block.nonce_ = nonce;
    block.difficulty_ = difficulty;
    block.merkle_root_ = std::move(merkle_root);
    block.transactions_ = std::move(transactions);
    return block;
}

BlockResult Block::reward_miner(const PublicKey& miner_address, const IMerkleCommitment& merkle) {
    if (has_reward()) {
        std::cerr << "There is already a reward in block " << height_ << std::endl;
        return BlockResult::REWARD_ALREADY_PRESENT;
    }

    transactions_.push_back(Transaction::reward_transaction(miner_address, timestamp_));
    merkle_root_ = merkle.get_merkle_root(transactions_);
    set_hash();

    return BlockResult::SUCCESS;
}

void Block::set_difficulty(uint32_t difficulty) {
    difficulty_ = difficulty;
    set_hash();
}

BlockResult Block::increment_and_hash() {
    return advance_nonce(1);
}

BlockResult Block::advance_nonce(uint32_t step) {
    if (nonce_ > std::numeric_limits<uint32_t>::max() - step) {
        std::cerr << "Nonce of block " << height_
                  << " is exhausted, consider changing transactions" << std::endl;
        return BlockResult::EXHAUSTED_NONCE;
    }

    nonce_ += step;
    set_hash();

    return BlockResult::SUCCESS;
}

size_t Block::get_reward_count() const {
    return static_cast<size_t>(std::count_if(transactions_.begin(), transactions_.end(),
                                             [](const Transaction& tx) { return tx.is_reward(); }));
}

std::string Block::get_message() const {
    return std::to_string(height_) +
           std::to_string(timestamp_) +
           prev_hash_ +
           std::to_string(nonce_) +
           std::to_string(difficulty_) +
           merkle_root_;
}

void Block::set_hash() {
    hash_ = SHA256::hex_digest(get_message());
}

bool Block::verify_transactions() const {
    if (transactions_.size() > validation::MAX_TRANSACTIONS_PER_BLOCK) {
        std::cerr << transactions_.size() << " is too many transactions" << std::endl;
        return false;
    }

    for (size_t i = 0; i < transactions_.size(); ++i) {
        const auto& tx = transactions_[i];

        // Rewards carry no signature
        if (!tx.is_reward() && !tx.verify()) {
            std::cerr << "Transaction " << i << " of block " << height_ << " is invalid\n"
                      << tx.to_string() << std::endl;
            return false;
        }
    }

    return true;
}

bool Block::verify_hash() const {
    return hash_ == SHA256::hex_digest(get_message());
}

bool Block::verify_merkle_root(const IMerkleCommitment& merkle) const {
    return merkle_root_ == merkle.get_merkle_root(transactions_);
}

bool Block::meets_difficulty() const {
    return mining::verify_difficulty(hash_, difficulty_);
}

std::vector<uint8_t> Block::serialize() const {
    std::vector<uint8_t> data;
    data.reserve(256 + transactions_.size() * Transaction::SERIALIZED_SIZE);

    write_uint64_le(data, height_);
    write_string(data, hash_);
    write_uint64_le(data, timestamp_);
    write_string(data, prev_hash_);
    write_uint32_le(data, nonce_);
    write_uint32_le(data, difficulty_);
    write_string(data, merkle_root_);

    // Transaction count
    write_varint(data, transactions_.size());

    // Serialize transactions
    for (const auto& tx : transactions_) {
        auto tx_data = tx.serialize();
        data.insert(data.end(), tx_data.begin(), tx_data.end());
    }

    return data;
}

std::optional<Block> Block::deserialize(const std::vector<uint8_t>& data) {
    size_t offset = 0;

    auto height = read_uint64_le(data, offset);
    if (!height) return std::nullopt;

    auto hash = read_string(data, offset);
    if (!hash) return std::nullopt;

    auto timestamp = read_uint64_le(data, offset);
    if (!timestamp) return std::nullopt;

    auto prev_hash = read_string(data, offset);
    if (!prev_hash) return std::nullopt;

    auto nonce = read_uint32_le(data, offset);
    if (!nonce) return std::nullopt;

    auto difficulty = read_uint32_le(data, offset);
    if (!difficulty) return std::nullopt;

    auto merkle_root = read_string(data, offset);
    if (!merkle_root) return std::nullopt;

    auto tx_count = read_varint(data, offset);
    if (!tx_count) return std::nullopt;
    if (*tx_count > (data.size() - offset) / Transaction::SERIALIZED_SIZE) return std::nullopt;

    std::vector<Transaction> transactions;
    transactions.reserve(*tx_count);

    for (uint64_t i = 0; i < *tx_count; ++i) {
        auto tx = Transaction::deserialize(data, offset);
        if (!tx) return std::nullopt;
        transactions.push_back(std::move(*tx));
    }

    // Trailing bytes mean the record is not a block
    if (offset != data.size()) return std::nullopt;

    return restore(*height, std::move(*hash), *timestamp, std::move(*prev_hash),
                   *nonce, *difficulty, std::move(*merkle_root), std::move(transactions));
}

std::string Block::to_string() const {
    std::ostringstream ss;
    ss << "\theight: " << height_ << "\n"
       << "\thash: " << hash_ << "\n"
       << "\ttimestamp: " << timestamp_ << "\n"
       << "\tprev_hash: " << prev_hash_ << "\n"
       << "\tnonce: " << nonce_ << "\n"
       << "\tdifficulty: " << difficulty_ << "\n"
       << "\tmerkle root: " << merkle_root_;
    return ss.str();
}

// Validation namespace
namespace validation {
    bool validate_block_size(const Block& block) {
        return block.get_transaction_count() <= MAX_TRANSACTIONS_PER_BLOCK;
    }

    bool validate_reward_count(const Block& block) {
        return block.get_reward_count() <= 1;
    }

    bool validate_linkage(const Block& block, const Block* prev_block) {
        if (!prev_block) {
            return block.get_height() == 0 && block.get_prev_hash().empty();
        }
        return block.get_height() == prev_block->get_height() + 1 &&
               block.get_prev_hash() == prev_block->get_hash();
    }

    ValidationResult validate_block(const Block& block, const Block* prev_block,
                                    const IMerkleCommitment& merkle) {
        if (!validate_block_size(block)) {
            return ValidationResult::failure(BlockResult::OVERSIZED_BLOCK,
                std::to_string(block.get_transaction_count()) + " transactions exceed the limit of " +
                std::to_string(MAX_TRANSACTIONS_PER_BLOCK));
        }

        if (!block.verify_hash()) {
            return ValidationResult::failure(BlockResult::HASH_MISMATCH,
                "stored hash " + block.get_hash() + " does not match block contents");
        }

        if (!block.meets_difficulty()) {
            return ValidationResult::failure(BlockResult::DIFFICULTY_NOT_MET,
                "hash " + block.get_hash() + " does not satisfy difficulty " +
                utils::format_difficulty(block.get_difficulty()));
        }

        // verify_hash only covers the committed root, not the transactions behind it
        if (!block.verify_merkle_root(merkle)) {
            return ValidationResult::failure(BlockResult::MERKLE_MISMATCH,
                "merkle root " + block.get_merkle_root() + " does not commit to the transactions");
        }

        if (!validate_reward_count(block)) {
            return ValidationResult::failure(BlockResult::DUPLICATE_REWARD,
                std::to_string(block.get_reward_count()) + " reward transactions in one block");
        }

        if (!block.verify_transactions()) {
            return ValidationResult::failure(BlockResult::INVALID_SIGNATURE,
                "a transaction signature failed verification");
        }

        if (!validate_linkage(block, prev_block)) {
            if (prev_block && block.get_height() != prev_block->get_height() + 1) {
                return ValidationResult::failure(BlockResult::HEIGHT_MISMATCH,
                    "height " + std::to_string(block.get_height()) + " does not follow " +
                    std::to_string(prev_block->get_height()));
            }
            if (!prev_block && block.get_height() != 0) {
                return ValidationResult::failure(BlockResult::HEIGHT_MISMATCH,
                    "block without predecessor must have height 0");
            }
            return ValidationResult::failure(BlockResult::PREV_HASH_MISMATCH,
                "prev_hash " + block.get_prev_hash() + " does not link to the predecessor");
        }

        return ValidationResult::success();
    }
}

// Mining namespace
namespace mining {
    bool verify_difficulty(const std::string& hash_hex, uint32_t difficulty) {
        if (hash_hex.size() < 8) {
            return false;
        }

        // Last 8 characters (4 bytes) of the hash, big-endian
        uint32_t hash_value = 0;
        for (size_t i = hash_hex.size() - 8; i < hash_hex.size(); ++i) {
            char c = hash_hex[i];
            uint32_t nibble;
            if (c >= '0' && c <= '9') nibble = c - '0';
            else if (c >= 'a' && c <= 'f') nibble = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') nibble = c - 'A' + 10;
            else return false;
            hash_value = (hash_value << 4) | nibble;
        }

        // Nibble by nibble, not a numeric comparison
        for (int shift = 0; shift <= 28; shift += 4) {
            uint32_t difficulty_bits = (difficulty >> shift) & 0xF;
            uint32_t hash_bits = (hash_value >> shift) & 0xF;

            if (hash_bits > difficulty_bits) {
                return false;
            }
        }

        return true;
    }

    MiningResult mine_block(Block& block, uint64_t max_iterations) {
        MiningResult result;

        auto start_time = std::chrono::steady_clock::now();

        while (!block.meets_difficulty()) {
            if (result.iterations >= max_iterations) {
                break;
            }

            result.result = block.increment_and_hash();
            if (result.result != BlockResult::SUCCESS) {
                break;
            }
            result.iterations++;
        }

        result.success = block.meets_difficulty();
        if (!result.success && result.result == BlockResult::SUCCESS) {
            result.result = BlockResult::DIFFICULTY_NOT_MET;
        }
        result.nonce = block.get_nonce();
        result.hash = block.get_hash();

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);
        result.hash_rate = calculate_hash_rate(result.iterations, duration.count() / 1000000.0);

        return result;
    }

    void run_workers(unsigned worker_count, std::atomic<bool>& stop,
                     const std::function<void(unsigned)>& work) {
        std::mutex error_mutex;
        std::exception_ptr error;

        auto guarded = [&](unsigned index) {
            try {
                work(index);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!error) {
                    error = std::current_exception();
                }
                stop.store(true);
            }
        };

        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        try {
            for (unsigned i = 0; i < worker_count; ++i) {
                workers.emplace_back(guarded, i);
            }
        } catch (...) {
            std::cerr << "Failed to start mining thread " << workers.size() << std::endl;
            stop.store(true);
            for (auto& t : workers) {
                t.join();
            }
            throw;
        }

        for (auto& t : workers) {
            t.join();
        }

        if (error) {
            std::rethrow_exception(error);
        }
    }

    MiningResult mine_block_parallel(Block& block, unsigned worker_count) {
        if (worker_count == 0) {
            worker_count = 1;
        }

        MiningResult result;
        std::atomic<bool> found{false};
        std::atomic<uint64_t> total_iterations{0};
        std::mutex winner_mutex;
        std::optional<Block> winner;

        auto start_time = std::chrono::steady_clock::now();

        auto worker = [&](unsigned index) {
            Block candidate = block;
            uint64_t iterations = 0;

            if (index > 0 && candidate.advance_nonce(index) != BlockResult::SUCCESS) {
                return;
            }

            while (!found.load(std::memory_order_relaxed)) {
                if (candidate.meets_difficulty()) {
                    std::lock_guard<std::mutex> lock(winner_mutex);
                    if (!found.load()) {
                        winner = candidate;
                        found.store(true);
                    }
                    break;
                }
                if (candidate.advance_nonce(worker_count) != BlockResult::SUCCESS) {
                    break;
                }
                ++iterations;
            }

            total_iterations += iterations;
        };

        run_workers(worker_count, found, worker);

        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time);

        result.iterations = total_iterations.load();
        result.hash_rate = calculate_hash_rate(result.iterations, duration.count() / 1000000.0);

        if (winner) {
            block = std::move(*winner);
            result.success = true;
            result.nonce = block.get_nonce();
            result.hash = block.get_hash();
        } else {
            result.result = BlockResult::EXHAUSTED_NONCE;
        }

        return result;
    }

    double calculate_hash_rate(uint64_t iterations, double time_seconds) {
        return iterations / std::max(time_seconds, 0.001);
    }
}

// Utility functions
namespace utils {
    std::string block_to_json(const Block& block) {
        std::ostringstream ss;
        ss << "{\"height\":" << block.get_height()
           << ",\"hash\":\"" << block.get_hash() << "\""
           << ",\"timestamp\":" << block.get_timestamp()
           << ",\"prev_hash\":\"" << block.get_prev_hash() << "\""
           << ",\"nonce\":" << block.get_nonce()
           << ",\"difficulty\":" << block.get_difficulty()
           << ",\"merkle_root\":\"" << block.get_merkle_root() << "\""
           << ",\"transactions\":[";

        const auto& transactions = block.get_transactions();
        for (size_t i = 0; i < transactions.size(); ++i) {
            const auto& tx = transactions[i];
            if (i > 0) ss << ",";
            ss << "{\"txid\":\"" << tx.get_txid() << "\""
               << ",\"sender\":\"" << crypto::utils::to_hex(tx.sender) << "\""
               << ",\"recipient\":\"" << crypto::utils::to_hex(tx.recipient) << "\""
               << ",\"amount\":" << tx.amount
               << ",\"timestamp\":" << tx.timestamp << "}";
        }
        ss << "]}";

        return ss.str();
    }

    std::optional<Block> parse_block_hex(const std::string& hex) {
        auto bytes = crypto::utils::from_hex(hex);
        if (!bytes) return std::nullopt;
        return Block::deserialize(*bytes);
    }

    std::string block_to_hex(const Block& block) {
        return crypto::utils::to_hex(block.serialize());
    }

    std::string format_difficulty(uint32_t difficulty) {
        std::ostringstream ss;
        ss << "0x" << std::hex << std::setw(8) << std::setfill('0') << difficulty;
        return ss.str();
    }
}

} // namespace block
} // namespace powchain
