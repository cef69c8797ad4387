#pragma once

#include "powchain/crypto.hpp"
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace powchain {
namespace transaction {

using namespace crypto;

/// Transaction constants
namespace validation {
    /// Base units per coin
    constexpr uint64_t COIN = 100000000ULL;

    /// Miner reward (1.5 coins)
    constexpr uint64_t REWARD_AMOUNT = COIN + COIN / 2;
}

/// Value transfer from one public key to another, signed by the sender
class Transaction {
public:
    PublicKey sender{};            ///< Signer; all zeros marks a miner reward
    PublicKey recipient{};         ///< Receiving public key
    uint64_t amount = 0;           ///< Value in base units
    uint64_t timestamp = 0;        ///< Creation time (Unix seconds)
    Signature signature{};         ///< Compact ECDSA signature over get_signing_hash()

    /// Default constructor
    Transaction() = default;

    /// Constructor for an unsigned transaction
    Transaction(const PublicKey& sender, const PublicKey& recipient,
                uint64_t amount, uint64_t timestamp);

    /// Reserved sender value meaning "no real signer"
    static PublicKey identity_sender();

    /// Get sender public key
    const PublicKey& get_sender() const { return sender; }

    /// Check if the sender is the identity sentinel
    bool is_reward() const;

    /// Hash of every field except the signature
    Hash256 get_signing_hash() const;

    /// Transaction hash (double SHA-256 of the full serialization)
    Hash256 get_hash() const;

    /// Transaction ID as hex string
    std::string get_txid() const;

    /// Sign with the sender's private key. Fails if the key does not belong to sender.
    bool sign(const PrivateKey& private_key);

    /// Verify the signature against the sender key
    bool verify() const;

    /// Serialize transaction to bytes
    std::vector<uint8_t> serialize() const;

    /// Deserialize transaction from bytes starting at offset
    static std::optional<Transaction> deserialize(const std::vector<uint8_t>& data, size_t& offset);

    /// Human-readable dump
    std::string to_string() const;

    /// Create and sign a transfer
    static std::optional<Transaction> create_signed(const PrivateKey& sender_key,
                                                    const PublicKey& recipient,
                                                    uint64_t amount,
                                                    uint64_t timestamp);

    /// Create an unsigned miner reward paying miner_address
    static Transaction reward_transaction(const PublicKey& miner_address, uint64_t timestamp = 0);

    bool operator==(const Transaction& other) const;
    bool operator!=(const Transaction& other) const { return !(*this == other); }

    static constexpr size_t SERIALIZED_SIZE = 33 + 33 + 8 + 8 + 64;

private:
    std::vector<uint8_t> serialize_unsigned() const;
};

} // namespace transaction
} // namespace powchain
