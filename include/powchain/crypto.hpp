#pragma once

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <optional>

namespace powchain::crypto {

// Type aliases for cryptographic primitives
using Hash256 = std::array<uint8_t, 32>;
using PrivateKey = std::array<uint8_t, 32>;
using PublicKey = std::array<uint8_t, 33>; // Compressed
using Signature = std::array<uint8_t, 64>; // r + s components

/**
 * @brief SHA-256 hash function (OpenSSL)
 */
class SHA256 {
public:
    static Hash256 hash(const std::vector<uint8_t>& data);
    static Hash256 hash(const uint8_t* data, size_t length);
    static Hash256 hash(const std::string& data);
    static Hash256 double_hash(const std::vector<uint8_t>& data); // SHA256(SHA256(x))

    /// Lowercase hex digest of a text message
    static std::string hex_digest(const std::string& message);
};

/**
 * @brief ECDSA cryptographic operations using secp256k1 curve
 */
class ECDSA {
public:
    // Key generation
    static PrivateKey generate_private_key();
    static std::optional<PublicKey> derive_public_key(const PrivateKey& private_key);

    // Digital signatures
    static std::optional<Signature> sign(const Hash256& message_hash, const PrivateKey& private_key);
    static bool verify(const Hash256& message_hash, const Signature& signature, const PublicKey& public_key);

    /// True when the key is a non-zero scalar below the group order
    static bool is_valid_private_key(const PrivateKey& key);
};

/**
 * @brief Binary Merkle root over transaction hashes
 *
 * Each level pairs adjacent nodes as SHA256(left || right); a level with an
 * odd count pairs its last node with itself. No leaves give the zero hash.
 */
class MerkleTree {
public:
    explicit MerkleTree(std::vector<Hash256> leaf_hashes);

    const Hash256& get_root() const { return root_; }

private:
    Hash256 root_{};
};

/**
 * @brief Utility functions for cryptographic operations
 */
namespace utils {
    std::string to_hex(const std::vector<uint8_t>& data);
    std::string to_hex(const Hash256& hash);
    std::string to_hex(const PublicKey& key);

    /// Decode hex of either case; nullopt on odd length or a non-hex digit
    std::optional<std::vector<uint8_t>> from_hex(const std::string& hex);
}

} // namespace powchain::crypto
