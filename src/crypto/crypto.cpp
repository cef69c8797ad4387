#include "powchain/crypto.hpp"
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <secp256k1.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace powchain::crypto {

// Global secp256k1 context (thread-safe)
static secp256k1_context* g_secp256k1_context = nullptr;
static std::once_flag g_secp256k1_init_flag;

static void init_secp256k1_context() {
    std::call_once(g_secp256k1_init_flag, []() {
        g_secp256k1_context = secp256k1_context_create(
            SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY
        );
        if (!g_secp256k1_context) {
            throw std::runtime_error("Failed to create secp256k1 context");
        }

        // Add randomness to the context
        unsigned char seed[32];
        if (RAND_bytes(seed, 32) != 1) {
            throw std::runtime_error("Failed to generate random seed for secp256k1");
        }
        if (!secp256k1_context_randomize(g_secp256k1_context, seed)) {
            throw std::runtime_error("Failed to randomize secp256k1 context");
        }
    });
}

// SHA-256 Implementation
Hash256 SHA256::hash(const std::vector<uint8_t>& data) {
    return hash(data.data(), data.size());
}

Hash256 SHA256::hash(const uint8_t* data, size_t length) {
    Hash256 result;
    ::SHA256(data, length, result.data());
    return result;
}

Hash256 SHA256::hash(const std::string& data) {
    return hash(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Hash256 SHA256::double_hash(const std::vector<uint8_t>& data) {
    Hash256 first_hash = hash(data);
    return hash(first_hash.data(), first_hash.size());
}

std::string SHA256::hex_digest(const std::string& message) {
    return utils::to_hex(hash(message));
}

// ECDSA Implementation
PrivateKey ECDSA::generate_private_key() {
    init_secp256k1_context();

    PrivateKey private_key;
    do {
        if (RAND_bytes(private_key.data(), 32) != 1) {
            throw std::runtime_error("Failed to generate random bytes for private key");
        }
    } while (!secp256k1_ec_seckey_verify(g_secp256k1_context, private_key.data()));

    return private_key;
}

std::optional<PublicKey> ECDSA::derive_public_key(const PrivateKey& private_key) {
    init_secp256k1_context();

    if (!is_valid_private_key(private_key)) {
        return std::nullopt;
    }

    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_create(g_secp256k1_context, &pubkey, private_key.data())) {
        return std::nullopt;
    }

    PublicKey compressed_pubkey;
    size_t output_len = compressed_pubkey.size();
    secp256k1_ec_pubkey_serialize(
        g_secp256k1_context,
        compressed_pubkey.data(),
        &output_len,
        &pubkey,
        SECP256K1_EC_COMPRESSED
    );

    return compressed_pubkey;
}

std::optional<Signature> ECDSA::sign(const Hash256& message_hash, const PrivateKey& private_key) {
    init_secp256k1_context();

    if (!is_valid_private_key(private_key)) {
        return std::nullopt;
    }

    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ecdsa_sign(g_secp256k1_context, &sig, message_hash.data(), private_key.data(), nullptr, nullptr)) {
        return std::nullopt;
    }

    Signature compact_sig;
    secp256k1_ecdsa_signature_serialize_compact(g_secp256k1_context, compact_sig.data(), &sig);

    return compact_sig;
}

bool ECDSA::verify(const Hash256& message_hash, const Signature& signature, const PublicKey& public_key) {
    init_secp256k1_context();

    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_parse(g_secp256k1_context, &pubkey, public_key.data(), public_key.size())) {
        return false;
    }

    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ecdsa_signature_parse_compact(g_secp256k1_context, &sig, signature.data())) {
        return false;
    }

    return secp256k1_ecdsa_verify(g_secp256k1_context, &sig, message_hash.data(), &pubkey) == 1;
}

bool ECDSA::is_valid_private_key(const PrivateKey& key) {
    init_secp256k1_context();
    return secp256k1_ec_seckey_verify(g_secp256k1_context, key.data()) == 1;
}

MerkleTree::MerkleTree(std::vector<Hash256> leaf_hashes) {
    std::vector<Hash256> level = std::move(leaf_hashes);
    if (level.empty()) {
        return;
    }

    uint8_t pair[64];
    while (level.size() > 1) {
        if (level.size() % 2 != 0) {
            level.push_back(level.back());
        }

        // Parents overwrite the front half in place
        for (size_t i = 0; i < level.size() / 2; ++i) {
            std::copy(level[2 * i].begin(), level[2 * i].end(), pair);
            std::copy(level[2 * i + 1].begin(), level[2 * i + 1].end(), pair + 32);
            level[i] = SHA256::hash(pair, sizeof(pair));
        }
        level.resize(level.size() / 2);
    }

    root_ = level.front();
}

// Utility functions
namespace utils {

namespace {

std::string encode_hex(const uint8_t* data, size_t length) {
    static const char digits[] = "0123456789abcdef";
    std::string hex(length * 2, '0');
    for (size_t i = 0; i < length; ++i) {
        hex[2 * i] = digits[data[i] >> 4];
        hex[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return hex;
}

} // namespace

std::string to_hex(const std::vector<uint8_t>& data) {
    return encode_hex(data.data(), data.size());
}

std::string to_hex(const Hash256& hash) {
    return encode_hex(hash.data(), hash.size());
}

std::string to_hex(const PublicKey& key) {
    return encode_hex(key.data(), key.size());
}

std::optional<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.length() / 2);

    auto hex_to_nibble = [](char c) -> std::optional<uint8_t> {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return std::nullopt;
    };

    for (size_t i = 0; i < hex.length(); i += 2) {
        auto high_nibble = hex_to_nibble(hex[i]);
        auto low_nibble = hex_to_nibble(hex[i + 1]);

        if (!high_nibble || !low_nibble) {
            return std::nullopt;
        }

        bytes.push_back(static_cast<uint8_t>((*high_nibble << 4) | *low_nibble));
    }

    return bytes;
}

} // namespace utils

} // namespace powchain::crypto
