#include "powchain/transaction.hpp"
#include "powchain/serialize.hpp"
#include <sstream>

namespace powchain {
namespace transaction {

using namespace crypto;
using namespace serialize;

Transaction::Transaction(const PublicKey& sender, const PublicKey& recipient,
                         uint64_t amount, uint64_t timestamp)
    : sender(sender), recipient(recipient), amount(amount), timestamp(timestamp) {}

PublicKey Transaction::identity_sender() {
    return PublicKey{};
}

bool Transaction::is_reward() const {
    return sender == identity_sender();
}

std::vector<uint8_t> Transaction::serialize_unsigned() const {
    std::vector<uint8_t> data;
    data.reserve(SERIALIZED_SIZE);

    write_bytes(data, sender);
    write_bytes(data, recipient);
    write_uint64_le(data, amount);
    write_uint64_le(data, timestamp);

    return data;
}

std::vector<uint8_t> Transaction::serialize() const {
    auto data = serialize_unsigned();
    write_bytes(data, signature);
    return data;
}

std::optional<Transaction> Transaction::deserialize(const std::vector<uint8_t>& data, size_t& offset) {
    Transaction tx;

    if (!read_bytes(data, offset, tx.sender)) return std::nullopt;
    if (!read_bytes(data, offset, tx.recipient)) return std::nullopt;

    auto amount = read_uint64_le(data, offset);
    if (!amount) return std::nullopt;
    tx.amount = *amount;

    auto timestamp = read_uint64_le(data, offset);
    if (!timestamp) return std::nullopt;
    tx.timestamp = *timestamp;

    if (!read_bytes(data, offset, tx.signature)) return std::nullopt;

    return tx;
}

Hash256 Transaction::get_signing_hash() const {
    return SHA256::hash(serialize_unsigned());
}

Hash256 Transaction::get_hash() const {
    return SHA256::double_hash(serialize());
}

std::string Transaction::get_txid() const {
    return utils::to_hex(get_hash());
}

bool Transaction::sign(const PrivateKey& private_key) {
    auto public_key = ECDSA::derive_public_key(private_key);
    if (!public_key || *public_key != sender) {
        return false;
    }

    auto sig = ECDSA::sign(get_signing_hash(), private_key);
    if (!sig) {
        return false;
    }

    signature = *sig;
    return true;
}

bool Transaction::verify() const {
    // Rewards have no signer to check against
    if (is_reward()) return false;

    return ECDSA::verify(get_signing_hash(), signature, sender);
}

std::string Transaction::to_string() const {
    std::ostringstream ss;
    ss << "\ttxid: " << get_txid() << "\n"
       << "\tsender: " << (is_reward() ? std::string("<reward>") : utils::to_hex(sender)) << "\n"
       << "\trecipient: " << utils::to_hex(recipient) << "\n"
       << "\tamount: " << amount << "\n"
       << "\ttimestamp: " << timestamp;
    return ss.str();
}

std::optional<Transaction> Transaction::create_signed(const PrivateKey& sender_key,
                                                      const PublicKey& recipient,
                                                      uint64_t amount,
                                                      uint64_t timestamp) {
    auto sender = ECDSA::derive_public_key(sender_key);
    if (!sender) return std::nullopt;

    Transaction tx(*sender, recipient, amount, timestamp);
    if (!tx.sign(sender_key)) return std::nullopt;

    return tx;
}

Transaction Transaction::reward_transaction(const PublicKey& miner_address, uint64_t timestamp) {
    return Transaction(identity_sender(), miner_address, validation::REWARD_AMOUNT, timestamp);
}

bool Transaction::operator==(const Transaction& other) const {
    return sender == other.sender &&
           recipient == other.recipient &&
           amount == other.amount &&
           timestamp == other.timestamp &&
           signature == other.signature;
}

} // namespace transaction
} // namespace powchain
