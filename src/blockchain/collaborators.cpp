#include "powchain/collaborators.hpp"
#include <chrono>

namespace powchain {

using namespace crypto;

uint64_t SystemClock::get_unix_time() const {
    auto now = std::chrono::system_clock::now();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::string Sha256MerkleCommitment::get_merkle_root(
    const std::vector<transaction::Transaction>& transactions) const {
    if (transactions.empty()) {
        return "";
    }

    std::vector<Hash256> tx_hashes;
    tx_hashes.reserve(transactions.size());
    for (const auto& tx : transactions) {
        tx_hashes.push_back(tx.get_hash());
    }

    MerkleTree tree(tx_hashes);
    return utils::to_hex(tree.get_root());
}

const IClock& system_clock() {
    static const SystemClock instance{};
    return instance;
}

const IMerkleCommitment& default_merkle_commitment() {
    static const Sha256MerkleCommitment instance{};
    return instance;
}

} // namespace powchain
