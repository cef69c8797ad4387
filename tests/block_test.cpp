#include <gtest/gtest.h>
#include "powchain/block.hpp"
#include "test_helpers.hpp"
#include <limits>

using namespace powchain;
using namespace powchain::block;
using powchain::test::FixedClock;
using powchain::test::TestKey;

class BlockTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice = TestKey::generate();
        bob = TestKey::generate();
        genesis = Block::create_genesis(genesis_clock);
    }

    Block make_next(size_t tx_count) {
        return Block::create_next(genesis, test::make_signed_transactions(alice, bob, tx_count), next_clock);
    }

    // Same header fields as block, different transactions, hash kept as is
    static Block with_transactions(const Block& block, std::vector<Transaction> transactions) {
        return Block::restore(block.get_height(), block.get_hash(), block.get_timestamp(),
                              block.get_prev_hash(), block.get_nonce(), block.get_difficulty(),
                              block.get_merkle_root(), std::move(transactions));
    }

    FixedClock genesis_clock{1700000000};
    FixedClock next_clock{1700001200};
    TestKey alice;
    TestKey bob;
    Block genesis;
};

TEST_F(BlockTest, GenesisBlock) {
    EXPECT_EQ(genesis.get_height(), 0u);
    EXPECT_TRUE(genesis.get_prev_hash().empty());
    EXPECT_EQ(genesis.get_nonce(), 0u);
    EXPECT_EQ(genesis.get_difficulty(), block::validation::GENESIS_DIFFICULTY);
    EXPECT_EQ(genesis.get_timestamp(), 1700000000u);
    EXPECT_TRUE(genesis.get_transactions().empty());
    EXPECT_EQ(genesis.get_merkle_root(), "");

    EXPECT_EQ(genesis.get_message(), "0170000000004294967295");
    EXPECT_EQ(genesis.get_hash(), SHA256::hex_digest("0170000000004294967295"));
    EXPECT_TRUE(genesis.verify_hash());
    EXPECT_TRUE(genesis.meets_difficulty());
    EXPECT_TRUE(genesis.verify_transactions());
    EXPECT_TRUE(block::validation::validate_block(genesis, nullptr).ok());
}

TEST_F(BlockTest, CreateNextLinksToPredecessor) {
    auto transactions = test::make_signed_transactions(alice, bob, 3);
    Block next = Block::create_next(genesis, transactions, next_clock);

    EXPECT_EQ(next.get_height(), 1u);
    EXPECT_EQ(next.get_prev_hash(), genesis.get_hash());
    EXPECT_EQ(next.get_difficulty(), genesis.get_difficulty());
    EXPECT_EQ(next.get_timestamp(), 1700001200u);
    EXPECT_EQ(next.get_nonce(), 0u);
    EXPECT_EQ(next.get_transactions(), transactions);
    EXPECT_EQ(next.get_merkle_root(), default_merkle_commitment().get_merkle_root(transactions));
    EXPECT_TRUE(next.verify_hash());
    EXPECT_TRUE(next.verify_merkle_root());

    Block third = Block::create_next(next, {}, next_clock);
    EXPECT_EQ(third.get_height(), 2u);
    EXPECT_EQ(third.get_prev_hash(), next.get_hash());
}

TEST_F(BlockTest, MerkleCommitmentIsReplaceable) {
    test::CountingMerkleCommitment counting;
    Block next = Block::create_next(genesis, test::make_signed_transactions(alice, bob, 3),
                                    next_clock, counting);

    EXPECT_EQ(next.get_merkle_root(), "count-3");
    EXPECT_TRUE(next.verify_merkle_root(counting));
    EXPECT_FALSE(next.verify_merkle_root());
    EXPECT_TRUE(next.verify_hash());

    ASSERT_EQ(next.reward_miner(bob.public_key, counting), BlockResult::SUCCESS);
    EXPECT_EQ(next.get_merkle_root(), "count-4");
    EXPECT_TRUE(next.verify_hash());
}

TEST_F(BlockTest, MutatorsRehash) {
    Block next = make_next(2);
    std::string hash = next.get_hash();

    next.set_difficulty(0x0FFFFFFF);
    EXPECT_EQ(next.get_difficulty(), 0x0FFFFFFFu);
    EXPECT_NE(next.get_hash(), hash);
    EXPECT_TRUE(next.verify_hash());
    hash = next.get_hash();

    ASSERT_EQ(next.increment_and_hash(), BlockResult::SUCCESS);
    EXPECT_EQ(next.get_nonce(), 1u);
    EXPECT_NE(next.get_hash(), hash);
    EXPECT_TRUE(next.verify_hash());
    hash = next.get_hash();

    ASSERT_EQ(next.advance_nonce(10), BlockResult::SUCCESS);
    EXPECT_EQ(next.get_nonce(), 11u);
    EXPECT_TRUE(next.verify_hash());

    hash = next.get_hash();
    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    EXPECT_NE(next.get_hash(), hash);
    EXPECT_TRUE(next.verify_hash());
    EXPECT_TRUE(next.verify_merkle_root());

    // Idempotent
    EXPECT_TRUE(next.verify_hash());
}

TEST_F(BlockTest, StaleHashIsDetected) {
    Block next = make_next(2);
    ASSERT_TRUE(next.verify_hash());

    auto stale = [&](uint64_t height, uint64_t timestamp, const std::string& prev_hash,
                     uint32_t nonce, uint32_t difficulty, const std::string& merkle_root) {
        return Block::restore(height, next.get_hash(), timestamp, prev_hash, nonce, difficulty,
                              merkle_root, next.get_transactions());
    };

    EXPECT_TRUE(stale(next.get_height(), next.get_timestamp(), next.get_prev_hash(),
                      next.get_nonce(), next.get_difficulty(), next.get_merkle_root()).verify_hash());

    EXPECT_FALSE(stale(next.get_height() + 1, next.get_timestamp(), next.get_prev_hash(),
                       next.get_nonce(), next.get_difficulty(), next.get_merkle_root()).verify_hash());
    EXPECT_FALSE(stale(next.get_height(), next.get_timestamp() + 1, next.get_prev_hash(),
                       next.get_nonce(), next.get_difficulty(), next.get_merkle_root()).verify_hash());
    EXPECT_FALSE(stale(next.get_height(), next.get_timestamp(), "00",
                       next.get_nonce(), next.get_difficulty(), next.get_merkle_root()).verify_hash());
    EXPECT_FALSE(stale(next.get_height(), next.get_timestamp(), next.get_prev_hash(),
                       next.get_nonce() + 1, next.get_difficulty(), next.get_merkle_root()).verify_hash());
    EXPECT_FALSE(stale(next.get_height(), next.get_timestamp(), next.get_prev_hash(),
                       next.get_nonce(), 0x1FFFFFFF, next.get_merkle_root()).verify_hash());
    EXPECT_FALSE(stale(next.get_height(), next.get_timestamp(), next.get_prev_hash(),
                       next.get_nonce(), next.get_difficulty(), "").verify_hash());
}

TEST_F(BlockTest, RewardMinerOnlyOnce) {
    Block next = make_next(2);

    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    ASSERT_EQ(next.get_transaction_count(), 3u);
    EXPECT_EQ(next.get_reward_count(), 1u);

    const auto& reward = next.get_transactions().back();
    EXPECT_TRUE(reward.is_reward());
    EXPECT_EQ(reward.recipient, bob.public_key);
    EXPECT_EQ(reward.amount, transaction::validation::REWARD_AMOUNT);
    EXPECT_EQ(reward.timestamp, next.get_timestamp());

    std::string hash = next.get_hash();
    EXPECT_EQ(next.reward_miner(alice.public_key), BlockResult::REWARD_ALREADY_PRESENT);
    EXPECT_EQ(next.get_reward_count(), 1u);
    EXPECT_EQ(next.get_transaction_count(), 3u);
    EXPECT_EQ(next.get_hash(), hash);
}

TEST_F(BlockTest, RewardOnEmptyBlock) {
    Block next = make_next(0);
    EXPECT_EQ(next.get_merkle_root(), "");

    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    EXPECT_EQ(next.get_transaction_count(), 1u);
    EXPECT_FALSE(next.get_merkle_root().empty());
    EXPECT_TRUE(next.verify_transactions());
    EXPECT_TRUE(block::validation::validate_block(next, &genesis).ok());
}

TEST_F(BlockTest, TimestampUnchangedByMutators) {
    Block next = make_next(1);
    uint64_t timestamp = next.get_timestamp();

    next.reward_miner(bob.public_key);
    next.set_difficulty(0x1FFFFFFF);
    next.increment_and_hash();
    mining::mine_block(next, 1000);

    EXPECT_EQ(next.get_timestamp(), timestamp);
}

TEST_F(BlockTest, NonceExhaustion) {
    constexpr uint32_t max_nonce = std::numeric_limits<uint32_t>::max();

    Block exhausted = Block::restore(1, "", next_clock.get_unix_time(), genesis.get_hash(),
                                     max_nonce, block::validation::GENESIS_DIFFICULTY, "", {});
    exhausted.set_difficulty(block::validation::GENESIS_DIFFICULTY);
    ASSERT_TRUE(exhausted.verify_hash());
    std::string hash = exhausted.get_hash();

    EXPECT_EQ(exhausted.increment_and_hash(), BlockResult::EXHAUSTED_NONCE);
    EXPECT_EQ(exhausted.get_nonce(), max_nonce);
    EXPECT_EQ(exhausted.get_hash(), hash);
    EXPECT_TRUE(exhausted.verify_hash());

    Block near_end = Block::restore(1, "", next_clock.get_unix_time(), genesis.get_hash(),
                                    max_nonce - 5, block::validation::GENESIS_DIFFICULTY, "", {});
    EXPECT_EQ(near_end.advance_nonce(6), BlockResult::EXHAUSTED_NONCE);
    EXPECT_EQ(near_end.get_nonce(), max_nonce - 5);
    EXPECT_EQ(near_end.advance_nonce(5), BlockResult::SUCCESS);
    EXPECT_EQ(near_end.get_nonce(), max_nonce);
    EXPECT_TRUE(near_end.verify_hash());
}

TEST_F(BlockTest, VerifyTransactions) {
    Block next = make_next(3);
    EXPECT_TRUE(next.verify_transactions());

    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    EXPECT_TRUE(next.verify_transactions());

    auto transactions = test::make_signed_transactions(alice, bob, 3);
    transactions[1].signature[0] ^= 0x01;
    Block forged = Block::create_next(genesis, transactions, next_clock);
    EXPECT_TRUE(forged.verify_hash());
    EXPECT_FALSE(forged.verify_transactions());
}

TEST_F(BlockTest, RewardsAreExemptFromSignatureChecks) {
    std::vector<Transaction> rewards = {
        Transaction::reward_transaction(alice.public_key),
        Transaction::reward_transaction(bob.public_key),
    };
    Block rewarded = Block::create_next(genesis, rewards, next_clock);

    EXPECT_TRUE(rewarded.verify_transactions());
    EXPECT_EQ(rewarded.get_reward_count(), 2u);
    EXPECT_FALSE(block::validation::validate_reward_count(rewarded));
}

TEST_F(BlockTest, TransactionLimit) {
    auto signed_tx = test::make_signed_transactions(alice, bob, 1).front();

    Block at_limit = Block::create_next(
        genesis, std::vector<Transaction>(block::validation::MAX_TRANSACTIONS_PER_BLOCK, signed_tx), next_clock);
    EXPECT_TRUE(block::validation::validate_block_size(at_limit));
    EXPECT_TRUE(at_limit.verify_transactions());

    Block over_limit = Block::create_next(
        genesis, std::vector<Transaction>(block::validation::MAX_TRANSACTIONS_PER_BLOCK + 1, signed_tx), next_clock);
    EXPECT_FALSE(block::validation::validate_block_size(over_limit));
    EXPECT_FALSE(over_limit.verify_transactions());
    EXPECT_EQ(block::validation::validate_block(over_limit, &genesis).result, BlockResult::OVERSIZED_BLOCK);

    // The reward counts toward the limit
    Block full = at_limit;
    ASSERT_EQ(full.reward_miner(bob.public_key), BlockResult::SUCCESS);
    EXPECT_FALSE(full.verify_transactions());
}

// The hash covers the committed root, not the transactions behind it
TEST_F(BlockTest, TamperedTransactionsBehindValidHash) {
    Block next = make_next(3);

    auto tampered_transactions = next.get_transactions();
    tampered_transactions[1].amount += 1;
    Block tampered = with_transactions(next, tampered_transactions);

    EXPECT_TRUE(tampered.verify_hash());
    EXPECT_FALSE(tampered.verify_merkle_root());

    auto result = block::validation::validate_block(tampered, &genesis);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.result, BlockResult::MERKLE_MISMATCH);
    EXPECT_FALSE(result.reason.empty());
}

TEST_F(BlockTest, ValidateBlockReportsFirstFailure) {
    Block next = make_next(2);
    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    EXPECT_TRUE(block::validation::validate_block(next, &genesis).ok());

    // Stale hash
    Block stale = Block::restore(next.get_height(), next.get_hash(), next.get_timestamp(),
                                 next.get_prev_hash(), next.get_nonce() + 1, next.get_difficulty(),
                                 next.get_merkle_root(), next.get_transactions());
    EXPECT_EQ(block::validation::validate_block(stale, &genesis).result, BlockResult::HASH_MISMATCH);

    // Zero difficulty accepts only a hash ending in eight zero digits
    Block hard = next;
    hard.set_difficulty(0);
    ASSERT_FALSE(hard.meets_difficulty());
    EXPECT_EQ(block::validation::validate_block(hard, &genesis).result, BlockResult::DIFFICULTY_NOT_MET);

    // Two rewards with a consistent merkle root
    std::vector<Transaction> rewards = {
        Transaction::reward_transaction(alice.public_key),
        Transaction::reward_transaction(bob.public_key),
    };
    Block double_reward = Block::create_next(genesis, rewards, next_clock);
    EXPECT_EQ(block::validation::validate_block(double_reward, &genesis).result, BlockResult::DUPLICATE_REWARD);

    // Bad signature with a consistent merkle root
    auto transactions = test::make_signed_transactions(alice, bob, 2);
    transactions[0].signature[5] ^= 0x80;
    Block forged = Block::create_next(genesis, transactions, next_clock);
    EXPECT_EQ(block::validation::validate_block(forged, &genesis).result, BlockResult::INVALID_SIGNATURE);
}

TEST_F(BlockTest, ValidateLinkage) {
    Block next = make_next(1);

    EXPECT_TRUE(block::validation::validate_linkage(genesis, nullptr));
    EXPECT_TRUE(block::validation::validate_linkage(next, &genesis));

    EXPECT_FALSE(block::validation::validate_linkage(next, nullptr));
    EXPECT_EQ(block::validation::validate_block(next, nullptr).result, BlockResult::HEIGHT_MISMATCH);

    EXPECT_FALSE(block::validation::validate_linkage(next, &next));
    EXPECT_EQ(block::validation::validate_block(next, &next).result, BlockResult::HEIGHT_MISMATCH);

    FixedClock other_clock{1600000000};
    Block other_genesis = Block::create_genesis(other_clock);
    ASSERT_NE(other_genesis.get_hash(), genesis.get_hash());
    EXPECT_FALSE(block::validation::validate_linkage(next, &other_genesis));
    EXPECT_EQ(block::validation::validate_block(next, &other_genesis).result, BlockResult::PREV_HASH_MISMATCH);
}

TEST_F(BlockTest, Serialization) {
    Block next = make_next(3);
    ASSERT_EQ(next.reward_miner(bob.public_key), BlockResult::SUCCESS);
    ASSERT_EQ(next.advance_nonce(77), BlockResult::SUCCESS);

    auto data = next.serialize();
    auto decoded = Block::deserialize(data);
    ASSERT_TRUE(decoded.has_value());

    EXPECT_EQ(decoded->get_height(), next.get_height());
    EXPECT_EQ(decoded->get_hash(), next.get_hash());
    EXPECT_EQ(decoded->get_timestamp(), next.get_timestamp());
    EXPECT_EQ(decoded->get_prev_hash(), next.get_prev_hash());
    EXPECT_EQ(decoded->get_nonce(), next.get_nonce());
    EXPECT_EQ(decoded->get_difficulty(), next.get_difficulty());
    EXPECT_EQ(decoded->get_merkle_root(), next.get_merkle_root());
    EXPECT_EQ(decoded->get_transactions(), next.get_transactions());
    EXPECT_TRUE(decoded->verify_hash());
    EXPECT_TRUE(block::validation::validate_block(*decoded, &genesis).ok());

    auto truncated = data;
    truncated.pop_back();
    EXPECT_FALSE(Block::deserialize(truncated).has_value());

    auto padded = data;
    padded.push_back(0x00);
    EXPECT_FALSE(Block::deserialize(padded).has_value());

    EXPECT_FALSE(Block::deserialize({}).has_value());
}

TEST_F(BlockTest, HexAndJson) {
    Block next = make_next(1);

    auto parsed = block::utils::parse_block_hex(block::utils::block_to_hex(next));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->get_hash(), next.get_hash());
    EXPECT_FALSE(block::utils::parse_block_hex("zz").has_value());

    std::string json = block::utils::block_to_json(next);
    EXPECT_NE(json.find("\"height\":1"), std::string::npos);
    EXPECT_NE(json.find("\"hash\":\"" + next.get_hash() + "\""), std::string::npos);
    EXPECT_NE(json.find(next.get_transactions()[0].get_txid()), std::string::npos);

    std::string text = next.to_string();
    EXPECT_NE(text.find("height: 1"), std::string::npos);
    EXPECT_NE(text.find("prev_hash: " + genesis.get_hash()), std::string::npos);
}

TEST_F(BlockTest, ResultNames) {
    EXPECT_STREQ(to_string(BlockResult::SUCCESS), "SUCCESS");
    EXPECT_STREQ(to_string(BlockResult::EXHAUSTED_NONCE), "EXHAUSTED_NONCE");
    EXPECT_STREQ(to_string(BlockResult::MERKLE_MISMATCH), "MERKLE_MISMATCH");
}
