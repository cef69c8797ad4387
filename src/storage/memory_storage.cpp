#include "powchain/storage.hpp"
#include <iostream>
#include <mutex>

namespace powchain {
namespace storage {

// MemoryStorage implementation
StorageResult MemoryStorage::store_block(const Block& block) {
    std::lock_guard<std::shared_mutex> lock(mutex_);

    if (blocks_.find(block.get_height()) != blocks_.end()) {
        return StorageResult::ALREADY_EXISTS;
    }

    blocks_.emplace(block.get_height(), block.serialize());
    return StorageResult::SUCCESS;
}

StorageResult MemoryStorage::get_block_by_height(uint64_t height, Block& block) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = blocks_.find(height);
    if (it == blocks_.end()) {
        return StorageResult::NOT_FOUND;
    }

    auto stored = Block::deserialize(it->second);
    if (!stored) {
        std::cerr << "Block " << height << " is not a valid block record" << std::endl;
        return StorageResult::CORRUPTION_ERROR;
    }

    block = std::move(*stored);
    return StorageResult::SUCCESS;
}

StorageResult MemoryStorage::has_block(uint64_t height) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    return blocks_.find(height) != blocks_.end() ?
           StorageResult::SUCCESS : StorageResult::NOT_FOUND;
}

StorageResult MemoryStorage::get_block_count(uint64_t& count) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    count = blocks_.size();
    return StorageResult::SUCCESS;
}

void MemoryStorage::clear() {
    std::lock_guard<std::shared_mutex> lock(mutex_);
    blocks_.clear();
}

} // namespace storage
} // namespace powchain
