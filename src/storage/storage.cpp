#include "powchain/storage.hpp"
#include <leveldb/db.h>
#include <leveldb/options.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>
#include <filesystem>
#include <iostream>
#include <mutex>

namespace powchain {
namespace storage {

namespace fs = std::filesystem;

const char* to_string(StorageResult result) {
    switch (result) {
        case StorageResult::SUCCESS: return "SUCCESS";
        case StorageResult::NOT_FOUND: return "NOT_FOUND";
        case StorageResult::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case StorageResult::CORRUPTION_ERROR: return "CORRUPTION_ERROR";
        case StorageResult::IO_ERROR: return "IO_ERROR";
        case StorageResult::DATABASE_ERROR: return "DATABASE_ERROR";
    }
    return "UNKNOWN";
}

namespace {
    const std::string HEIGHT_KEY_PREFIX = "h:";
}

// LevelDBStorage::Impl - Private implementation
class LevelDBStorage::Impl {
public:
    std::unique_ptr<leveldb::DB> blocks_db;
    std::unique_ptr<leveldb::Cache> cache;
    std::unique_ptr<const leveldb::FilterPolicy> filter_policy;

    leveldb::WriteOptions write_options;
    leveldb::ReadOptions read_options;
};

// LevelDBStorage implementation
LevelDBStorage::LevelDBStorage(const StorageConfig& config)
    : impl_(std::make_unique<Impl>()), config_(config) {

    impl_->write_options.sync = config_.sync_writes;
    impl_->read_options.verify_checksums = true;
}

LevelDBStorage::~LevelDBStorage() {
    if (initialized_) {
        shutdown();
    }
}

StorageResult LevelDBStorage::initialize() {
    std::lock_guard<std::shared_mutex> lock(mutex_);

    if (initialized_) {
        return StorageResult::ALREADY_EXISTS;
    }

    try {
        fs::create_directories(config_.data_directory);
    } catch (const fs::filesystem_error& e) {
        std::cerr << "Cannot create block directory " << config_.data_directory
                  << ": " << e.what() << std::endl;
        return StorageResult::IO_ERROR;
    }

    leveldb::Options options;
    options.create_if_missing = true;
    options.error_if_exists = false;

    // Configure cache
    impl_->cache.reset(leveldb::NewLRUCache(config_.cache_size_mb * 1024 * 1024));
    options.block_cache = impl_->cache.get();

    // Configure bloom filter
    if (config_.enable_bloom_filter) {
        impl_->filter_policy.reset(leveldb::NewBloomFilterPolicy(10));
        options.filter_policy = impl_->filter_policy.get();
    }

    options.write_buffer_size = config_.write_buffer_size_mb * 1024 * 1024;
    options.max_open_files = static_cast<int>(config_.max_open_files);
    options.compression = config_.enable_compression ? leveldb::kSnappyCompression
                                                     : leveldb::kNoCompression;

    leveldb::DB* db = nullptr;
    std::string blocks_path = config_.data_directory + "/blocks";
    leveldb::Status status = leveldb::DB::Open(options, blocks_path, &db);
    if (!status.ok()) {
        std::cerr << "Block database could not be opened: " << status.ToString() << std::endl;
        return StorageResult::DATABASE_ERROR;
    }
    impl_->blocks_db.reset(db);

    initialized_ = true;
    return StorageResult::SUCCESS;
}

void LevelDBStorage::shutdown() {
    std::lock_guard<std::shared_mutex> lock(mutex_);

    if (!initialized_) return;

    // The database must close before the cache and filter it references
    impl_->blocks_db.reset();
    impl_->filter_policy.reset();
    impl_->cache.reset();

    initialized_ = false;
}

StorageResult LevelDBStorage::store_block(const Block& block) {
    // Exclusive: the existence check and the write must not interleave
    std::lock_guard<std::shared_mutex> lock(mutex_);

    if (!initialized_) return StorageResult::DATABASE_ERROR;

    std::string key = make_block_height_key(block.get_height());
    std::string existing;

    leveldb::Status status = impl_->blocks_db->Get(impl_->read_options, key, &existing);
    if (status.ok()) {
        return StorageResult::ALREADY_EXISTS;
    }
    if (!status.IsNotFound()) {
        std::cerr << "Block " << block.get_height() << " lookup failed: " << status.ToString() << std::endl;
        return StorageResult::DATABASE_ERROR;
    }

    std::vector<uint8_t> serialized_block = block.serialize();
    std::string value(serialized_block.begin(), serialized_block.end());

    status = impl_->blocks_db->Put(impl_->write_options, key, value);
    if (!status.ok()) {
        std::cerr << "Block " << block.get_height() << " could not be stored: " << status.ToString() << std::endl;
        return status.IsIOError() ? StorageResult::IO_ERROR : StorageResult::DATABASE_ERROR;
    }

    return StorageResult::SUCCESS;
}

StorageResult LevelDBStorage::get_block_by_height(uint64_t height, Block& block) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (!initialized_) return StorageResult::DATABASE_ERROR;

    std::string value;
    leveldb::Status status = impl_->blocks_db->Get(impl_->read_options, make_block_height_key(height), &value);
    if (status.IsNotFound()) {
        return StorageResult::NOT_FOUND;
    }
    if (status.IsCorruption()) {
        return StorageResult::CORRUPTION_ERROR;
    }
    if (!status.ok()) {
        return StorageResult::DATABASE_ERROR;
    }

    // Deserialize block
    std::vector<uint8_t> data(value.begin(), value.end());
    auto deserialized_block = Block::deserialize(data);
    if (!deserialized_block) {
        std::cerr << "Block " << height << " is not a valid block record" << std::endl;
        return StorageResult::CORRUPTION_ERROR;
    }

    block = std::move(*deserialized_block);
    return StorageResult::SUCCESS;
}

StorageResult LevelDBStorage::has_block(uint64_t height) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (!initialized_) return StorageResult::DATABASE_ERROR;

    std::string value;
    leveldb::Status status = impl_->blocks_db->Get(impl_->read_options, make_block_height_key(height), &value);
    if (status.IsNotFound()) {
        return StorageResult::NOT_FOUND;
    }
    if (!status.ok()) {
        return StorageResult::DATABASE_ERROR;
    }

    return StorageResult::SUCCESS;
}

StorageResult LevelDBStorage::get_block_count(uint64_t& count) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (!initialized_) return StorageResult::DATABASE_ERROR;

    count = 0;
    std::unique_ptr<leveldb::Iterator> it(impl_->blocks_db->NewIterator(impl_->read_options));
    for (it->Seek(HEIGHT_KEY_PREFIX); it->Valid() && it->key().starts_with(HEIGHT_KEY_PREFIX); it->Next()) {
        ++count;
    }

    if (!it->status().ok()) {
        return StorageResult::DATABASE_ERROR;
    }

    return StorageResult::SUCCESS;
}

std::string LevelDBStorage::make_block_height_key(uint64_t height) {
    return HEIGHT_KEY_PREFIX + std::to_string(height);
}

// StorageFactory implementation
std::unique_ptr<IBlockStorage> StorageFactory::create(StorageType type, const StorageConfig& config) {
    switch (type) {
        case StorageType::MEMORY:
            return std::make_unique<MemoryStorage>();
        case StorageType::LEVELDB: {
            auto storage = std::make_unique<LevelDBStorage>(config);
            if (storage->initialize() != StorageResult::SUCCESS) {
                return nullptr;
            }
            return storage;
        }
    }
    return nullptr;
}

std::unique_ptr<IBlockStorage> StorageFactory::create_test() {
    return create(StorageType::MEMORY);
}

} // namespace storage
} // namespace powchain
