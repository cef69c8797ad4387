#pragma once

#include "powchain/block.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace powchain {
namespace storage {

using block::Block;

/// Database operation result
enum class StorageResult {
    SUCCESS = 0,
    NOT_FOUND,
    ALREADY_EXISTS,
    CORRUPTION_ERROR,
    IO_ERROR,
    DATABASE_ERROR
};

/// Short name of a result code for diagnostics
const char* to_string(StorageResult result);

/// Storage configuration
struct StorageConfig {
    std::string data_directory = "./blocks_data";
    size_t cache_size_mb = 64;            // LevelDB block cache size
    size_t write_buffer_size_mb = 16;     // LevelDB write buffer
    size_t max_open_files = 500;          // LevelDB max open files
    bool enable_compression = true;       // Snappy compression
    bool enable_bloom_filter = true;      // Bloom filters for faster lookups
    bool sync_writes = true;              // fsync every block write
};

/**
 * @brief Block persistence keyed by height
 *
 * Stored blocks are immutable: storing a second block at an occupied height
 * returns ALREADY_EXISTS and leaves the first one in place.
 */
class IBlockStorage {
public:
    virtual ~IBlockStorage() = default;

    virtual StorageResult store_block(const Block& block) = 0;
    virtual StorageResult get_block_by_height(uint64_t height, Block& block) = 0;
    virtual StorageResult has_block(uint64_t height) = 0;

    /// Number of stored blocks
    virtual StorageResult get_block_count(uint64_t& count) = 0;
};

/// LevelDB-based block storage
class LevelDBStorage : public IBlockStorage {
public:
    explicit LevelDBStorage(const StorageConfig& config);
    ~LevelDBStorage();

    LevelDBStorage(const LevelDBStorage&) = delete;
    LevelDBStorage& operator=(const LevelDBStorage&) = delete;

    /// Create the data directory and open the database
    StorageResult initialize();

    /// Close the database
    void shutdown();

    /// Check if storage is initialized
    bool is_initialized() const { return initialized_; }

    StorageResult store_block(const Block& block) override;
    StorageResult get_block_by_height(uint64_t height, Block& block) override;
    StorageResult has_block(uint64_t height) override;
    StorageResult get_block_count(uint64_t& count) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    StorageConfig config_;
    std::atomic<bool> initialized_{false};
    mutable std::shared_mutex mutex_;

    static std::string make_block_height_key(uint64_t height);
};

/// In-memory storage implementation for testing
class MemoryStorage : public IBlockStorage {
public:
    MemoryStorage() = default;

    StorageResult store_block(const Block& block) override;
    StorageResult get_block_by_height(uint64_t height, Block& block) override;
    StorageResult has_block(uint64_t height) override;
    StorageResult get_block_count(uint64_t& count) override;

    /// Clear all data (for testing)
    void clear();

private:
    // Serialized form, so a read never aliases the stored record
    std::map<uint64_t, std::vector<uint8_t>> blocks_;
    mutable std::shared_mutex mutex_;
};

/// Storage factory for creating different storage implementations
class StorageFactory {
public:
    enum class StorageType {
        MEMORY,
        LEVELDB
    };

    /// Create storage instance. LevelDB storage is returned initialized, or
    /// nullptr when the database cannot be opened.
    static std::unique_ptr<IBlockStorage> create(StorageType type, const StorageConfig& config = StorageConfig{});

    /// Create test storage (in-memory)
    static std::unique_ptr<IBlockStorage> create_test();
};

} // namespace storage
} // namespace powchain
