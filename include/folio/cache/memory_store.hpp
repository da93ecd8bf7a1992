// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/blob.hpp>
#include <folio/core/config.hpp>
#include <folio/core/types.hpp>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio::cache {

struct MemoryStoreConfig {
    std::uint64_t max_size_bytes{core::L1_MAX_SIZE_BYTES};
    std::size_t max_entries{core::L1_MAX_ENTRIES};
};

// Entry as held in L1
struct MemoryEntry {
    core::SharedBytes data;
    std::string mime_type;
    core::Metadata metadata;
    std::uint64_t size_bytes{0};
    core::Timestamp created_at;
    core::Timestamp accessed_at;
    std::uint64_t access_count{0};
};

struct MemoryStats {
    std::size_t entries{0};
    std::uint64_t size_bytes{0};
    std::uint64_t max_size_bytes{0};
    std::size_t max_entries{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    double hit_ratio{0.0};
    std::uint64_t evictions{0};
};

// L1: bounded in-process LRU over binary resources.
// Every entry owns a blob handle from set() until it is evicted, deleted or
// cleared. All operations are synchronous and thread-safe.
class MemoryStore {
public:
    explicit MemoryStore(MemoryStoreConfig config = {},
                         std::shared_ptr<core::BlobRegistry> registry = nullptr);
    ~MemoryStore();

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    // Lookup; counts a hit or miss and marks the entry most recently used
    [[nodiscard]] std::optional<MemoryEntry> get(const std::string& key);

    // Lookup without touching recency or statistics
    [[nodiscard]] std::optional<MemoryEntry> peek(const std::string& key) const;

    void set(const std::string& key,
             core::SharedBytes data,
             std::string mime_type,
             core::Metadata metadata = {});

    [[nodiscard]] bool has(const std::string& key) const;

    bool remove(const std::string& key);

    // Returns the number of entries removed
    std::size_t remove_prefix(const std::string& prefix);

    // Snapshot of keys, most recently used first
    [[nodiscard]] std::vector<std::string> keys() const;

    void clear();

    // URL of the entry's blob handle, if the entry is live
    [[nodiscard]] std::optional<std::string> blob_url(const std::string& key) const;

    [[nodiscard]] MemoryStats stats() const;
    void reset_stats();

    // Change bounds, evicting as needed
    void resize(std::uint64_t max_size_bytes, std::size_t max_entries);

    [[nodiscard]] std::uint64_t size_bytes() const;
    [[nodiscard]] std::size_t count() const;

    [[nodiscard]] const std::shared_ptr<core::BlobRegistry>& blob_registry() const noexcept {
        return registry_;
    }

private:
    struct Node {
        std::string key;
        MemoryEntry entry;
        core::BlobHandle blob;
    };
    using LruList = std::list<Node>;

    // Both require mutex_ held
    void evict_if_needed(std::uint64_t incoming_size);
    void erase_node(LruList::iterator it);

    MemoryStoreConfig config_;
    std::shared_ptr<core::BlobRegistry> registry_;

    mutable std::mutex mutex_;
    LruList lru_;  // front = most recently used
    std::unordered_map<std::string, LruList::iterator> index_;
    std::uint64_t current_size_{0};

    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};
};

} // namespace folio::cache
