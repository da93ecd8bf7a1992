// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/cache/error.hpp>
#include <folio/cache/memory_store.hpp>
#include <folio/cache/remote_provider.hpp>
#include <folio/store/persistent_store.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::cache {

enum class Tier : std::uint8_t {
    l1,  // Memory
    l2,  // Persistent store
    l3   // Remote provider
};

[[nodiscard]] std::string_view to_string(Tier tier) noexcept;

struct TieredCacheConfig {
    MemoryStoreConfig l1{};
    bool enable_l2{true};
    bool promote_on_access{true};  // Backfill L1 on an L2 hit
    bool write_through{true};      // Mirror writes into L2
};

// Result of a cache read
struct CachedResource {
    core::SharedBytes data;
    std::string mime_type;
    std::optional<std::string> blob_url;  // Only when materialised in L1
    Tier tier{Tier::l1};
    double latency_ms{0.0};
};

struct TierHits {
    std::uint64_t l1{0};
    std::uint64_t l2{0};
    std::uint64_t l3{0};
};

struct CombinedStats {
    std::uint64_t total_size_bytes{0};
    std::size_t total_entries{0};
    TierHits hits_by_tier;
    std::uint64_t total_requests{0};
    double hit_ratio{0.0};
};

struct TieredCacheStats {
    MemoryStats l1;
    std::optional<store::StoreStats> l2;  // Empty when L2 is off or failing
    CombinedStats combined;
};

// (current, total)
using PreloadCallback = std::function<void(std::size_t, std::size_t)>;

// Three-level cache: memory, then persistent store, then remote provider.
// L2 failures are logged and degrade to a miss; only provider errors leave
// get(). Safe to use from several threads.
class TieredCache {
public:
    TieredCache(std::shared_ptr<RemoteProvider> provider,
                std::shared_ptr<store::PersistentStore> l2,
                TieredCacheConfig config = {});
    ~TieredCache();

    TieredCache(const TieredCache&) = delete;
    TieredCache& operator=(const TieredCache&) = delete;

    // Open L2. The cache works without it when this fails.
    std::expected<void, std::error_code> init();

    // Book ids must be non-empty and free of ':' (CacheErrc::invalid_key)
    [[nodiscard]] std::expected<CachedResource, std::error_code>
    get(const std::string& book_id, const std::string& href);

    std::expected<void, std::error_code> set(const std::string& book_id,
             const std::string& href,
             core::SharedBytes data,
             const std::string& mime_type,
             const core::Metadata& metadata = {});

    [[nodiscard]] bool has(const std::string& book_id, const std::string& href);

    void remove(const std::string& book_id, const std::string& href);

    // Drops all tiers and resets statistics
    void clear();

    std::expected<void, std::error_code> remove_book(const std::string& book_id);

    // Best effort: fetches hrefs not yet cached, one at a time.
    // Returns the number of hrefs that could not be fetched.
    std::size_t preload(const std::string& book_id,
                        const std::vector<std::string>& hrefs,
                        const PreloadCallback& on_progress = {});

    // Hrefs of the book held in L1 or L2, sorted; never touches L3
    [[nodiscard]] std::vector<std::string> cached_hrefs(const std::string& book_id);

    [[nodiscard]] std::expected<std::string, std::error_code>
    blob_url(const std::string& book_id, const std::string& href);

    [[nodiscard]] TieredCacheStats stats();
    void reset_stats();

    std::expected<void, std::error_code> set_l2_enabled(bool enabled);
    [[nodiscard]] bool l2_enabled() const noexcept;

    [[nodiscard]] const TieredCacheConfig& config() const noexcept { return config_; }

    [[nodiscard]] MemoryStore& memory() noexcept { return l1_; }
    [[nodiscard]] const std::shared_ptr<core::BlobRegistry>& blob_registry() const noexcept {
        return l1_.blob_registry();
    }

    // Release L1 and close L2
    void close();

    // Delete everything, including L2's persisted state
    std::expected<void, std::error_code> destroy();

private:
    [[nodiscard]] store::PersistentStore* active_l2() const noexcept;

    TieredCacheConfig config_;
    std::shared_ptr<RemoteProvider> provider_;
    std::shared_ptr<store::PersistentStore> l2_;
    MemoryStore l1_;
    std::atomic<bool> l2_enabled_;

    std::atomic<std::uint64_t> l1_hits_{0};
    std::atomic<std::uint64_t> l2_hits_{0};
    std::atomic<std::uint64_t> l3_hits_{0};
    std::atomic<std::uint64_t> total_requests_{0};
};

} // namespace folio::cache
