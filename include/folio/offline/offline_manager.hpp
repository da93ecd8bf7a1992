// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/cache/tiered_cache.hpp>
#include <folio/core/config.hpp>
#include <folio/core/error.hpp>
#include <folio/offline/download_events.hpp>
#include <folio/offline/offline_book.hpp>
#include <folio/offline/storage_quota.hpp>
#include <folio/store/persistent_store.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace folio::offline {

struct OfflineManagerConfig {
    std::uint32_t concurrency{core::DOWNLOAD_CONCURRENCY};      // Parallel fetches per book
    std::uint32_t retry_count{core::RETRY_COUNT};               // Retries after the first attempt
    std::chrono::milliseconds retry_delay{core::RETRY_DELAY};   // Multiplied by attempt + 1
    double quota_warning_threshold{core::QUOTA_WARNING_THRESHOLD};
};

using DownloadResult = std::expected<OfflineBook, std::error_code>;

// Downloads whole books into the tiered cache for offline reading.
//
// download_book() blocks its calling thread, which coordinates a bounded
// pool of fetch threads for that book. At most one download per book runs
// at a time; different books download independently. Records are persisted
// as JSON in the metadata store under the reserved book id "_offline_meta".
class OfflineManager {
public:
    OfflineManager(cache::TieredCache& cache,
                   std::shared_ptr<store::PersistentStore> meta_store,
                   OfflineManagerConfig config = {},
                   std::shared_ptr<StorageQuota> quota = nullptr);

    // Stops running downloads and waits for them to wind down
    ~OfflineManager();

    OfflineManager(const OfflineManager&) = delete;
    OfflineManager& operator=(const OfflineManager&) = delete;

    // Load persisted records. Returns the number of books loaded.
    std::expected<std::size_t, std::error_code> init();

    DownloadResult download_book(const BookManifest& manifest);

    // download_book() on a dedicated thread. The manager must outlive the future.
    [[nodiscard]] std::future<DownloadResult> download_book_async(BookManifest manifest);

    // Stop starting new fetches; cached resources are kept.
    // Returns false when the book has no running download.
    bool pause_download(const std::string& book_id);

    // Continue a paused (or interrupted) book, fetching only what is missing
    DownloadResult resume_download(const BookManifest& manifest);

    // Stop the download if running, then remove the book entirely
    void cancel_download(const std::string& book_id);

    // Drop cached resources and the record. Returns false for unknown books.
    bool remove_offline_book(const std::string& book_id);

    [[nodiscard]] std::vector<OfflineBook> offline_books() const;
    [[nodiscard]] std::optional<OfflineBook> offline_book(const std::string& book_id) const;
    [[nodiscard]] bool is_book_offline(const std::string& book_id) const;

    bool mark_accessed(const std::string& book_id);

    [[nodiscard]] std::uint64_t total_storage_used() const;
    [[nodiscard]] StorageInfo storage_info() const;

    // Remove least recently accessed completed books until at least
    // target_bytes are freed. Returns the removed book ids in order.
    std::vector<std::string> cleanup_old_books(std::uint64_t target_bytes);

    [[nodiscard]] bool is_downloading(const std::string& book_id) const;
    [[nodiscard]] std::size_t active_download_count() const;

    [[nodiscard]] DownloadEvents& events() noexcept { return events_; }
    [[nodiscard]] const OfflineManagerConfig& config() const noexcept { return config_; }

private:
    // Controller of one running download
    struct ActiveDownload {
        std::stop_source stop;
        bool removed{false};  // Set by remove/cancel; guarded by mutex_
    };

    // Erases the book's active entry on scope exit
    class ActiveSlot {
    public:
        ActiveSlot(OfflineManager& owner, std::string book_id) noexcept
            : owner_(owner), book_id_(std::move(book_id)) {}
        ~ActiveSlot();
        ActiveSlot(const ActiveSlot&) = delete;
        ActiveSlot& operator=(const ActiveSlot&) = delete;
    private:
        OfflineManager& owner_;
        std::string book_id_;
    };

    // Counters owned by the coordinating thread
    struct RunCounters {
        std::uint64_t downloaded_size{0};
        std::uint32_t downloaded_count{0};
    };

    struct RunOutcome {
        RunCounters counters;
        bool cancelled{false};
        std::error_code error;
        std::string failed_href;
    };

    [[nodiscard]] std::error_code check_quota(std::uint64_t needed) const;

    RunOutcome run_pool(const BookManifest& manifest,
                        const OfflineBook& book,
                        ActiveDownload& active);

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    fetch_with_retry(std::stop_token token, const std::string& book_id, const std::string& href);

    // Require mutex_ held
    void persist_locked(const OfflineBook& book);
    void erase_record_locked(const std::string& book_id);

    cache::TieredCache& cache_;
    std::shared_ptr<store::PersistentStore> meta_store_;
    OfflineManagerConfig config_;
    std::shared_ptr<StorageQuota> quota_;
    DownloadEvents events_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, OfflineBook> books_;
    std::map<std::string, std::shared_ptr<ActiveDownload>> active_;
};

} // namespace folio::offline
