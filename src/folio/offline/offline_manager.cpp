// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/offline/offline_manager.hpp>
#include <folio/core/cache_key.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <limits>
#include <thread>

namespace folio::offline {

using core::OfflineErrc;

namespace {

constexpr std::string_view META_MIME_TYPE = "application/json";

// One finished fetch, handed from a worker to the coordinator
struct Completion {
    std::size_t index;
    std::expected<std::uint64_t, std::error_code> result;
};

// Completions in arrival order; the coordinator waits for the first
class CompletionQueue {
public:
    void push(Completion completion) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(completion));
        }
        cv_.notify_one();
    }

    Completion pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !items_.empty(); });
        auto completion = std::move(items_.front());
        items_.pop_front();
        return completion;
    }

    std::optional<Completion> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        auto completion = std::move(items_.front());
        items_.pop_front();
        return completion;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Completion> items_;
};

std::error_code validate(const BookManifest& manifest) {
    if (!core::is_valid_book_id(manifest.book_id) ||
        manifest.book_id == core::OFFLINE_META_BOOK_ID) {
        return make_error_code(OfflineErrc::invalid_manifest);
    }
    if (manifest.resources.size() > std::numeric_limits<std::uint32_t>::max()) {
        return make_error_code(OfflineErrc::invalid_manifest);
    }
    return {};
}

} // namespace

//=============================================================================
// Lifecycle
//=============================================================================

OfflineManager::OfflineManager(cache::TieredCache& cache,
                               std::shared_ptr<store::PersistentStore> meta_store,
                               OfflineManagerConfig config,
                               std::shared_ptr<StorageQuota> quota)
    : cache_(cache)
    , meta_store_(std::move(meta_store))
    , config_(config)
    , quota_(std::move(quota)) {
    if (config_.concurrency == 0) {
        config_.concurrency = 1;
    }
}

OfflineManager::~OfflineManager() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (auto& [book_id, active] : active_) {
        active->stop.request_stop();
    }
    idle_cv_.wait(lock, [this] { return active_.empty(); });
}

OfflineManager::ActiveSlot::~ActiveSlot() {
    // Notify under the lock: the destructor may free idle_cv_ once active_ is empty
    std::lock_guard<std::mutex> lock(owner_.mutex_);
    owner_.active_.erase(book_id_);
    owner_.idle_cv_.notify_all();
}

std::expected<std::size_t, std::error_code> OfflineManager::init() {
    if (!meta_store_) {
        return std::size_t{0};
    }

    if (auto opened = meta_store_->init(); !opened) {
        return std::unexpected(opened.error());
    }

    auto entries = meta_store_->book_entries(std::string(core::OFFLINE_META_BOOK_ID));
    if (!entries) {
        return std::unexpected(entries.error());
    }

    std::size_t loaded = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : *entries) {
        if (!entry.data) {
            continue;
        }
        try {
            std::string text(reinterpret_cast<const char*>(entry.data->data()), entry.data->size());
            auto book = nlohmann::json::parse(text).get<OfflineBook>();

            // The process stopped mid-download
            if (book.status == DownloadStatus::downloading) {
                book.status = DownloadStatus::partial;
            }

            // A running download owns the in-memory record
            if (active_.contains(book.book_id)) {
                continue;
            }
            books_.insert_or_assign(book.book_id, std::move(book));
            ++loaded;
        } catch (const std::exception& e) {
            spdlog::warn("[OfflineManager] skipping corrupt record {}: {}", entry.href, e.what());
        }
    }

    spdlog::info("[OfflineManager] loaded {} offline book record(s)", loaded);
    return loaded;
}

//=============================================================================
// Downloads
//=============================================================================

DownloadResult OfflineManager::download_book(const BookManifest& manifest) {
    if (auto ec = validate(manifest)) {
        return std::unexpected(ec);
    }
    const auto& book_id = manifest.book_id;

    // Reserve the book's controller slot
    auto active = std::make_shared<ActiveDownload>();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.contains(book_id)) {
            return std::unexpected(make_error_code(OfflineErrc::already_downloading));
        }
        active_.emplace(book_id, active);
    }
    ActiveSlot slot(*this, book_id);

    // Before any network or record activity
    if (auto ec = check_quota(manifest.total_size())) {
        return std::unexpected(ec);
    }

    OfflineBook book;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(book_id);
        if (it == books_.end()) {
            book.book_id = book_id;
            book.last_accessed_at = core::Clock::now();
        } else {
            book = it->second;
        }

        book.title = manifest.title;
        book.author = manifest.author;
        book.total_size = manifest.total_size();
        book.resource_count = static_cast<std::uint32_t>(manifest.resources.size());
        book.downloaded_size = 0;
        book.downloaded_count = 0;
        book.status = DownloadStatus::downloading;
        book.started_at = core::Clock::now();
        book.completed_at.reset();
        book.error.reset();

        books_.insert_or_assign(book_id, book);
        persist_locked(book);
    }

    spdlog::info("[OfflineManager] downloading {} ({} resources, {} bytes)",
                 book_id, book.resource_count, book.total_size);
    events_.emit(DownloadStarted{book_id, book.title, book.resource_count});

    auto outcome = run_pool(manifest, book, *active);

    bool removed = false;
    OfflineBook final_book;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = active->removed;
        auto it = books_.find(book_id);
        if (!removed && it != books_.end()) {
            auto& record = it->second;
            record.downloaded_size = outcome.counters.downloaded_size;
            record.downloaded_count = outcome.counters.downloaded_count;

            if (outcome.cancelled) {
                record.status = DownloadStatus::paused;
            } else if (outcome.error) {
                record.status = DownloadStatus::failed;
                record.error = outcome.error.message();
            } else {
                record.status = DownloadStatus::completed;
                record.completed_at = core::Clock::now();
            }

            persist_locked(record);
            final_book = record;
        } else {
            removed = true;
        }
    }

    if (removed) {
        // Fetches that landed after the removal swept the cache
        if (auto swept = cache_.remove_book(book_id); !swept) {
            spdlog::warn("[OfflineManager] could not clear cache of {}: {}", book_id,
                         swept.error().message());
        }
        return std::unexpected(make_error_code(OfflineErrc::cancelled));
    }

    if (outcome.cancelled) {
        spdlog::info("[OfflineManager] {} paused after {}/{} resources",
                     book_id, final_book.downloaded_count, final_book.resource_count);
        return std::unexpected(make_error_code(OfflineErrc::cancelled));
    }

    if (outcome.error) {
        spdlog::error("[OfflineManager] {} failed on {}: {}",
                      book_id, outcome.failed_href, outcome.error.message());
        events_.emit(DownloadFailed{book_id, outcome.error.message()});
        return std::unexpected(outcome.error);
    }

    spdlog::info("[OfflineManager] {} completed ({} bytes)", book_id, final_book.downloaded_size);
    events_.emit(DownloadCompleted{book_id, final_book});
    return final_book;
}

std::future<DownloadResult> OfflineManager::download_book_async(BookManifest manifest) {
    return std::async(std::launch::async, [this, manifest = std::move(manifest)] {
        return download_book(manifest);
    });
}

OfflineManager::RunOutcome OfflineManager::run_pool(const BookManifest& manifest,
                                                    const OfflineBook& book,
                                                    ActiveDownload& active) {
    const auto& book_id = manifest.book_id;
    const auto& resources = manifest.resources;
    const auto start_time = std::chrono::steady_clock::now();

    RunOutcome outcome;
    auto& counters = outcome.counters;

    auto add_bytes = [&](std::uint64_t bytes) {
        counters.downloaded_size = std::min(counters.downloaded_size + bytes, book.total_size);
    };

    // Already cached resources count immediately
    std::vector<std::size_t> pending;
    for (std::size_t i = 0; i < resources.size(); ++i) {
        if (cache_.has(book_id, resources[i].href)) {
            ++counters.downloaded_count;
            add_bytes(resources[i].size_bytes.value_or(0));
        } else {
            pending.push_back(i);
        }
    }
    if (counters.downloaded_count > 0) {
        spdlog::debug("[OfflineManager] {}: {} resource(s) already cached",
                      book_id, counters.downloaded_count);
    }

    CompletionQueue completions;
    std::stop_source pool_stop;
    std::stop_callback forward_stop(active.stop.get_token(), [&pool_stop] {
        pool_stop.request_stop();
    });
    std::map<std::size_t, std::jthread> in_flight;  // Joined before the above go away

    // A stop that lands after the last resource finished leaves the run complete
    std::size_t next = 0;
    while (next < pending.size() || !in_flight.empty()) {
        if (active.stop.stop_requested()) {
            outcome.cancelled = true;
            break;
        }

        // Refill up to the concurrency limit
        while (in_flight.size() < config_.concurrency && next < pending.size()) {
            const auto index = pending[next++];
            in_flight.emplace(index, std::jthread(
                [this, &completions, &book_id, &resources, token = pool_stop.get_token(), index] {
                    auto result = fetch_with_retry(token, book_id, resources[index].href);
                    completions.push(Completion{index, std::move(result)});
                }));
        }

        auto done = completions.pop();
        in_flight.erase(done.index);

        if (!done.result) {
            if (active.stop.stop_requested()) {
                outcome.cancelled = true;
            } else {
                outcome.error = done.result.error();
                outcome.failed_href = resources[done.index].href;
            }
            break;
        }

        ++counters.downloaded_count;
        add_bytes(*done.result);

        const auto elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        const double bytes = static_cast<double>(counters.downloaded_size);
        const double speed = elapsed > 0.0 ? bytes / elapsed : 0.0;
        const double remaining = static_cast<double>(book.total_size - counters.downloaded_size);

        DownloadProgress progress{
            .book_id = book_id,
            .current_resource = resources[done.index].href,
            .current_index = counters.downloaded_count,
            .total_resources = book.resource_count,
            .bytes_downloaded = counters.downloaded_size,
            .total_bytes = book.total_size,
            .percentage = book.total_size > 0
                ? bytes / static_cast<double>(book.total_size) * 100.0
                : static_cast<double>(counters.downloaded_count) /
                  static_cast<double>(book.resource_count) * 100.0,
            .speed = speed,
            .eta = speed > 0.0 ? remaining / speed : 0.0,
        };

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!active.removed) {
                if (auto it = books_.find(book_id); it != books_.end()) {
                    it->second.downloaded_size = counters.downloaded_size;
                    it->second.downloaded_count = counters.downloaded_count;
                }
            }
        }

        events_.emit(progress);
    }

    // Wind down: no new attempts, wait for fetches already in the provider
    pool_stop.request_stop();
    in_flight.clear();

    // Fetches that finished after the loop stopped are cached; count them
    while (auto late = completions.try_pop()) {
        if (late->result) {
            ++counters.downloaded_count;
            add_bytes(*late->result);
        }
    }

    return outcome;
}

std::expected<std::uint64_t, std::error_code>
OfflineManager::fetch_with_retry(std::stop_token token,
                                 const std::string& book_id,
                                 const std::string& href) {
    std::error_code last_error = make_error_code(OfflineErrc::download_failed);

    for (std::uint32_t attempt = 0; attempt <= config_.retry_count; ++attempt) {
        if (token.stop_requested()) {
            return std::unexpected(make_error_code(OfflineErrc::cancelled));
        }

        auto fetched = cache_.get(book_id, href);
        if (fetched) {
            return fetched->data ? fetched->data->size() : 0;
        }
        last_error = fetched.error();

        if (attempt < config_.retry_count) {
            const auto delay = config_.retry_delay * (attempt + 1);
            spdlog::debug("[OfflineManager] {}:{} attempt {} failed ({}), retrying in {}ms",
                          book_id, href, attempt + 1, last_error.message(), delay.count());

            // Interrupted by a stop request
            std::mutex wait_mutex;
            std::condition_variable_any wait_cv;
            std::unique_lock<std::mutex> lock(wait_mutex);
            wait_cv.wait_for(lock, token, delay, [] { return false; });
        }
    }

    return std::unexpected(last_error);
}

std::error_code OfflineManager::check_quota(std::uint64_t needed) const {
    if (!quota_) {
        return {};
    }

    auto estimate = quota_->estimate();
    if (!estimate || estimate->quota == 0) {
        spdlog::debug("[OfflineManager] storage quota unavailable, skipping check");
        return {};
    }

    const double after = static_cast<double>(estimate->usage + needed) /
                         static_cast<double>(estimate->quota);
    if (after > 1.0) {
        spdlog::warn("[OfflineManager] insufficient storage: need {} bytes, {} of {} used",
                     needed, estimate->usage, estimate->quota);
        return make_error_code(OfflineErrc::insufficient_storage);
    }
    if (after > config_.quota_warning_threshold) {
        spdlog::warn("[OfflineManager] storage will be {:.1f}% full after download", after * 100.0);
    }
    return {};
}

//=============================================================================
// Control
//=============================================================================

bool OfflineManager::pause_download(const std::string& book_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(book_id);
        if (it == active_.end()) {
            return false;
        }
        it->second->stop.request_stop();
    }

    spdlog::info("[OfflineManager] pausing {}", book_id);
    events_.emit(DownloadPaused{book_id});
    return true;
}

DownloadResult OfflineManager::resume_download(const BookManifest& manifest) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = books_.find(manifest.book_id);
        if (it == books_.end()) {
            return std::unexpected(make_error_code(OfflineErrc::book_not_found));
        }
        if (!is_resumable(it->second.status)) {
            return std::unexpected(make_error_code(OfflineErrc::not_paused));
        }
    }

    spdlog::info("[OfflineManager] resuming {}", manifest.book_id);
    events_.emit(DownloadResumed{manifest.book_id});
    return download_book(manifest);
}

void OfflineManager::cancel_download(const std::string& book_id) {
    remove_offline_book(book_id);
    spdlog::info("[OfflineManager] cancelled {}", book_id);
    events_.emit(DownloadCancelled{book_id});
}

bool OfflineManager::remove_offline_book(const std::string& book_id) {
    bool existed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = active_.find(book_id); it != active_.end()) {
            it->second->removed = true;
            it->second->stop.request_stop();
        }
        existed = books_.erase(book_id) > 0;
        erase_record_locked(book_id);
    }

    if (auto cleared = cache_.remove_book(book_id); !cleared) {
        spdlog::warn("[OfflineManager] could not clear cache of {}: {}", book_id,
                     cleared.error().message());
    }
    return existed;
}

//=============================================================================
// Queries
//=============================================================================

std::vector<OfflineBook> OfflineManager::offline_books() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OfflineBook> result;
    result.reserve(books_.size());
    for (const auto& [id, book] : books_) {
        result.push_back(book);
    }
    return result;
}

std::optional<OfflineBook> OfflineManager::offline_book(const std::string& book_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(book_id);
    if (it == books_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool OfflineManager::is_book_offline(const std::string& book_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(book_id);
    return it != books_.end() && it->second.status == DownloadStatus::completed;
}

bool OfflineManager::mark_accessed(const std::string& book_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = books_.find(book_id);
    if (it == books_.end()) {
        return false;
    }
    it->second.last_accessed_at = core::Clock::now();
    persist_locked(it->second);
    return true;
}

bool OfflineManager::is_downloading(const std::string& book_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.contains(book_id);
}

std::size_t OfflineManager::active_download_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::uint64_t OfflineManager::total_storage_used() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& [id, book] : books_) {
        total += book.status == DownloadStatus::completed ? book.total_size : book.downloaded_size;
    }
    return total;
}

StorageInfo OfflineManager::storage_info() const {
    if (!quota_) {
        return {};
    }
    auto estimate = quota_->estimate();
    if (!estimate) {
        return {};
    }

    StorageInfo info;
    info.used = estimate->usage;
    info.quota = estimate->quota;
    info.available = estimate->quota > estimate->usage ? estimate->quota - estimate->usage : 0;
    info.percentage = estimate->quota > 0
        ? static_cast<double>(estimate->usage) / static_cast<double>(estimate->quota) * 100.0
        : 0.0;
    return info;
}

std::vector<std::string> OfflineManager::cleanup_old_books(std::uint64_t target_bytes) {
    std::vector<OfflineBook> completed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, book] : books_) {
            if (book.status == DownloadStatus::completed) {
                completed.push_back(book);
            }
        }
    }

    std::stable_sort(completed.begin(), completed.end(),
        [](const OfflineBook& a, const OfflineBook& b) {
            return a.last_accessed_at < b.last_accessed_at;
        });

    std::vector<std::string> removed;
    std::uint64_t freed = 0;
    for (const auto& book : completed) {
        if (freed >= target_bytes) {
            break;
        }
        remove_offline_book(book.book_id);
        freed += book.total_size;
        removed.push_back(book.book_id);
    }

    if (!removed.empty()) {
        spdlog::info("[OfflineManager] cleanup removed {} book(s), freed {} bytes",
                     removed.size(), freed);
    }
    return removed;
}

//=============================================================================
// Persistence
//=============================================================================

void OfflineManager::persist_locked(const OfflineBook& book) {
    if (!meta_store_) {
        return;
    }

    const nlohmann::json j = book;
    auto written = meta_store_->set(std::string(core::OFFLINE_META_BOOK_ID),
                                    book.book_id,
                                    core::share(core::to_bytes(j.dump())),
                                    std::string(META_MIME_TYPE));
    if (!written) {
        spdlog::warn("[OfflineManager] could not persist {}: {}", book.book_id,
                     written.error().message());
    }
}

void OfflineManager::erase_record_locked(const std::string& book_id) {
    if (!meta_store_) {
        return;
    }

    auto removed = meta_store_->remove(std::string(core::OFFLINE_META_BOOK_ID), book_id);
    if (!removed) {
        spdlog::warn("[OfflineManager] could not delete record {}: {}", book_id,
                     removed.error().message());
    }
}

} // namespace folio::offline
