// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/cache/error.hpp>
#include <folio/cache/remote_provider.hpp>
#include <folio/core/cache_key.hpp>
#include <folio/offline/storage_quota.hpp>
#include <folio/store/persistent_store.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>

namespace folio::test {

inline core::Bytes bytes_of_size(std::size_t n, char fill = 'x') {
    return core::Bytes(n, static_cast<std::byte>(fill));
}

// Provider serving canned resources, with failure injection, an optional
// per-call delay and a gate that holds every call until opened.
class ScriptedProvider : public cache::RemoteProvider {
public:
    void add(const std::string& book_id, const std::string& href, core::Bytes data,
             std::optional<std::string> mime = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto key = core::make_key(book_id, href);
        resources_[key] = std::move(data);
        if (mime) {
            mimes_[key] = *mime;
        }
    }

    void fail_always(const std::string& book_id, const std::string& href,
                     std::error_code ec = make_error_code(cache::CacheErrc::network_error)) {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[core::make_key(book_id, href)] = ec;
    }

    void delay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = d;
    }

    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    // Block until n calls are waiting at the closed gate
    bool wait_for_waiting(std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return waiting_cv_.wait_for(lock, timeout, [&] { return waiting_ >= n; });
    }

    [[nodiscard]] int calls(const std::string& book_id, const std::string& href) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(core::make_key(book_id, href));
        return it == calls_.end() ? 0 : it->second;
    }

    [[nodiscard]] int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [key, n] : calls_) {
            total += n;
        }
        return total;
    }

    [[nodiscard]] std::size_t max_in_flight() const { return max_in_flight_.load(); }

    std::expected<core::Bytes, std::error_code>
    get_resource(const std::string& book_id, const std::string& href) override {
        const auto key = core::make_key(book_id, href);
        const auto now_in_flight = ++in_flight_;
        auto seen = max_in_flight_.load();
        while (now_in_flight > seen && !max_in_flight_.compare_exchange_weak(seen, now_in_flight)) {
        }

        std::chrono::milliseconds pause{0};
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++calls_[key];
            ++waiting_;
            waiting_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return gate_open_; });
            --waiting_;
            pause = delay_;
        }
        if (pause.count() > 0) {
            std::this_thread::sleep_for(pause);
        }

        std::expected<core::Bytes, std::error_code> result =
            std::unexpected(make_error_code(cache::CacheErrc::not_found));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (auto f = failures_.find(key); f != failures_.end()) {
                result = std::unexpected(f->second);
            } else if (auto r = resources_.find(key); r != resources_.end()) {
                result = r->second;
            }
        }

        --in_flight_;
        return result;
    }

    std::optional<std::string> mime_type(const std::string& book_id, const std::string& href) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = mimes_.find(core::make_key(book_id, href));
        if (it == mimes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    std::condition_variable waiting_cv_;
    std::map<std::string, core::Bytes> resources_;
    std::map<std::string, std::string> mimes_;
    std::map<std::string, std::error_code> failures_;
    std::map<std::string, int> calls_;
    std::chrono::milliseconds delay_{0};
    bool gate_open_{true};
    std::size_t waiting_{0};
    std::atomic<std::size_t> in_flight_{0};
    std::atomic<std::size_t> max_in_flight_{0};
};

// PersistentStore held in memory; fail(true) makes every operation error
class InMemoryStore : public store::PersistentStore {
public:
    void fail(bool enabled) { failing_ = enabled; }
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    store::StoreResult<void> init() override {
        if (failing_) return broken();
        return {};
    }

    store::StoreResult<std::optional<store::StoredEntry>>
    get(const std::string& book_id, const std::string& href) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(core::make_key(book_id, href));
        if (it == entries_.end()) {
            return std::optional<store::StoredEntry>{};
        }
        it->second.accessed_at = core::Clock::now();
        ++it->second.access_count;
        return std::optional<store::StoredEntry>{it->second};
    }

    store::StoreResult<void> set(const std::string& book_id, const std::string& href,
                                 core::SharedBytes data, const std::string& mime_type,
                                 const core::Metadata& metadata = {}) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        const auto key = core::make_key(book_id, href);
        const auto now = core::Clock::now();
        store::StoredEntry entry;
        entry.key = key;
        entry.book_id = book_id;
        entry.href = href;
        entry.size_bytes = data ? data->size() : 0;
        entry.data = std::move(data);
        entry.mime_type = mime_type;
        entry.created_at = now;
        entry.accessed_at = now;
        entry.metadata = metadata;
        entries_[key] = std::move(entry);
        return {};
    }

    store::StoreResult<bool> has(const std::string& book_id, const std::string& href) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.contains(core::make_key(book_id, href));
    }

    store::StoreResult<bool> remove(const std::string& book_id, const std::string& href) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(core::make_key(book_id, href)) > 0;
    }

    store::StoreResult<std::size_t> remove_book(const std::string& book_id) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(std::erase_if(entries_, [&](const auto& kv) {
            return kv.second.book_id == book_id;
        }));
    }

    store::StoreResult<std::vector<store::StoredEntry>> book_entries(const std::string& book_id) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<store::StoredEntry> result;
        for (const auto& [key, entry] : entries_) {
            if (entry.book_id == book_id) {
                result.push_back(entry);
            }
        }
        return result;
    }

    store::StoreResult<std::vector<std::string>> list_books() override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        std::set<std::string> books;
        for (const auto& [key, entry] : entries_) {
            books.insert(entry.book_id);
        }
        return std::vector<std::string>(books.begin(), books.end());
    }

    store::StoreResult<std::uint64_t> book_size(const std::string& book_id) override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        std::uint64_t total = 0;
        for (const auto& [key, entry] : entries_) {
            if (entry.book_id == book_id) total += entry.size_bytes;
        }
        return total;
    }

    store::StoreResult<store::StoreStats> stats() override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        store::StoreStats s;
        s.entries = entries_.size();
        for (const auto& [key, entry] : entries_) {
            s.size_bytes += entry.size_bytes;
            s.size_by_book[entry.book_id] += entry.size_bytes;
        }
        s.book_count = s.size_by_book.size();
        return s;
    }

    store::StoreResult<void> clear() override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        return {};
    }

    void close() noexcept override {}

    store::StoreResult<void> destroy() override {
        if (failing_) return broken();
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        return {};
    }

private:
    static std::unexpected<std::error_code> broken() {
        return std::unexpected(make_error_code(store::StoreErrc::io_error));
    }

    std::atomic<bool> failing_{false};
    mutable std::mutex mutex_;
    std::map<std::string, store::StoredEntry> entries_;
};

class FixedQuota : public offline::StorageQuota {
public:
    explicit FixedQuota(std::optional<offline::QuotaEstimate> estimate)
        : estimate_(estimate) {}

    std::optional<offline::QuotaEstimate> estimate() const override { return estimate_; }

private:
    std::optional<offline::QuotaEstimate> estimate_;
};

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = std::filesystem::temp_directory_path() /
                ("folio-test-" + std::to_string(gen()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace folio::test
