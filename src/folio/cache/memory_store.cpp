// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cache/memory_store.hpp>
#include <spdlog/spdlog.h>

namespace folio::cache {

MemoryStore::MemoryStore(MemoryStoreConfig config, std::shared_ptr<core::BlobRegistry> registry)
    : config_(config)
    , registry_(registry ? std::move(registry) : core::BlobRegistry::create()) {}

MemoryStore::~MemoryStore() {
    clear();
}

std::optional<MemoryEntry> MemoryStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto node = it->second;
    node->entry.accessed_at = core::Clock::now();
    ++node->entry.access_count;

    // Move to front (most recently used)
    lru_.splice(lru_.begin(), lru_, node);

    ++hits_;
    return node->entry;
}

std::optional<MemoryEntry> MemoryStore::peek(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second->entry;
}

void MemoryStore::set(const std::string& key,
                      core::SharedBytes data,
                      std::string mime_type,
                      core::Metadata metadata) {
    const std::uint64_t size = data ? data->size() : 0;
    const auto now = core::Clock::now();

    // Acquire the blob handle outside our lock
    auto blob = registry_->acquire(data, mime_type);

    std::lock_guard<std::mutex> lock(mutex_);

    // Replacing an entry drops the old one (and its handle) first
    if (auto it = index_.find(key); it != index_.end()) {
        erase_node(it->second);
    }

    evict_if_needed(size);

    Node node{
        key,
        MemoryEntry{std::move(data), std::move(mime_type), std::move(metadata), size, now, now, 1},
        std::move(blob),
    };
    lru_.push_front(std::move(node));
    index_.emplace(key, lru_.begin());
    current_size_ += size;
}

bool MemoryStore::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.contains(key);
}

bool MemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return false;
    }
    erase_node(it->second);
    return true;
}

std::size_t MemoryStore::remove_prefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = lru_.begin(); it != lru_.end();) {
        auto next = std::next(it);
        if (it->key.starts_with(prefix)) {
            erase_node(it);
            ++removed;
        }
        it = next;
    }
    return removed;
}

std::vector<std::string> MemoryStore::keys() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(lru_.size());
    for (const auto& node : lru_) {
        result.push_back(node.key);
    }
    return result;
}

void MemoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    evictions_ += lru_.size();
    // Node destructors release the blob handles
    index_.clear();
    lru_.clear();
    current_size_ = 0;
}

std::optional<std::string> MemoryStore::blob_url(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end() || !it->second->blob.valid()) {
        return std::nullopt;
    }
    return it->second->blob.url();
}

MemoryStats MemoryStore::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto total = hits_ + misses_;
    return MemoryStats{
        .entries = index_.size(),
        .size_bytes = current_size_,
        .max_size_bytes = config_.max_size_bytes,
        .max_entries = config_.max_entries,
        .hits = hits_,
        .misses = misses_,
        .hit_ratio = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0,
        .evictions = evictions_,
    };
}

void MemoryStore::reset_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
}

void MemoryStore::resize(std::uint64_t max_size_bytes, std::size_t max_entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.max_size_bytes = max_size_bytes;
    config_.max_entries = max_entries;

    while (!lru_.empty() &&
           (current_size_ > config_.max_size_bytes || index_.size() > config_.max_entries)) {
        erase_node(std::prev(lru_.end()));
        ++evictions_;
    }
}

std::uint64_t MemoryStore::size_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_size_;
}

std::size_t MemoryStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.size();
}

void MemoryStore::evict_if_needed(std::uint64_t incoming_size) {
    // Evict by size, then by count, oldest first
    while (!lru_.empty() && current_size_ + incoming_size > config_.max_size_bytes) {
        spdlog::debug("[MemoryStore] evicting {} ({} bytes) for size", lru_.back().key,
                      lru_.back().entry.size_bytes);
        erase_node(std::prev(lru_.end()));
        ++evictions_;
    }
    while (!lru_.empty() && index_.size() >= config_.max_entries) {
        spdlog::debug("[MemoryStore] evicting {} for entry count", lru_.back().key);
        erase_node(std::prev(lru_.end()));
        ++evictions_;
    }
}

void MemoryStore::erase_node(LruList::iterator it) {
    current_size_ -= it->entry.size_bytes;
    index_.erase(it->key);
    lru_.erase(it);  // releases the node's blob handle
}

} // namespace folio::cache
