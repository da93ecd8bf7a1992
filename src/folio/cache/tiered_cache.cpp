// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cache/tiered_cache.hpp>
#include <folio/core/cache_key.hpp>
#include <folio/core/mime.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <set>

namespace folio::cache {

namespace {

double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
}

void log_l2_failure(std::string_view op, const std::error_code& ec) {
    spdlog::warn("[TieredCache] L2 {} failed: {}", op, ec.message());
}

} // namespace

std::string_view to_string(Tier tier) noexcept {
    switch (tier) {
        case Tier::l1: return "L1";
        case Tier::l2: return "L2";
        case Tier::l3: return "L3";
    }
    return "unknown";
}

//=============================================================================
// Lifecycle
//=============================================================================

TieredCache::TieredCache(std::shared_ptr<RemoteProvider> provider,
                         std::shared_ptr<store::PersistentStore> l2,
                         TieredCacheConfig config)
    : config_(config)
    , provider_(std::move(provider))
    , l2_(std::move(l2))
    , l1_(config_.l1)
    , l2_enabled_(config_.enable_l2 && l2_ != nullptr) {}

TieredCache::~TieredCache() = default;

std::expected<void, std::error_code> TieredCache::init() {
    auto* l2 = active_l2();
    if (!l2) {
        return {};
    }
    if (auto opened = l2->init(); !opened) {
        log_l2_failure("init", opened.error());
        return opened;
    }
    return {};
}

store::PersistentStore* TieredCache::active_l2() const noexcept {
    return l2_enabled_.load(std::memory_order_acquire) ? l2_.get() : nullptr;
}

bool TieredCache::l2_enabled() const noexcept {
    return active_l2() != nullptr;
}

std::expected<void, std::error_code> TieredCache::set_l2_enabled(bool enabled) {
    if (!enabled) {
        l2_enabled_.store(false, std::memory_order_release);
        return {};
    }
    if (!l2_) {
        return std::unexpected(make_error_code(CacheErrc::l2_unavailable));
    }
    l2_enabled_.store(true, std::memory_order_release);
    return init();
}

void TieredCache::close() {
    l1_.clear();
    if (l2_) {
        l2_->close();
    }
}

std::expected<void, std::error_code> TieredCache::destroy() {
    l1_.clear();
    reset_stats();
    if (l2_) {
        if (auto destroyed = l2_->destroy(); !destroyed) {
            log_l2_failure("destroy", destroyed.error());
            return destroyed;
        }
    }
    return {};
}

//=============================================================================
// Core operations
//=============================================================================

std::expected<CachedResource, std::error_code>
TieredCache::get(const std::string& book_id, const std::string& href) {
    if (!core::is_valid_book_id(book_id)) {
        return std::unexpected(make_error_code(CacheErrc::invalid_key));
    }

    const auto start = std::chrono::steady_clock::now();
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    const auto key = core::make_key(book_id, href);

    // L1
    if (auto entry = l1_.get(key)) {
        l1_hits_.fetch_add(1, std::memory_order_relaxed);
        spdlog::trace("[TieredCache] L1 hit {}", key);
        return CachedResource{
            std::move(entry->data),
            std::move(entry->mime_type),
            l1_.blob_url(key),
            Tier::l1,
            elapsed_ms(start),
        };
    }

    // L2
    if (auto* l2 = active_l2()) {
        auto stored = l2->get(book_id, href);
        if (!stored) {
            log_l2_failure("get", stored.error());
        } else if (stored->has_value()) {
            auto& entry = **stored;
            l2_hits_.fetch_add(1, std::memory_order_relaxed);
            spdlog::trace("[TieredCache] L2 hit {}", key);

            std::optional<std::string> url;
            if (config_.promote_on_access) {
                spdlog::debug("[TieredCache] promoting {} to L1", key);
                l1_.set(key, entry.data, entry.mime_type, entry.metadata);
                url = l1_.blob_url(key);
            }

            return CachedResource{
                std::move(entry.data),
                std::move(entry.mime_type),
                std::move(url),
                Tier::l2,
                elapsed_ms(start),
            };
        }
    }

    // L3
    if (!provider_) {
        return std::unexpected(make_error_code(CacheErrc::provider_error));
    }
    auto bytes = provider_->get_resource(book_id, href);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    auto mime = provider_->mime_type(book_id, href);
    std::string mime_type = mime && !mime->empty()
        ? std::move(*mime)
        : std::string(core::guess_mime_type(href));

    l3_hits_.fetch_add(1, std::memory_order_relaxed);
    spdlog::trace("[TieredCache] L3 fetch {} ({} bytes)", key, bytes->size());

    auto data = core::share(std::move(*bytes));
    if (auto stored = set(book_id, href, data, mime_type); !stored) {
        return std::unexpected(stored.error());
    }

    return CachedResource{
        std::move(data),
        std::move(mime_type),
        l1_.blob_url(key),
        Tier::l3,
        elapsed_ms(start),
    };
}

std::expected<void, std::error_code> TieredCache::set(const std::string& book_id,
                                                      const std::string& href,
                                                      core::SharedBytes data,
                                                      const std::string& mime_type,
                                                      const core::Metadata& metadata) {
    if (!core::is_valid_book_id(book_id)) {
        return std::unexpected(make_error_code(CacheErrc::invalid_key));
    }

    l1_.set(core::make_key(book_id, href), data, mime_type, metadata);

    if (!config_.write_through) {
        return {};
    }
    if (auto* l2 = active_l2()) {
        if (auto written = l2->set(book_id, href, std::move(data), mime_type, metadata); !written) {
            log_l2_failure("set", written.error());
        }
    }
    return {};
}

bool TieredCache::has(const std::string& book_id, const std::string& href) {
    if (!core::is_valid_book_id(book_id)) {
        return false;
    }
    if (l1_.has(core::make_key(book_id, href))) {
        return true;
    }

    if (auto* l2 = active_l2()) {
        auto found = l2->has(book_id, href);
        if (!found) {
            log_l2_failure("has", found.error());
            return false;
        }
        return *found;
    }
    return false;
}

void TieredCache::remove(const std::string& book_id, const std::string& href) {
    if (!core::is_valid_book_id(book_id)) {
        return;
    }
    l1_.remove(core::make_key(book_id, href));

    if (auto* l2 = active_l2()) {
        if (auto removed = l2->remove(book_id, href); !removed) {
            log_l2_failure("remove", removed.error());
        }
    }
}

void TieredCache::clear() {
    l1_.clear();

    if (auto* l2 = active_l2()) {
        if (auto cleared = l2->clear(); !cleared) {
            log_l2_failure("clear", cleared.error());
        }
    }

    reset_stats();
}

//=============================================================================
// Book-level operations
//=============================================================================

std::expected<void, std::error_code> TieredCache::remove_book(const std::string& book_id) {
    // An invalid id's prefix would match another book's keys
    if (!core::is_valid_book_id(book_id)) {
        return std::unexpected(make_error_code(CacheErrc::invalid_key));
    }

    auto removed = l1_.remove_prefix(core::book_prefix(book_id));
    spdlog::debug("[TieredCache] dropped {} L1 entries of {}", removed, book_id);

    if (auto* l2 = active_l2()) {
        if (auto result = l2->remove_book(book_id); !result) {
            log_l2_failure("remove_book", result.error());
        }
    }
    return {};
}

std::size_t TieredCache::preload(const std::string& book_id,
                                 const std::vector<std::string>& hrefs,
                                 const PreloadCallback& on_progress) {
    std::size_t failures = 0;
    const auto total = hrefs.size();

    for (std::size_t i = 0; i < total; ++i) {
        const auto& href = hrefs[i];
        if (!has(book_id, href)) {
            if (auto fetched = get(book_id, href); !fetched) {
                spdlog::warn("[TieredCache] Failed to preload {}: {}", href, fetched.error().message());
                ++failures;
            }
        }
        if (on_progress) {
            on_progress(i + 1, total);
        }
    }
    return failures;
}

std::vector<std::string> TieredCache::cached_hrefs(const std::string& book_id) {
    if (!core::is_valid_book_id(book_id)) {
        return {};
    }

    std::set<std::string> hrefs;
    const auto prefix = core::book_prefix(book_id);

    for (const auto& key : l1_.keys()) {
        if (key.starts_with(prefix)) {
            hrefs.insert(key.substr(prefix.size()));
        }
    }

    if (auto* l2 = active_l2()) {
        auto entries = l2->book_entries(book_id);
        if (!entries) {
            log_l2_failure("cached_hrefs", entries.error());
        } else {
            for (const auto& entry : *entries) {
                hrefs.insert(entry.href);
            }
        }
    }

    return {hrefs.begin(), hrefs.end()};
}

std::expected<std::string, std::error_code>
TieredCache::blob_url(const std::string& book_id, const std::string& href) {
    const auto key = core::make_key(book_id, href);
    if (auto url = l1_.blob_url(key)) {
        return *url;
    }

    auto fetched = get(book_id, href);
    if (!fetched) {
        return std::unexpected(fetched.error());
    }

    if (auto url = l1_.blob_url(key)) {
        return *url;
    }
    return std::unexpected(make_error_code(CacheErrc::blob_unavailable));
}

//=============================================================================
// Statistics
//=============================================================================

TieredCacheStats TieredCache::stats() {
    TieredCacheStats result;
    result.l1 = l1_.stats();

    if (auto* l2 = active_l2()) {
        auto l2_stats = l2->stats();
        if (!l2_stats) {
            log_l2_failure("stats", l2_stats.error());
        } else {
            result.l2 = std::move(*l2_stats);
        }
    }

    auto& combined = result.combined;
    combined.hits_by_tier.l1 = l1_hits_.load(std::memory_order_relaxed);
    combined.hits_by_tier.l2 = l2_hits_.load(std::memory_order_relaxed);
    combined.hits_by_tier.l3 = l3_hits_.load(std::memory_order_relaxed);
    combined.total_requests = total_requests_.load(std::memory_order_relaxed);

    combined.total_size_bytes = result.l1.size_bytes + (result.l2 ? result.l2->size_bytes : 0);
    combined.total_entries = result.l1.entries + (result.l2 ? result.l2->entries : 0);

    const auto total_hits = combined.hits_by_tier.l1 + combined.hits_by_tier.l2 +
                            combined.hits_by_tier.l3;
    combined.hit_ratio = combined.total_requests > 0
        ? static_cast<double>(total_hits) / static_cast<double>(combined.total_requests)
        : 0.0;

    return result;
}

void TieredCache::reset_stats() {
    l1_hits_.store(0, std::memory_order_relaxed);
    l2_hits_.store(0, std::memory_order_relaxed);
    l3_hits_.store(0, std::memory_order_relaxed);
    total_requests_.store(0, std::memory_order_relaxed);
    l1_.reset_stats();
}

} // namespace folio::cache
