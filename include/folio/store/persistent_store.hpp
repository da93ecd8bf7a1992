// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/types.hpp>
#include <folio/store/error.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace folio::store {

template<typename T>
using StoreResult = std::expected<T, std::error_code>;

// Entry as persisted in L2
struct StoredEntry {
    std::string key;
    std::string book_id;
    std::string href;
    core::SharedBytes data;
    std::string mime_type;
    std::uint64_t size_bytes{0};
    core::Timestamp created_at;
    core::Timestamp accessed_at;
    std::uint64_t access_count{0};
    core::Metadata metadata;
};

struct StoreStats {
    std::size_t entries{0};
    std::uint64_t size_bytes{0};
    std::uint64_t max_size_bytes{0};
    std::size_t book_count{0};
    std::map<std::string, std::uint64_t> size_by_book;
};

// L2: durable key/value store over binary resources, indexed by book.
// Implementations initialise lazily; every operation may fail with a
// StoreErrc (or a std::errc from the filesystem).
class PersistentStore {
public:
    virtual ~PersistentStore() = default;

    // Idempotent; the first operation runs it implicitly
    virtual StoreResult<void> init() = 0;

    // Updates accessed_at and access_count on hit
    virtual StoreResult<std::optional<StoredEntry>> get(const std::string& book_id,
                                                        const std::string& href) = 0;

    virtual StoreResult<void> set(const std::string& book_id,
                                  const std::string& href,
                                  core::SharedBytes data,
                                  const std::string& mime_type,
                                  const core::Metadata& metadata = {}) = 0;

    virtual StoreResult<bool> has(const std::string& book_id, const std::string& href) = 0;

    // true when an entry was removed
    virtual StoreResult<bool> remove(const std::string& book_id, const std::string& href) = 0;

    // Number of entries removed
    virtual StoreResult<std::size_t> remove_book(const std::string& book_id) = 0;

    virtual StoreResult<std::vector<StoredEntry>> book_entries(const std::string& book_id) = 0;

    virtual StoreResult<std::vector<std::string>> list_books() = 0;

    virtual StoreResult<std::uint64_t> book_size(const std::string& book_id) = 0;

    virtual StoreResult<StoreStats> stats() = 0;

    virtual StoreResult<void> clear() = 0;

    // Release resources; a later operation reopens the store
    virtual void close() noexcept = 0;

    // Delete all persisted state
    virtual StoreResult<void> destroy() = 0;
};

} // namespace folio::store
