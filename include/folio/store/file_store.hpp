// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <folio/store/persistent_store.hpp>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace folio::store {

struct FileStoreConfig {
    std::filesystem::path root;
    std::uint64_t max_size_bytes{core::L2_MAX_SIZE_BYTES};
    std::size_t max_entries{core::L2_MAX_ENTRIES};
};

// PersistentStore on a directory tree:
//   <root>/<book>/<href>.data       payload
//   <root>/<book>/<href>.meta.json  key, mime type, timestamps, metadata
// Path components are percent-encoded. Files are written to a temporary name
// and renamed into place. An in-memory index is rebuilt from the sidecars on
// init and drives LRU eviction by accessed_at.
class FileStore final : public PersistentStore {
public:
    explicit FileStore(FileStoreConfig config);
    ~FileStore() override;

    FileStore(const FileStore&) = delete;
    FileStore& operator=(const FileStore&) = delete;

    StoreResult<void> init() override;

    StoreResult<std::optional<StoredEntry>> get(const std::string& book_id,
                                                const std::string& href) override;

    StoreResult<void> set(const std::string& book_id,
                          const std::string& href,
                          core::SharedBytes data,
                          const std::string& mime_type,
                          const core::Metadata& metadata = {}) override;

    StoreResult<bool> has(const std::string& book_id, const std::string& href) override;
    StoreResult<bool> remove(const std::string& book_id, const std::string& href) override;
    StoreResult<std::size_t> remove_book(const std::string& book_id) override;
    StoreResult<std::vector<StoredEntry>> book_entries(const std::string& book_id) override;
    StoreResult<std::vector<std::string>> list_books() override;
    StoreResult<std::uint64_t> book_size(const std::string& book_id) override;
    StoreResult<StoreStats> stats() override;
    StoreResult<void> clear() override;
    void close() noexcept override;
    StoreResult<void> destroy() override;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return config_.root; }

    // Filesystem-safe form of a key component
    [[nodiscard]] static std::string encode_component(std::string_view component);

private:
    // Index record; payloads stay on disk
    struct IndexEntry {
        std::string book_id;
        std::string href;
        std::string mime_type;
        std::uint64_t size_bytes{0};
        core::Timestamp created_at;
        core::Timestamp accessed_at;
        std::uint64_t access_count{0};
        core::Metadata metadata;
    };

    // All require mutex_ held
    StoreResult<void> ensure_init();
    StoreResult<void> rebuild_index();
    StoreResult<void> write_sidecar(const std::string& key, const IndexEntry& entry);
    StoreResult<core::SharedBytes> read_payload(const IndexEntry& entry) const;
    StoreResult<void> erase_files(const IndexEntry& entry);
    StoreResult<void> evict_if_needed(std::uint64_t incoming_size);
    [[nodiscard]] std::filesystem::path entry_base(const std::string& book_id,
                                                   const std::string& href) const;
    [[nodiscard]] StoredEntry make_stored(const std::string& key, const IndexEntry& entry,
                                          core::SharedBytes data) const;

    FileStoreConfig config_;

    mutable std::mutex mutex_;
    bool initialized_{false};
    std::map<std::string, IndexEntry> index_;
    std::uint64_t total_size_{0};
};

} // namespace folio::store
