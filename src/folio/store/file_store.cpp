// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/store/file_store.hpp>
#include <folio/core/cache_key.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>
#include <fstream>
#include <set>

namespace folio::store {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view DATA_SUFFIX = ".data";
constexpr std::string_view META_SUFFIX = ".meta.json";
constexpr std::string_view TMP_SUFFIX = ".tmp";

// Keep file names well under common NAME_MAX (255)
constexpr std::size_t MAX_COMPONENT_LENGTH = 180;
constexpr std::size_t TRUNCATED_PREFIX_LENGTH = 120;

std::uint64_t fnv1a64(std::string_view text) noexcept {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

bool is_unreserved(unsigned char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

std::error_code io_error() noexcept {
    return make_error_code(StoreErrc::io_error);
}

// Write bytes to path via a temporary file and rename
std::error_code write_atomically(const fs::path& path, const char* data, std::size_t size) {
    fs::path tmp = path;
    tmp += TMP_SUFFIX;

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return io_error();
        }
        file.write(data, static_cast<std::streamsize>(size));
        if (!file) {
            return io_error();
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return ec;
    }
    return {};
}

} // namespace

//=============================================================================
// Construction
//=============================================================================

FileStore::FileStore(FileStoreConfig config)
    : config_(std::move(config)) {}

FileStore::~FileStore() {
    close();
}

std::string FileStore::encode_component(std::string_view component) {
    // A lone '%' never results from percent-encoding, so it names the empty string
    if (component.empty()) {
        return "%";
    }

    std::string out;
    out.reserve(component.size());
    for (std::size_t i = 0; i < component.size(); ++i) {
        auto c = static_cast<unsigned char>(component[i]);
        // Leading '.' would produce "." / ".." or hidden files
        if (is_unreserved(c) && !(i == 0 && c == '.')) {
            out.push_back(static_cast<char>(c));
        } else {
            out += std::format("%{:02X}", c);
        }
    }

    if (out.size() > MAX_COMPONENT_LENGTH) {
        auto hash = fnv1a64(component);
        out = std::format("{}~{:016x}", out.substr(0, TRUNCATED_PREFIX_LENGTH), hash);
    }
    return out;
}

fs::path FileStore::entry_base(const std::string& book_id, const std::string& href) const {
    return config_.root / encode_component(book_id) / encode_component(href);
}

//=============================================================================
// Initialisation and index
//=============================================================================

StoreResult<void> FileStore::init() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ensure_init();
}

StoreResult<void> FileStore::ensure_init() {
    if (initialized_) {
        return {};
    }

    if (config_.root.empty()) {
        return std::unexpected(make_error_code(StoreErrc::not_initialized));
    }

    std::error_code ec;
    fs::create_directories(config_.root, ec);
    if (ec) {
        spdlog::warn("[FileStore] cannot create {}: {}", config_.root.string(), ec.message());
        return std::unexpected(ec);
    }

    if (auto rebuilt = rebuild_index(); !rebuilt) {
        return rebuilt;
    }

    initialized_ = true;
    spdlog::debug("[FileStore] opened {} ({} entries, {} bytes)",
                  config_.root.string(), index_.size(), total_size_);
    return {};
}

StoreResult<void> FileStore::rebuild_index() {
    index_.clear();
    total_size_ = 0;

    std::error_code ec;
    for (fs::directory_iterator books(config_.root, ec), end; !ec && books != end;
         books.increment(ec)) {
        std::error_code type_ec;
        if (!books->is_directory(type_ec)) {
            continue;
        }

        std::error_code file_ec;
        for (fs::directory_iterator files(books->path(), file_ec), file_end;
             !file_ec && files != file_end; files.increment(file_ec)) {
            const auto path = files->path();
            const auto name = path.filename().string();

            // Leftovers from an interrupted write
            if (name.ends_with(TMP_SUFFIX)) {
                std::error_code ignored;
                fs::remove(path, ignored);
                continue;
            }
            if (!name.ends_with(META_SUFFIX)) {
                continue;
            }

            try {
                std::ifstream in(path, std::ios::binary);
                auto j = nlohmann::json::parse(in);

                IndexEntry entry;
                const auto key = j.at("key").get<std::string>();
                entry.book_id = j.at("book_id").get<std::string>();
                entry.href = j.at("href").get<std::string>();
                entry.mime_type = j.at("mime_type").get<std::string>();
                entry.size_bytes = j.at("size_bytes").get<std::uint64_t>();
                entry.created_at = core::from_unix_ms(j.at("created_at").get<std::int64_t>());
                entry.accessed_at = core::from_unix_ms(j.at("accessed_at").get<std::int64_t>());
                entry.access_count = j.value("access_count", std::uint64_t{0});
                entry.metadata = j.value("metadata", nlohmann::json{});

                auto data_path = entry_base(entry.book_id, entry.href);
                data_path += DATA_SUFFIX;
                std::error_code size_ec;
                auto actual = fs::file_size(data_path, size_ec);
                if (size_ec || actual != entry.size_bytes) {
                    spdlog::warn("[FileStore] skipping {}: payload missing or truncated", key);
                    std::error_code ignored;
                    fs::remove(path, ignored);
                    fs::remove(data_path, ignored);
                    continue;
                }

                total_size_ += entry.size_bytes;
                index_.insert_or_assign(key, std::move(entry));
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("[FileStore] skipping corrupt record {}: {}", path.string(), e.what());
            }
        }
        if (file_ec) {
            spdlog::warn("[FileStore] cannot scan {}: {}", books->path().string(), file_ec.message());
        }
    }

    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

StoreResult<void> FileStore::write_sidecar(const std::string& key, const IndexEntry& entry) {
    nlohmann::json j = {
        {"key", key},
        {"book_id", entry.book_id},
        {"href", entry.href},
        {"mime_type", entry.mime_type},
        {"size_bytes", entry.size_bytes},
        {"created_at", core::to_unix_ms(entry.created_at)},
        {"accessed_at", core::to_unix_ms(entry.accessed_at)},
        {"access_count", entry.access_count},
        {"metadata", entry.metadata},
    };
    const auto text = j.dump();

    auto path = entry_base(entry.book_id, entry.href);
    path += META_SUFFIX;
    if (auto ec = write_atomically(path, text.data(), text.size())) {
        return std::unexpected(ec);
    }
    return {};
}

StoreResult<core::SharedBytes> FileStore::read_payload(const IndexEntry& entry) const {
    auto path = entry_base(entry.book_id, entry.href);
    path += DATA_SUFFIX;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error_code(StoreErrc::not_found));
    }

    core::Bytes bytes(entry.size_bytes);
    file.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (static_cast<std::uint64_t>(file.gcount()) != entry.size_bytes) {
        return std::unexpected(make_error_code(StoreErrc::corrupt_entry));
    }
    return core::share(std::move(bytes));
}

StoreResult<void> FileStore::erase_files(const IndexEntry& entry) {
    const auto base = entry_base(entry.book_id, entry.href);
    auto data_path = base;
    data_path += DATA_SUFFIX;
    auto meta_path = base;
    meta_path += META_SUFFIX;

    std::error_code ec;
    fs::remove(meta_path, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    fs::remove(data_path, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

StoreResult<void> FileStore::evict_if_needed(std::uint64_t incoming_size) {
    while (!index_.empty() &&
           (total_size_ + incoming_size > config_.max_size_bytes ||
            index_.size() >= config_.max_entries)) {
        auto oldest = std::min_element(index_.begin(), index_.end(),
            [](const auto& a, const auto& b) {
                return a.second.accessed_at < b.second.accessed_at;
            });

        spdlog::debug("[FileStore] evicting {} ({} bytes)", oldest->first, oldest->second.size_bytes);
        if (auto erased = erase_files(oldest->second); !erased) {
            return erased;
        }
        total_size_ -= oldest->second.size_bytes;
        index_.erase(oldest);
    }
    return {};
}

StoredEntry FileStore::make_stored(const std::string& key, const IndexEntry& entry,
                                   core::SharedBytes data) const {
    return StoredEntry{
        .key = key,
        .book_id = entry.book_id,
        .href = entry.href,
        .data = std::move(data),
        .mime_type = entry.mime_type,
        .size_bytes = entry.size_bytes,
        .created_at = entry.created_at,
        .accessed_at = entry.accessed_at,
        .access_count = entry.access_count,
        .metadata = entry.metadata,
    };
}

//=============================================================================
// Entry operations
//=============================================================================

StoreResult<std::optional<StoredEntry>> FileStore::get(const std::string& book_id,
                                                       const std::string& href) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    const auto key = core::make_key(book_id, href);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return std::optional<StoredEntry>{};
    }

    auto data = read_payload(it->second);
    if (!data) {
        // Payload vanished underneath us; forget the entry
        spdlog::warn("[FileStore] dropping {}: {}", key, data.error().message());
        total_size_ -= it->second.size_bytes;
        if (auto erased = erase_files(it->second); !erased) {
            spdlog::warn("[FileStore] cannot remove {}: {}", key, erased.error().message());
        }
        index_.erase(it);
        return std::optional<StoredEntry>{};
    }

    it->second.accessed_at = core::Clock::now();
    ++it->second.access_count;
    if (auto written = write_sidecar(key, it->second); !written) {
        spdlog::debug("[FileStore] access time for {} not persisted: {}", key,
                      written.error().message());
    }

    return std::optional<StoredEntry>{make_stored(key, it->second, std::move(*data))};
}

StoreResult<void> FileStore::set(const std::string& book_id,
                                 const std::string& href,
                                 core::SharedBytes data,
                                 const std::string& mime_type,
                                 const core::Metadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return ready;
    }

    const std::uint64_t size = data ? data->size() : 0;
    if (size > config_.max_size_bytes) {
        return std::unexpected(make_error_code(StoreErrc::quota_exceeded));
    }

    const auto key = core::make_key(book_id, href);
    const auto now = core::Clock::now();

    IndexEntry entry;
    entry.book_id = book_id;
    entry.href = href;
    entry.mime_type = mime_type;
    entry.size_bytes = size;
    entry.created_at = now;
    entry.accessed_at = now;
    entry.access_count = 0;
    entry.metadata = metadata;

    // Overwrite: account for the old entry before evicting
    if (auto it = index_.find(key); it != index_.end()) {
        total_size_ -= it->second.size_bytes;
        index_.erase(it);
    }

    if (auto evicted = evict_if_needed(size); !evicted) {
        return evicted;
    }

    std::error_code ec;
    fs::create_directories(config_.root / encode_component(book_id), ec);
    if (ec) {
        return std::unexpected(ec);
    }

    auto data_path = entry_base(book_id, href);
    data_path += DATA_SUFFIX;
    const char* raw = data ? reinterpret_cast<const char*>(data->data()) : nullptr;
    if (auto write_ec = write_atomically(data_path, raw, size)) {
        return std::unexpected(write_ec);
    }
    if (auto written = write_sidecar(key, entry); !written) {
        std::error_code ignored;
        fs::remove(data_path, ignored);
        return written;
    }

    total_size_ += size;
    index_.insert_or_assign(key, std::move(entry));
    return {};
}

StoreResult<bool> FileStore::has(const std::string& book_id, const std::string& href) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }
    return index_.contains(core::make_key(book_id, href));
}

StoreResult<bool> FileStore::remove(const std::string& book_id, const std::string& href) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    auto it = index_.find(core::make_key(book_id, href));
    if (it == index_.end()) {
        return false;
    }
    if (auto erased = erase_files(it->second); !erased) {
        return std::unexpected(erased.error());
    }
    total_size_ -= it->second.size_bytes;
    index_.erase(it);
    return true;
}

StoreResult<std::size_t> FileStore::remove_book(const std::string& book_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    const auto prefix = core::book_prefix(book_id);
    std::size_t removed = 0;
    for (auto it = index_.lower_bound(prefix); it != index_.end() && it->first.starts_with(prefix);) {
        total_size_ -= it->second.size_bytes;
        it = index_.erase(it);
        ++removed;
    }

    std::error_code ec;
    fs::remove_all(config_.root / encode_component(book_id), ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return removed;
}

StoreResult<std::vector<StoredEntry>> FileStore::book_entries(const std::string& book_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    const auto prefix = core::book_prefix(book_id);
    std::vector<StoredEntry> entries;
    for (auto it = index_.lower_bound(prefix); it != index_.end() && it->first.starts_with(prefix); ++it) {
        auto data = read_payload(it->second);
        if (!data) {
            spdlog::warn("[FileStore] skipping unreadable {}: {}", it->first, data.error().message());
            continue;
        }
        entries.push_back(make_stored(it->first, it->second, std::move(*data)));
    }
    return entries;
}

StoreResult<std::vector<std::string>> FileStore::list_books() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    std::set<std::string> books;
    for (const auto& [key, entry] : index_) {
        books.insert(entry.book_id);
    }
    return std::vector<std::string>(books.begin(), books.end());
}

StoreResult<std::uint64_t> FileStore::book_size(const std::string& book_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    const auto prefix = core::book_prefix(book_id);
    std::uint64_t total = 0;
    for (auto it = index_.lower_bound(prefix); it != index_.end() && it->first.starts_with(prefix); ++it) {
        total += it->second.size_bytes;
    }
    return total;
}

StoreResult<StoreStats> FileStore::stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return std::unexpected(ready.error());
    }

    StoreStats result;
    result.entries = index_.size();
    result.size_bytes = total_size_;
    result.max_size_bytes = config_.max_size_bytes;
    for (const auto& [key, entry] : index_) {
        result.size_by_book[entry.book_id] += entry.size_bytes;
    }
    result.book_count = result.size_by_book.size();
    return result;
}

//=============================================================================
// Lifecycle
//=============================================================================

StoreResult<void> FileStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto ready = ensure_init(); !ready) {
        return ready;
    }

    std::error_code ec;
    for (fs::directory_iterator it(config_.root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code remove_ec;
        fs::remove_all(it->path(), remove_ec);
        if (remove_ec) {
            return std::unexpected(remove_ec);
        }
    }
    if (ec) {
        return std::unexpected(ec);
    }

    index_.clear();
    total_size_ = 0;
    return {};
}

void FileStore::close() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    total_size_ = 0;
    initialized_ = false;
}

StoreResult<void> FileStore::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    total_size_ = 0;
    initialized_ = false;

    std::error_code ec;
    fs::remove_all(config_.root, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

} // namespace folio::store
