// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/offline/offline_book.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace folio::offline {

namespace {

template<typename T>
void put_optional(nlohmann::json& j, const char* name, const std::optional<T>& value) {
    if (value) {
        j[name] = *value;
    }
}

template<typename T>
std::optional<T> get_optional(const nlohmann::json& j, const char* name) {
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

void put_time(nlohmann::json& j, const char* name, const std::optional<core::Timestamp>& t) {
    if (t) {
        j[name] = core::to_unix_ms(*t);
    }
}

std::optional<core::Timestamp> get_time(const nlohmann::json& j, const char* name) {
    if (auto ms = get_optional<std::int64_t>(j, name)) {
        return core::from_unix_ms(*ms);
    }
    return std::nullopt;
}

} // namespace

std::string_view to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::pending:     return "pending";
        case DownloadStatus::downloading: return "downloading";
        case DownloadStatus::paused:      return "paused";
        case DownloadStatus::completed:   return "completed";
        case DownloadStatus::failed:      return "failed";
        case DownloadStatus::partial:     return "partial";
    }
    return "unknown";
}

std::optional<DownloadStatus> parse_download_status(std::string_view text) noexcept {
    if (text == "pending")     return DownloadStatus::pending;
    if (text == "downloading") return DownloadStatus::downloading;
    if (text == "paused")      return DownloadStatus::paused;
    if (text == "completed")   return DownloadStatus::completed;
    if (text == "failed")      return DownloadStatus::failed;
    if (text == "partial")     return DownloadStatus::partial;
    return std::nullopt;
}

std::uint64_t BookManifest::total_size() const noexcept {
    std::uint64_t total = 0;
    for (const auto& resource : resources) {
        total += resource.size_bytes.value_or(0);
    }
    return total;
}

//=============================================================================
// OfflineBook
//=============================================================================

void to_json(nlohmann::json& j, const OfflineBook& book) {
    j = nlohmann::json{
        {"bookId", book.book_id},
        {"title", book.title},
        {"totalSize", book.total_size},
        {"downloadedSize", book.downloaded_size},
        {"resourceCount", book.resource_count},
        {"downloadedCount", book.downloaded_count},
        {"status", std::string(to_string(book.status))},
        {"lastAccessedAt", core::to_unix_ms(book.last_accessed_at)},
    };
    put_optional(j, "author", book.author);
    put_time(j, "startedAt", book.started_at);
    put_time(j, "completedAt", book.completed_at);
    put_optional(j, "error", book.error);
}

void from_json(const nlohmann::json& j, OfflineBook& book) {
    j.at("bookId").get_to(book.book_id);
    j.at("title").get_to(book.title);
    book.author = get_optional<std::string>(j, "author");
    book.total_size = j.value("totalSize", std::uint64_t{0});
    book.downloaded_size = j.value("downloadedSize", std::uint64_t{0});
    book.resource_count = j.value("resourceCount", std::uint32_t{0});
    book.downloaded_count = j.value("downloadedCount", std::uint32_t{0});

    auto status = parse_download_status(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown download status: " + j.at("status").get<std::string>());
    }
    book.status = *status;

    book.started_at = get_time(j, "startedAt");
    book.completed_at = get_time(j, "completedAt");
    book.last_accessed_at = core::from_unix_ms(j.value("lastAccessedAt", std::int64_t{0}));
    book.error = get_optional<std::string>(j, "error");
}

//=============================================================================
// Manifest
//=============================================================================

void to_json(nlohmann::json& j, const ResourceInfo& info) {
    j = nlohmann::json{
        {"href", info.href},
        {"mimeType", info.mime_type},
        {"required", info.required},
    };
    put_optional(j, "sizeBytes", info.size_bytes);
}

void from_json(const nlohmann::json& j, ResourceInfo& info) {
    j.at("href").get_to(info.href);
    info.mime_type = j.value("mimeType", std::string{});
    info.size_bytes = get_optional<std::uint64_t>(j, "sizeBytes");
    info.required = j.value("required", true);
}

void to_json(nlohmann::json& j, const BookManifest& manifest) {
    j = nlohmann::json{
        {"bookId", manifest.book_id},
        {"title", manifest.title},
        {"resources", manifest.resources},
    };
    put_optional(j, "author", manifest.author);
    put_optional(j, "coverHref", manifest.cover_href);
}

void from_json(const nlohmann::json& j, BookManifest& manifest) {
    j.at("bookId").get_to(manifest.book_id);
    manifest.title = j.value("title", std::string{});
    manifest.author = get_optional<std::string>(j, "author");
    manifest.cover_href = get_optional<std::string>(j, "coverHref");
    manifest.resources = j.value("resources", std::vector<ResourceInfo>{});
}

} // namespace folio::offline
