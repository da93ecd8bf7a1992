// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/types.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::offline {

// Per-book download state
enum class DownloadStatus : std::uint8_t {
    pending,
    downloading,
    paused,      // Explicitly paused (or cancelled mid-flight)
    completed,
    failed,
    partial      // Interrupted without an explicit pause
};

[[nodiscard]] std::string_view to_string(DownloadStatus status) noexcept;
[[nodiscard]] std::optional<DownloadStatus> parse_download_status(std::string_view text) noexcept;

// A status from which resume_download may continue
[[nodiscard]] constexpr bool is_resumable(DownloadStatus status) noexcept {
    return status == DownloadStatus::paused || status == DownloadStatus::partial;
}

// Persisted download record of one book
struct OfflineBook {
    std::string book_id;
    std::string title;
    std::optional<std::string> author;
    std::uint64_t total_size{0};
    std::uint64_t downloaded_size{0};
    std::uint32_t resource_count{0};
    std::uint32_t downloaded_count{0};
    DownloadStatus status{DownloadStatus::pending};
    std::optional<core::Timestamp> started_at;
    std::optional<core::Timestamp> completed_at;
    core::Timestamp last_accessed_at;
    std::optional<std::string> error;
};

struct ResourceInfo {
    std::string href;
    std::string mime_type;
    std::optional<std::uint64_t> size_bytes;
    bool required{true};
};

// Declared resources of one book
struct BookManifest {
    std::string book_id;
    std::string title;
    std::optional<std::string> author;
    std::optional<std::string> cover_href;
    std::vector<ResourceInfo> resources;

    // Sum of known resource sizes
    [[nodiscard]] std::uint64_t total_size() const noexcept;
};

// JSON (timestamps as Unix milliseconds, status as its name)
void to_json(nlohmann::json& j, const OfflineBook& book);
void from_json(const nlohmann::json& j, OfflineBook& book);
void to_json(nlohmann::json& j, const ResourceInfo& info);
void from_json(const nlohmann::json& j, ResourceInfo& info);
void to_json(nlohmann::json& j, const BookManifest& manifest);
void from_json(const nlohmann::json& j, BookManifest& manifest);

} // namespace folio::offline
