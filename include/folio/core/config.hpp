// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <string_view>

namespace folio::core {

// L1 (memory)
constexpr std::uint64_t L1_MAX_SIZE_BYTES = 50 * 1024 * 1024;      // 50 MB
constexpr std::size_t L1_MAX_ENTRIES = 500;

// L2 (persistent)
constexpr std::uint64_t L2_MAX_SIZE_BYTES = 500 * 1024 * 1024;     // 500 MB
constexpr std::size_t L2_MAX_ENTRIES = 5000;

// Offline downloads
constexpr std::uint32_t DOWNLOAD_CONCURRENCY = 3;
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::chrono::milliseconds RETRY_DELAY{1000};
constexpr double QUOTA_WARNING_THRESHOLD = 0.9;

// Remote provider (HTTP)
constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t TRANSFER_TIMEOUT_SEC = 60;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr std::string_view RESOURCE_API_PREFIX = "/api/v1/books/";

// Book id under which offline records are persisted
constexpr std::string_view OFFLINE_META_BOOK_ID = "_offline_meta";

constexpr std::string_view DEFAULT_MIME_TYPE = "application/octet-stream";

} // namespace folio::core
