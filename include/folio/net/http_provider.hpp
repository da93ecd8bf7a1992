// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/cache/remote_provider.hpp>
#include <folio/core/config.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace folio::net {

struct HttpProviderConfig {
    std::string base_url;                                   // e.g. "http://localhost:3000"
    std::chrono::seconds connect_timeout{core::CONNECTION_TIMEOUT_SEC};
    std::chrono::seconds transfer_timeout{core::TRANSFER_TIMEOUT_SEC};
    std::optional<std::string> bearer_token;
};

// Content-Type values seen in responses, each handed out once.
// The cache asks for a resource's type right after fetching it.
class PendingMimeTypes {
public:
    void put(std::string key, std::string mime_type);

    // Removes the entry it returns
    [[nodiscard]] std::optional<std::string> take(const std::string& key);

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> types_;
};

// RemoteProvider over the book server's REST API:
//   GET {base_url}/api/v1/books/{book_id}/resources/{href}
// One curl easy handle per request, so concurrent calls are safe.
class HttpProvider final : public cache::RemoteProvider {
public:
    explicit HttpProvider(HttpProviderConfig config);

    [[nodiscard]] std::expected<core::Bytes, std::error_code>
    get_resource(const std::string& book_id, const std::string& href) override;

    // Content-Type of the preceding successful fetch of this resource.
    // Answers once per fetch.
    [[nodiscard]] std::optional<std::string>
    mime_type(const std::string& book_id, const std::string& href) override;

    [[nodiscard]] std::string resource_url(const std::string& book_id,
                                           const std::string& href) const;

    [[nodiscard]] const HttpProviderConfig& config() const noexcept { return config_; }

    // Process-wide libcurl setup; call once before any request
    static bool global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    HttpProviderConfig config_;
    PendingMimeTypes mime_types_;
};

} // namespace folio::net
