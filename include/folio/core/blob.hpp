// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/types.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace folio::core {

class BlobRegistry;

// A blob registered under a transient URL
struct Blob {
    SharedBytes data;
    std::string mime_type;
};

// Owns one registered blob URL. The URL is revoked when the handle is
// released or destroyed.
class BlobHandle {
public:
    BlobHandle() = default;
    ~BlobHandle();

    // Non-copyable, movable
    BlobHandle(const BlobHandle&) = delete;
    BlobHandle& operator=(const BlobHandle&) = delete;
    BlobHandle(BlobHandle&& other) noexcept;
    BlobHandle& operator=(BlobHandle&& other) noexcept;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] bool valid() const noexcept { return registry_ != nullptr; }

    // Revoke the URL now
    void release() noexcept;

private:
    friend class BlobRegistry;
    BlobHandle(std::shared_ptr<BlobRegistry> registry, std::string url) noexcept;

    std::shared_ptr<BlobRegistry> registry_;
    std::string url_;
};

// Process-local table of live blob URLs. Consumers resolve a URL handed out
// by the cache for as long as the owning entry lives.
class BlobRegistry : public std::enable_shared_from_this<BlobRegistry> {
public:
    [[nodiscard]] static std::shared_ptr<BlobRegistry> create();

    [[nodiscard]] BlobHandle acquire(SharedBytes data, std::string mime_type);

    [[nodiscard]] std::optional<Blob> resolve(const std::string& url) const;

    // Number of URLs not yet revoked
    [[nodiscard]] std::size_t live_count() const;

private:
    friend class BlobHandle;
    BlobRegistry() = default;

    void revoke(const std::string& url) noexcept;

    mutable std::mutex mutex_;
    std::map<std::string, Blob> blobs_;
    std::atomic<std::uint64_t> next_id_{1};
};

} // namespace folio::core
