// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/blob.hpp>
#include <format>

namespace folio::core {

//=============================================================================
// BlobHandle
//=============================================================================

BlobHandle::BlobHandle(std::shared_ptr<BlobRegistry> registry, std::string url) noexcept
    : registry_(std::move(registry))
    , url_(std::move(url)) {}

BlobHandle::~BlobHandle() {
    release();
}

BlobHandle::BlobHandle(BlobHandle&& other) noexcept
    : registry_(std::move(other.registry_))
    , url_(std::move(other.url_)) {
    other.registry_.reset();
    other.url_.clear();
}

BlobHandle& BlobHandle::operator=(BlobHandle&& other) noexcept {
    if (this != &other) {
        release();
        registry_ = std::move(other.registry_);
        url_ = std::move(other.url_);
        other.registry_.reset();
        other.url_.clear();
    }
    return *this;
}

void BlobHandle::release() noexcept {
    if (registry_) {
        registry_->revoke(url_);
        registry_.reset();
        url_.clear();
    }
}

//=============================================================================
// BlobRegistry
//=============================================================================

std::shared_ptr<BlobRegistry> BlobRegistry::create() {
    return std::shared_ptr<BlobRegistry>(new BlobRegistry());
}

BlobHandle BlobRegistry::acquire(SharedBytes data, std::string mime_type) {
    auto url = std::format("blob:folio/{}", next_id_.fetch_add(1, std::memory_order_relaxed));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        blobs_.emplace(url, Blob{std::move(data), std::move(mime_type)});
    }
    return BlobHandle(shared_from_this(), std::move(url));
}

std::optional<Blob> BlobRegistry::resolve(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(url);
    if (it == blobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t BlobRegistry::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

void BlobRegistry::revoke(const std::string& url) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.erase(url);
}

} // namespace folio::core
