// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/net/http_provider.hpp>
#include <folio/cache/error.hpp>
#include <folio/core/cache_key.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstring>
#include <string_view>

namespace folio::net {

using cache::CacheErrc;

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

// RAII header list
struct CurlHeaders {
    curl_slist* list = nullptr;

    ~CurlHeaders() { if (list) curl_slist_free_all(list); }

    void append(const std::string& header) {
        if (auto* next = curl_slist_append(list, header.c_str())) {
            list = next;
        }
    }
};

// Captures the Content-Type response header
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* content_type = static_cast<std::string*>(userdata);
    if (!content_type) return total;

    std::string_view header(buffer, total);
    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    constexpr std::string_view wanted = "content-type";
    if (name.size() != wanted.size()) return total;
    for (std::size_t i = 0; i < name.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(name[i])) != wanted[i]) return total;
    }

    auto value = header.substr(colon + 1);
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n')) {
        value.remove_suffix(1);
    }

    // Drop parameters such as "; charset=utf-8"
    if (auto semi = value.find(';'); semi != std::string_view::npos) {
        value = value.substr(0, semi);
        while (!value.empty() && value.back() == ' ') {
            value.remove_suffix(1);
        }
    }

    *content_type = std::string(value);
    return total;
}

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* body = static_cast<core::Bytes*>(userdata);
    if (!body) return 0;

    std::size_t total = size * nitems;
    const std::size_t offset = body->size();
    body->resize(offset + total);
    std::memcpy(body->data() + offset, ptr, total);
    return total;
}

std::error_code map_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return make_error_code(CacheErrc::timeout);
        default:
            return make_error_code(CacheErrc::network_error);
    }
}

std::error_code map_http_status(long status) {
    if (status == 404) {
        return make_error_code(CacheErrc::not_found);
    }
    if (status == 401 || status == 403) {
        return make_error_code(CacheErrc::permission_denied);
    }
    if (status >= 500) {
        return make_error_code(CacheErrc::server_error);
    }
    if (status >= 400) {
        return make_error_code(CacheErrc::provider_error);
    }
    return {};
}

std::string escape(CURL* curl, const std::string& text) {
    char* escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
    if (!escaped) {
        return {};
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace

//=============================================================================
// HttpProvider
//=============================================================================

HttpProvider::HttpProvider(HttpProviderConfig config)
    : config_(std::move(config)) {
    // Trailing slashes would double up with the route prefix
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
}

bool HttpProvider::global_init() noexcept {
    return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
}

void HttpProvider::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::string HttpProvider::resource_url(const std::string& book_id, const std::string& href) const {
    CurlHandle curl(curl_easy_init());
    std::string url = config_.base_url;
    url += core::RESOURCE_API_PREFIX;
    url += escape(curl.ptr, book_id);
    url += "/resources/";
    url += escape(curl.ptr, href);
    return url;
}

std::expected<core::Bytes, std::error_code>
HttpProvider::get_resource(const std::string& book_id, const std::string& href) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(CacheErrc::network_error));
    }

    const auto url = resource_url(book_id, href);
    core::Bytes body;
    std::string content_type;
    CurlHeaders headers;
    if (config_.bearer_token) {
        headers.append("Authorization: Bearer " + *config_.bearer_token);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.ptr, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    curl_easy_setopt(curl.ptr, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_TIMEOUT, static_cast<long>(config_.transfer_timeout.count()));
    curl_easy_setopt(curl.ptr, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_SSL_VERIFYHOST, 2L);
    if (headers.list) {
        curl_easy_setopt(curl.ptr, CURLOPT_HTTPHEADER, headers.list);
    }

    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &content_type);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &body);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::debug("[HttpProvider] GET {} failed: {}", url, curl_easy_strerror(result));
        return std::unexpected(map_curl_error(result));
    }

    long status = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &status);
    if (auto ec = map_http_status(status)) {
        spdlog::debug("[HttpProvider] GET {} returned HTTP {}", url, status);
        return std::unexpected(ec);
    }

    if (!content_type.empty()) {
        mime_types_.put(core::make_key(book_id, href), std::move(content_type));
    }

    return body;
}

std::optional<std::string> HttpProvider::mime_type(const std::string& book_id, const std::string& href) {
    return mime_types_.take(core::make_key(book_id, href));
}

//=============================================================================
// PendingMimeTypes
//=============================================================================

void PendingMimeTypes::put(std::string key, std::string mime_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    types_.insert_or_assign(std::move(key), std::move(mime_type));
}

std::optional<std::string> PendingMimeTypes::take(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto node = types_.extract(key);
    if (node.empty()) {
        return std::nullopt;
    }
    return std::move(node.mapped());
}

std::size_t PendingMimeTypes::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return types_.size();
}

} // namespace folio::net
