// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace folio::cache {

// Errors surfaced by the tiered cache and its remote providers
enum class CacheErrc {
    success = 0,
    provider_error,
    not_found,
    network_error,
    server_error,
    timeout,
    permission_denied,
    blob_unavailable,
    l2_unavailable,
    invalid_key,
};

namespace detail {

struct CacheErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "folio::cache";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<CacheErrc>(ev)) {
            case CacheErrc::success:            return "Success";
            case CacheErrc::provider_error:     return "Remote provider error";
            case CacheErrc::not_found:          return "Resource not found (404)";
            case CacheErrc::network_error:      return "Network error";
            case CacheErrc::server_error:       return "Server error (5xx)";
            case CacheErrc::timeout:            return "Operation timed out";
            case CacheErrc::permission_denied:  return "Permission denied";
            case CacheErrc::blob_unavailable:   return "Failed to materialize blob handle";
            case CacheErrc::l2_unavailable:     return "Persistent tier unavailable";
            case CacheErrc::invalid_key:        return "Invalid book id";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::CacheErrcCategory& cache_errc_category() noexcept {
    static detail::CacheErrcCategory category;
    return category;
}

inline std::error_code make_error_code(CacheErrc e) noexcept {
    return {static_cast<int>(e), cache_errc_category()};
}

} // namespace folio::cache

namespace std {

template<>
struct is_error_code_enum<folio::cache::CacheErrc> : true_type {};

} // namespace std
