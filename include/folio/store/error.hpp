// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace folio::store {

enum class StoreErrc {
    success = 0,
    not_initialized,
    not_found,
    io_error,
    corrupt_entry,
    closed,
    quota_exceeded,
};

namespace detail {

struct StoreErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "folio::store";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<StoreErrc>(ev)) {
            case StoreErrc::success:          return "Success";
            case StoreErrc::not_initialized:  return "Store not initialized";
            case StoreErrc::not_found:        return "Entry not found";
            case StoreErrc::io_error:         return "Storage I/O error";
            case StoreErrc::corrupt_entry:    return "Corrupt entry";
            case StoreErrc::closed:           return "Store closed";
            case StoreErrc::quota_exceeded:   return "Entry exceeds store capacity";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::StoreErrcCategory& store_errc_category() noexcept {
    static detail::StoreErrcCategory category;
    return category;
}

inline std::error_code make_error_code(StoreErrc e) noexcept {
    return {static_cast<int>(e), store_errc_category()};
}

} // namespace folio::store

namespace std {

template<>
struct is_error_code_enum<folio::store::StoreErrc> : true_type {};

} // namespace std
