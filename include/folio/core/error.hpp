// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace folio::core {

// Errors raised by offline book downloads
enum class OfflineErrc {
    success = 0,
    already_downloading,
    insufficient_storage,
    cancelled,
    download_failed,
    not_paused,
    book_not_found,
    invalid_manifest,
};

namespace detail {

struct OfflineErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "folio::offline";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<OfflineErrc>(ev)) {
            case OfflineErrc::success:              return "Success";
            case OfflineErrc::already_downloading:  return "Book is already being downloaded";
            case OfflineErrc::insufficient_storage: return "Insufficient storage space. Please free up space or remove some offline books.";
            case OfflineErrc::cancelled:            return "Download cancelled";
            case OfflineErrc::download_failed:      return "Download failed";
            case OfflineErrc::not_paused:           return "Book is not paused";
            case OfflineErrc::book_not_found:       return "Book not found";
            case OfflineErrc::invalid_manifest:     return "Invalid book manifest";
            default:                                return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::OfflineErrcCategory& offline_errc_category() noexcept {
    static detail::OfflineErrcCategory category;
    return category;
}

inline std::error_code make_error_code(OfflineErrc e) noexcept {
    return {static_cast<int>(e), offline_errc_category()};
}

} // namespace folio::core

namespace std {

template<>
struct is_error_code_enum<folio::core::OfflineErrc> : true_type {};

} // namespace std
