// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace folio::core {

constexpr char KEY_SEPARATOR = ':';

// Keys are "{book_id}:{href}". Book ids never contain the separator, so the
// first ':' always splits a key unambiguously.
[[nodiscard]] std::string make_key(std::string_view book_id, std::string_view href);

// "{book_id}:" - every key of the book starts with it
[[nodiscard]] std::string book_prefix(std::string_view book_id);

struct ParsedKey {
    std::string book_id;
    std::string href;
};

[[nodiscard]] std::optional<ParsedKey> parse_key(std::string_view key);

// A book id is usable as a key component
[[nodiscard]] bool is_valid_book_id(std::string_view book_id) noexcept;

} // namespace folio::core
