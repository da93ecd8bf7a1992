// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/cache_key.hpp>

namespace folio::core {

std::string make_key(std::string_view book_id, std::string_view href) {
    std::string key;
    key.reserve(book_id.size() + href.size() + 1);
    key.append(book_id);
    key.push_back(KEY_SEPARATOR);
    key.append(href);
    return key;
}

std::string book_prefix(std::string_view book_id) {
    std::string prefix(book_id);
    prefix.push_back(KEY_SEPARATOR);
    return prefix;
}

std::optional<ParsedKey> parse_key(std::string_view key) {
    auto pos = key.find(KEY_SEPARATOR);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return ParsedKey{std::string(key.substr(0, pos)), std::string(key.substr(pos + 1))};
}

bool is_valid_book_id(std::string_view book_id) noexcept {
    return !book_id.empty() && book_id.find(KEY_SEPARATOR) == std::string_view::npos;
}

} // namespace folio::core
