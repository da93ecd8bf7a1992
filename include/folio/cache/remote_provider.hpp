// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/types.hpp>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace folio::cache {

// L3: source of resource bytes on a cache miss (network, server, renderer).
// Implementations must be safe to call concurrently for different
// (book_id, href) pairs and enforce their own timeouts.
class RemoteProvider {
public:
    virtual ~RemoteProvider() = default;

    [[nodiscard]] virtual std::expected<core::Bytes, std::error_code>
    get_resource(const std::string& book_id, const std::string& href) = 0;

    // Type reported by the source, if it knows one
    [[nodiscard]] virtual std::optional<std::string>
    mime_type(const std::string& /*book_id*/, const std::string& /*href*/) {
        return std::nullopt;
    }
};

} // namespace folio::cache
