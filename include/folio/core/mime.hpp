// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>

namespace folio::core {

// Guess a MIME type from the href's extension. Unknown extensions map to
// application/octet-stream.
[[nodiscard]] std::string_view guess_mime_type(std::string_view href) noexcept;

} // namespace folio::core
