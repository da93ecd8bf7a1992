// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace folio::core {

using Bytes = std::vector<std::byte>;

// Cached payloads are immutable once stored; tiers share them by pointer
using SharedBytes = std::shared_ptr<const Bytes>;

// Free-form per-entry metadata (null when absent)
using Metadata = nlohmann::json;

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

[[nodiscard]] inline SharedBytes share(Bytes bytes) {
    return std::make_shared<const Bytes>(std::move(bytes));
}

[[nodiscard]] inline Bytes to_bytes(std::string_view text) {
    Bytes out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

[[nodiscard]] inline std::int64_t to_unix_ms(Timestamp t) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

[[nodiscard]] inline Timestamp from_unix_ms(std::int64_t ms) noexcept {
    return Timestamp{std::chrono::milliseconds{ms}};
}

} // namespace folio::core
