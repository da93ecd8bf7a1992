// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/offline/storage_quota.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace folio::offline {

FilesystemQuota::FilesystemQuota(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<QuotaEstimate> FilesystemQuota::estimate() const {
    // Nearest existing ancestor; the cache root may not exist yet
    auto probe = root_;
    std::error_code ec;
    while (!probe.empty() && !std::filesystem::exists(probe, ec)) {
        auto parent = probe.parent_path();
        if (parent == probe) {
            break;
        }
        probe = std::move(parent);
    }
    if (probe.empty()) {
        probe = std::filesystem::current_path(ec);
        if (ec) {
            return std::nullopt;
        }
    }

    auto info = std::filesystem::space(probe, ec);
    if (ec || info.capacity == 0 || info.capacity == static_cast<std::uintmax_t>(-1)) {
        spdlog::debug("[FilesystemQuota] no estimate for {}: {}", probe.string(),
                      ec ? ec.message() : "unknown capacity");
        return std::nullopt;
    }

    const auto available = std::min(info.available, info.capacity);
    return QuotaEstimate{
        .usage = info.capacity - available,
        .quota = info.capacity,
    };
}

} // namespace folio::offline
