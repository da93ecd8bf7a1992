// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace folio::offline {

struct QuotaEstimate {
    std::uint64_t usage{0};
    std::uint64_t quota{0};
};

// Platform storage estimate; nullopt when the platform cannot tell
class StorageQuota {
public:
    virtual ~StorageQuota() = default;
    [[nodiscard]] virtual std::optional<QuotaEstimate> estimate() const = 0;
};

// Estimate from the filesystem holding a directory:
// quota = capacity, usage = capacity - available
class FilesystemQuota final : public StorageQuota {
public:
    explicit FilesystemQuota(std::filesystem::path root);

    [[nodiscard]] std::optional<QuotaEstimate> estimate() const override;

private:
    std::filesystem::path root_;
};

struct StorageInfo {
    std::uint64_t used{0};
    std::uint64_t quota{0};
    std::uint64_t available{0};
    double percentage{0.0};
};

} // namespace folio::offline
