// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace folio::cli {

// Single-line terminal progress bar
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total, std::string_view label = {});

    // Redraws when the integer percentage changes
    void update(std::uint64_t current, double speed_bps = 0.0, double eta_seconds = 0.0);

    void finish();

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    // Render counts ("3/10") instead of byte sizes
    void count_mode(bool enable) noexcept { count_mode_ = enable; }

    [[nodiscard]] static std::string format_speed(double bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    [[nodiscard]] static std::string render_bar(double percent);

    std::uint64_t total_{0};
    std::uint64_t current_{0};
    int last_percent_{-1};
    std::string label_;
    bool count_mode_{false};
    bool finished_{false};
};

} // namespace folio::cli
