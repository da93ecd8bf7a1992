// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace folio::cli {

namespace {

constexpr int BAR_WIDTH = 30;

std::string fixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label)
    : total_(total)
    , label_(label) {}

void ProgressBar::update(std::uint64_t current, double speed_bps, double eta_seconds) {
    if (total_ == 0) return;

    current_ = std::min(current, total_);
    double percent = static_cast<double>(current_) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent steps
    const int whole = static_cast<int>(percent);
    if (whole == last_percent_ && !finished_) return;
    last_percent_ = whole;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);
    line += " ";
    if (whole < 100) line += " ";
    if (whole < 10) line += " ";
    line += std::to_string(whole) + "%";

    line += " (";
    if (count_mode_) {
        line += std::to_string(current_) + "/" + std::to_string(total_);
    } else {
        line += format_bytes(current_) + "/" + format_bytes(total_);
    }
    line += ")";

    if (speed_bps > 0.0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }
    if (eta_seconds > 0.0 && current_ < total_) {
        line += " ETA: ";
        line += format_time(static_cast<std::uint64_t>(std::ceil(eta_seconds)));
    }

    // Clear rest of line
    line += std::string(10, ' ');
    std::cout << line << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    finished_ = true;
    update(total_);
    std::cout << std::endl;
}

void ProgressBar::clear() noexcept {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent) {
    const int filled = static_cast<int>(std::round(BAR_WIDTH * percent / 100.0));
    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < BAR_WIDTH) {
        bar += '>';
        bar.append(static_cast<std::size_t>(BAR_WIDTH - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(double bps) {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    constexpr double GB = 1024.0 * MB;

    if (bps >= GB) {
        return fixed(bps / GB, 1) + " GB/s";
    } else if (bps >= MB) {
        return fixed(bps / MB, 1) + " MB/s";
    } else if (bps >= KB) {
        return fixed(bps / KB, 1) + " KB/s";
    }
    return fixed(bps, 0) + " B/s";
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    const auto value = static_cast<double>(bytes);
    if (bytes >= TB) {
        return fixed(value / TB, 2) + " TB";
    } else if (bytes >= GB) {
        return fixed(value / GB, 2) + " GB";
    } else if (bytes >= MB) {
        return fixed(value / MB, 1) + " MB";
    } else if (bytes >= KB) {
        return fixed(value / KB, 0) + " KB";
    }
    return std::to_string(bytes) + " B";
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        std::ostringstream ss;
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes << "m";
        return ss.str();
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace folio::cli
