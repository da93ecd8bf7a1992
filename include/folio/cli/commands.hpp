// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/offline/offline_book.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace folio::cli {

// CLI result (process exit code)
using CliResult = std::expected<int, std::error_code>;

enum class Command : std::uint8_t {
    none,
    download,   // download <manifest.json>
    list,       // list
    remove,     // remove <book-id>
    cleanup,    // cleanup <bytes>
    stats       // stats
};

// Command line arguments
struct CliArgs {
    Command command{Command::none};
    std::vector<std::string> operands;
    std::string server{"http://localhost:3000"};
    std::string cache_dir{".folio-cache"};
    std::optional<std::string> token;
    std::uint32_t concurrency{0};           // 0 = default
    std::optional<std::uint32_t> retries;
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                      // First parse problem, if any
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Read a BookManifest from a JSON file
[[nodiscard]] std::expected<offline::BookManifest, std::error_code>
load_manifest(const std::filesystem::path& path);

// Run the selected command
[[nodiscard]] CliResult run(const CliArgs& args);

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace folio::cli
