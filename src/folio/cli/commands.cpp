// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/commands.hpp>
#include <folio/cli/progress_bar.hpp>
#include <folio/cache/tiered_cache.hpp>
#include <folio/core/cache_key.hpp>
#include <folio/core/error.hpp>
#include <folio/net/http_provider.hpp>
#include <folio/offline/offline_manager.hpp>
#include <folio/store/file_store.hpp>
#include <folio/version.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <iostream>
#include <memory>

namespace folio::cli {

namespace {

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<Command> parse_command(std::string_view name) {
    if (name == "download") return Command::download;
    if (name == "list")     return Command::list;
    if (name == "remove")   return Command::remove;
    if (name == "cleanup")  return Command::cleanup;
    if (name == "stats")    return Command::stats;
    return std::nullopt;
}

// Every collaborator a command needs, wired over one cache directory
struct Session {
    std::shared_ptr<net::HttpProvider> provider;
    std::shared_ptr<store::FileStore> resources;
    std::shared_ptr<store::FileStore> meta;
    std::unique_ptr<cache::TieredCache> cache;
    std::unique_ptr<offline::OfflineManager> manager;

    explicit Session(const CliArgs& args) {
        const std::filesystem::path root(args.cache_dir);

        net::HttpProviderConfig http;
        http.base_url = args.server;
        http.bearer_token = args.token;
        provider = std::make_shared<net::HttpProvider>(std::move(http));

        resources = std::make_shared<store::FileStore>(store::FileStoreConfig{.root = root / "resources"});
        meta = std::make_shared<store::FileStore>(store::FileStoreConfig{.root = root / "meta"});

        cache = std::make_unique<cache::TieredCache>(provider, resources);

        offline::OfflineManagerConfig config;
        if (args.concurrency > 0) {
            config.concurrency = args.concurrency;
        }
        if (args.retries) {
            config.retry_count = *args.retries;
        }
        manager = std::make_unique<offline::OfflineManager>(
            *cache, meta, config, std::make_shared<offline::FilesystemQuota>(root));
    }

    std::error_code open() {
        if (auto opened = cache->init(); !opened) {
            return opened.error();
        }
        if (auto loaded = manager->init(); !loaded) {
            return loaded.error();
        }
        return {};
    }
};

std::string describe(const offline::OfflineBook& book) {
    std::string line = book.book_id;
    line += "  ";
    line += offline::to_string(book.status);
    line += "  ";
    line += std::to_string(book.downloaded_count) + "/" + std::to_string(book.resource_count);
    line += "  ";
    line += ProgressBar::format_bytes(book.status == offline::DownloadStatus::completed
                                          ? book.total_size
                                          : book.downloaded_size);
    line += "  ";
    line += book.title;
    if (book.error) {
        line += "  (" + *book.error + ")";
    }
    return line;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(Session& session, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: download needs a manifest file" << std::endl;
        return 2;
    }

    auto manifest = load_manifest(args.operands.front());
    if (!manifest) {
        std::cerr << "Error: cannot load " << args.operands.front() << ": "
                  << manifest.error().message() << std::endl;
        return std::unexpected(manifest.error());
    }

    auto& manager = *session.manager;

    ProgressBar bar(0, manifest->title.empty() ? manifest->book_id : manifest->title);
    if (!args.quiet) {
        manager.events().on<offline::DownloadProgress>([&bar](const offline::DownloadProgress& p) {
            if (p.total_bytes > 0) {
                bar.total(p.total_bytes);
                bar.update(p.bytes_downloaded, p.speed, p.eta);
            } else {
                bar.count_mode(true);
                bar.total(p.total_resources);
                bar.update(p.current_index);
            }
        });
    }

    offline::DownloadResult result;
    auto existing = manager.offline_book(manifest->book_id);
    if (existing && offline::is_resumable(existing->status)) {
        if (args.verbose) {
            std::cout << "Resuming " << manifest->book_id << std::endl;
        }
        result = manager.resume_download(*manifest);
    } else {
        result = manager.download_book(*manifest);
    }

    if (!result) {
        bar.clear();
        std::cerr << "Error: " << manifest->book_id << ": " << result.error().message() << std::endl;
        return std::unexpected(result.error());
    }

    if (!args.quiet) {
        bar.finish();
        std::cout << "Downloaded " << result->book_id << " ("
                  << result->downloaded_count << " resources, "
                  << ProgressBar::format_bytes(result->downloaded_size) << ")" << std::endl;
    }
    return 0;
}

CliResult list(Session& session) {
    auto books = session.manager->offline_books();
    if (books.empty()) {
        std::cout << "No offline books" << std::endl;
        return 0;
    }
    for (const auto& book : books) {
        std::cout << describe(book) << std::endl;
    }
    return 0;
}

CliResult remove(Session& session, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: remove needs a book id" << std::endl;
        return 2;
    }

    int exit_code = 0;
    for (const auto& book_id : args.operands) {
        if (session.manager->remove_offline_book(book_id)) {
            std::cout << "Removed " << book_id << std::endl;
        } else {
            std::cerr << "Error: " << book_id << ": "
                      << make_error_code(core::OfflineErrc::book_not_found).message() << std::endl;
            exit_code = 1;
        }
    }
    return exit_code;
}

CliResult cleanup(Session& session, const CliArgs& args) {
    if (args.operands.empty()) {
        std::cerr << "Error: cleanup needs a byte count" << std::endl;
        return 2;
    }
    auto target = parse_number<std::uint64_t>(args.operands.front());
    if (!target) {
        std::cerr << "Error: invalid byte count: " << args.operands.front() << std::endl;
        return 2;
    }

    auto removed = session.manager->cleanup_old_books(*target);
    for (const auto& book_id : removed) {
        std::cout << "Removed " << book_id << std::endl;
    }
    if (!args.quiet) {
        std::cout << removed.size() << " book(s) removed" << std::endl;
    }
    return 0;
}

CliResult stats(Session& session) {
    auto s = session.cache->stats();
    std::cout << "L1: " << s.l1.entries << " entries, "
              << ProgressBar::format_bytes(s.l1.size_bytes) << " of "
              << ProgressBar::format_bytes(s.l1.max_size_bytes) << std::endl;

    if (s.l2) {
        std::cout << "L2: " << s.l2->entries << " entries, "
                  << ProgressBar::format_bytes(s.l2->size_bytes) << " of "
                  << ProgressBar::format_bytes(s.l2->max_size_bytes) << ", "
                  << s.l2->book_count << " book(s)" << std::endl;
        for (const auto& [book_id, size] : s.l2->size_by_book) {
            std::cout << "  " << book_id << ": " << ProgressBar::format_bytes(size) << std::endl;
        }
    } else {
        std::cout << "L2: unavailable" << std::endl;
    }

    std::cout << "Offline books: "
              << ProgressBar::format_bytes(session.manager->total_storage_used()) << std::endl;

    auto info = session.manager->storage_info();
    if (info.quota > 0) {
        std::cout << "Disk: " << ProgressBar::format_bytes(info.used) << " of "
                  << ProgressBar::format_bytes(info.quota) << " used ("
                  << static_cast<int>(info.percentage) << "%)" << std::endl;
    }
    return 0;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            if (args.error.empty()) {
                args.error = std::string(option) + " needs a value";
            }
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-s" || arg == "--server") {
            if (auto v = value_of(i, arg)) args.server = std::move(*v);
            continue;
        }
        if (arg == "-d" || arg == "--cache-dir") {
            if (auto v = value_of(i, arg)) args.cache_dir = std::move(*v);
            continue;
        }
        if (arg == "-t" || arg == "--token") {
            if (auto v = value_of(i, arg)) args.token = std::move(*v);
            continue;
        }
        if (arg == "-c" || arg == "--concurrency") {
            if (auto v = value_of(i, arg)) {
                auto n = parse_number<std::uint32_t>(*v);
                if (n && *n > 0) {
                    args.concurrency = *n;
                } else if (args.error.empty()) {
                    args.error = "invalid concurrency: " + *v;
                }
            }
            continue;
        }
        if (arg == "-r" || arg == "--retries") {
            if (auto v = value_of(i, arg)) {
                if (auto n = parse_number<std::uint32_t>(*v)) {
                    args.retries = *n;
                } else if (args.error.empty()) {
                    args.error = "invalid retry count: " + *v;
                }
            }
            continue;
        }
        if (arg.starts_with("-") && arg.size() > 1) {
            if (args.error.empty()) {
                args.error = "unknown option: " + arg;
            }
            continue;
        }

        // First positional names the command
        if (args.command == Command::none) {
            if (auto command = parse_command(arg)) {
                args.command = *command;
            } else if (args.error.empty()) {
                args.error = "unknown command: " + arg;
            }
            continue;
        }
        args.operands.push_back(std::move(arg));
    }

    return args;
}

std::expected<offline::BookManifest, std::error_code>
load_manifest(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
    }

    try {
        auto manifest = nlohmann::json::parse(file).get<offline::BookManifest>();
        if (!core::is_valid_book_id(manifest.book_id)) {
            return std::unexpected(make_error_code(core::OfflineErrc::invalid_manifest));
        }
        return manifest;
    } catch (const nlohmann::json::exception& e) {
        spdlog::debug("[cli] manifest {} rejected: {}", path.string(), e.what());
        return std::unexpected(make_error_code(core::OfflineErrc::invalid_manifest));
    }
}

//=============================================================================
// Dispatch
//=============================================================================

CliResult run(const CliArgs& args) {
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }

    if (!net::HttpProvider::global_init()) {
        std::cerr << "Error: libcurl initialisation failed" << std::endl;
        return 1;
    }

    CliResult result = 0;
    {
        Session session(args);
        if (auto ec = session.open()) {
            std::cerr << "Error: cannot open cache at " << args.cache_dir << ": " << ec.message() << std::endl;
            result = std::unexpected(ec);
        } else {
            switch (args.command) {
                case Command::download: result = download(session, args); break;
                case Command::list:     result = list(session); break;
                case Command::remove:   result = remove(session, args); break;
                case Command::cleanup:  result = cleanup(session, args); break;
                case Command::stats:    result = stats(session); break;
                case Command::none:
                    std::cerr << "Error: No command specified" << std::endl;
                    result = 2;
                    break;
            }
        }
    }

    net::HttpProvider::global_cleanup();
    return result;
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "Folio " << version.to_string() << " - offline book cache\n\n"
              << "Usage: " << program_name << " [options] <command> [args]\n\n"
              << "Commands:\n"
              << "  download <manifest.json>  Download (or resume) a book for offline use\n"
              << "  list                      List offline books\n"
              << "  remove <book-id>...       Remove books and their cached resources\n"
              << "  cleanup <bytes>           Free space by removing least recently read books\n"
              << "  stats                     Show cache and storage statistics\n\n"
              << "Options:\n"
              << "  -s, --server <url>        Book server (default http://localhost:3000)\n"
              << "  -d, --cache-dir <dir>     Cache directory (default .folio-cache)\n"
              << "  -t, --token <token>       Bearer token for the server\n"
              << "  -c, --concurrency <n>     Parallel resource downloads (default 3)\n"
              << "  -r, --retries <n>         Retries per resource (default 3)\n"
              << "  -V, --verbose             Debug logging\n"
              << "  -q, --quiet               Errors only, no progress bar\n"
              << "  -v, --version             Show version\n"
              << "  -h, --help                Show this help\n";
}

void print_version() noexcept {
    std::cout << "Folio " << version.to_string() << " (built " << BUILD_DATE << ")" << std::endl;
}

} // namespace folio::cli
