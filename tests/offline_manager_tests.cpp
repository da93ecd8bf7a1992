// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/offline/offline_manager.hpp>
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <thread>

using namespace folio::offline;
using namespace folio::core;
using folio::cache::CacheErrc;
using folio::cache::TieredCache;
using folio::test::FixedQuota;
using folio::test::InMemoryStore;
using folio::test::ScriptedProvider;
using folio::test::bytes_of_size;

namespace {

struct Resource {
    std::string href;
    std::size_t size;
    bool declare_size{true};
};

BookManifest make_manifest(const std::string& book_id, const std::vector<Resource>& resources) {
    BookManifest manifest;
    manifest.book_id = book_id;
    manifest.title = "Title of " + book_id;
    for (const auto& r : resources) {
        ResourceInfo info;
        info.href = r.href;
        info.mime_type = "application/octet-stream";
        if (r.declare_size) {
            info.size_bytes = r.size;
        }
        manifest.resources.push_back(std::move(info));
    }
    return manifest;
}

// Provider, tiers and metadata store wired the way the CLI wires them
struct Harness {
    std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();
    std::shared_ptr<InMemoryStore> l2 = std::make_shared<InMemoryStore>();
    std::shared_ptr<InMemoryStore> meta = std::make_shared<InMemoryStore>();
    TieredCache cache{provider, l2};

    void serve(const BookManifest& manifest) {
        for (const auto& r : manifest.resources) {
            provider->add(manifest.book_id, r.href, bytes_of_size(r.size_bytes.value_or(10)));
        }
    }

    void serve(const std::string& book_id, const std::vector<Resource>& resources) {
        for (const auto& r : resources) {
            provider->add(book_id, r.href, bytes_of_size(r.size));
        }
    }
};

OfflineManagerConfig fast_config(std::uint32_t concurrency = 3, std::uint32_t retries = 3) {
    OfflineManagerConfig config;
    config.concurrency = concurrency;
    config.retry_count = retries;
    config.retry_delay = std::chrono::milliseconds(1);
    return config;
}

} // namespace

TEST_CASE("Downloading a whole book", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(2));

    const std::vector<Resource> resources{{"a.xhtml", 100}, {"b.png", 200}, {"c.woff", 300}};
    auto manifest = make_manifest("b1", resources);
    h.serve("b1", resources);

    int started = 0;
    int completed = 0;
    std::vector<DownloadProgress> progress;
    manager.events().on<DownloadStarted>([&](const DownloadStarted&) { ++started; });
    manager.events().on<DownloadProgress>([&](const DownloadProgress& p) { progress.push_back(p); });
    manager.events().on<DownloadCompleted>([&](const DownloadCompleted& e) {
        ++completed;
        CHECK(e.book.status == DownloadStatus::completed);
    });

    auto result = manager.download_book(manifest);
    REQUIRE(result.has_value());

    SECTION("Final record matches the manifest") {
        CHECK(result->total_size == 600);
        CHECK(result->downloaded_size == 600);
        CHECK(result->resource_count == 3);
        CHECK(result->downloaded_count == 3);
        CHECK(result->status == DownloadStatus::completed);
        CHECK(result->completed_at.has_value());
        CHECK_FALSE(result->error.has_value());
        CHECK(manager.is_book_offline("b1"));
        CHECK_FALSE(manager.is_downloading("b1"));
    }

    SECTION("Every resource is cached in both tiers") {
        for (const auto& r : resources) {
            CHECK(h.cache.has("b1", r.href));
            CHECK(*h.l2->has("b1", r.href));
        }
    }

    SECTION("Events are emitted in order with monotonic counters") {
        CHECK(started == 1);
        CHECK(completed == 1);
        REQUIRE(progress.size() == 3);
        for (std::size_t i = 0; i < progress.size(); ++i) {
            CHECK(progress[i].current_index == i + 1);
            CHECK(progress[i].total_resources == 3);
            CHECK(progress[i].total_bytes == 600);
            if (i > 0) {
                CHECK(progress[i].bytes_downloaded > progress[i - 1].bytes_downloaded);
            }
        }
        CHECK(progress.back().bytes_downloaded == 600);
        CHECK(progress.back().percentage == Catch::Approx(100.0));
    }

    SECTION("Never more fetches in flight than the concurrency limit") {
        CHECK(h.provider->max_in_flight() <= 2);
    }

    SECTION("Record is persisted as JSON under the reserved book id") {
        auto stored = h.meta->get(std::string(OFFLINE_META_BOOK_ID), "b1");
        REQUIRE(stored.has_value());
        REQUIRE(stored->has_value());
        const auto& data = *(*stored)->data;
        auto j = nlohmann::json::parse(std::string(reinterpret_cast<const char*>(data.data()), data.size()));
        CHECK(j["status"] == "completed");
        CHECK(j["downloadedSize"] == 600);
    }

    SECTION("Downloading again skips every cached resource") {
        auto again = manager.download_book(manifest);
        REQUIRE(again.has_value());
        CHECK(again->downloaded_count == 3);
        CHECK(h.provider->total_calls() == 3);
    }
}

TEST_CASE("Bounded concurrency", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(3));

    std::vector<Resource> resources;
    for (int i = 0; i < 12; ++i) {
        resources.push_back({"r" + std::to_string(i), 10});
    }
    h.serve("b1", resources);
    h.provider->delay(std::chrono::milliseconds(5));

    auto result = manager.download_book(make_manifest("b1", resources));
    REQUIRE(result.has_value());
    CHECK(result->downloaded_count == 12);
    CHECK(h.provider->max_in_flight() >= 1);
    CHECK(h.provider->max_in_flight() <= 3);
}

TEST_CASE("Pausing and resuming", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(1));

    const std::vector<Resource> resources{{"a", 10}, {"b", 20}, {"c", 30}};
    auto manifest = make_manifest("b1", resources);
    h.serve("b1", resources);

    bool paused_once = false;
    int pause_events = 0;
    int resume_events = 0;
    manager.events().on<DownloadProgress>([&](const DownloadProgress& p) {
        if (!paused_once) {
            paused_once = true;
            CHECK(manager.pause_download(p.book_id));
        }
    });
    manager.events().on<DownloadPaused>([&](const DownloadPaused&) { ++pause_events; });
    manager.events().on<DownloadResumed>([&](const DownloadResumed&) { ++resume_events; });

    auto first = manager.download_book(manifest);
    REQUIRE_FALSE(first.has_value());
    CHECK(first.error() == OfflineErrc::cancelled);

    auto book = manager.offline_book("b1");
    REQUIRE(book.has_value());
    CHECK(book->status == DownloadStatus::paused);
    CHECK(book->downloaded_count >= 1);
    CHECK(book->downloaded_count < 3);
    CHECK_FALSE(book->error.has_value());
    CHECK_FALSE(manager.is_downloading("b1"));
    CHECK(manager.active_download_count() == 0);
    CHECK(pause_events == 1);

    SECTION("Resume fetches only what is missing") {
        auto resumed = manager.resume_download(manifest);
        REQUIRE(resumed.has_value());
        CHECK(resumed->status == DownloadStatus::completed);
        CHECK(resumed->downloaded_count == 3);
        CHECK(resumed->downloaded_size == 60);
        CHECK(resume_events == 1);

        for (const auto& r : resources) {
            CHECK(h.provider->calls("b1", r.href) == 1);
        }
    }

    SECTION("Resume is refused once the book completed") {
        REQUIRE(manager.resume_download(manifest).has_value());
        auto again = manager.resume_download(manifest);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error() == OfflineErrc::not_paused);
    }

    SECTION("Pausing an idle book does nothing") {
        CHECK_FALSE(manager.pause_download("b1"));
        CHECK(pause_events == 1);
    }
}

TEST_CASE("Resume needs a known paused book", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config());

    auto result = manager.resume_download(make_manifest("nobody", {{"a", 1}}));
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == OfflineErrc::book_not_found);
}

TEST_CASE("Retries and failure", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(1, 2));

    const std::vector<Resource> resources{{"ok", 10}, {"bad", 10}};
    auto manifest = make_manifest("b1", resources);
    h.provider->add("b1", "ok", bytes_of_size(10));
    h.provider->fail_always("b1", "bad", make_error_code(CacheErrc::server_error));

    std::vector<std::string> errors;
    manager.events().on<DownloadFailed>([&](const DownloadFailed& e) { errors.push_back(e.error); });

    auto result = manager.download_book(manifest);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == CacheErrc::server_error);

    // Initial attempt plus two retries
    CHECK(h.provider->calls("b1", "bad") == 3);

    auto book = manager.offline_book("b1");
    REQUIRE(book.has_value());
    CHECK(book->status == DownloadStatus::failed);
    REQUIRE(book->error.has_value());
    CHECK(*book->error == make_error_code(CacheErrc::server_error).message());
    REQUIRE(errors.size() == 1);
    CHECK(errors.front() == *book->error);

    // Already downloaded resources stay cached
    CHECK(h.cache.has("b1", "ok"));
    CHECK_FALSE(manager.is_downloading("b1"));
}

TEST_CASE("Transient failures recover within the retry budget", "[offline]") {
    // A provider failing the first two calls of every resource
    class FlakyProvider : public folio::cache::RemoteProvider {
    public:
        std::expected<Bytes, std::error_code>
        get_resource(const std::string&, const std::string& href) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (++attempts_[href] <= 2) {
                return std::unexpected(make_error_code(CacheErrc::timeout));
            }
            return bytes_of_size(5);
        }
        int attempts(const std::string& href) {
            std::lock_guard<std::mutex> lock(mutex_);
            return attempts_[href];
        }
    private:
        std::mutex mutex_;
        std::map<std::string, int> attempts_;
    };

    auto provider = std::make_shared<FlakyProvider>();
    TieredCache cache(provider, nullptr);
    OfflineManager manager(cache, nullptr, fast_config(2, 2));

    auto result = manager.download_book(make_manifest("b1", {{"a", 5}, {"b", 5}}));
    REQUIRE(result.has_value());
    CHECK(result->status == DownloadStatus::completed);
    CHECK(provider->attempts("a") == 3);
    CHECK(provider->attempts("b") == 3);
}

TEST_CASE("One download per book", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(2));

    const std::vector<Resource> resources{{"a", 10}, {"b", 10}};
    auto manifest = make_manifest("b1", resources);
    h.serve("b1", resources);
    h.provider->close_gate();

    auto running = manager.download_book_async(manifest);
    REQUIRE(h.provider->wait_for_waiting(1));
    CHECK(manager.is_downloading("b1"));

    auto second = manager.download_book(manifest);
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error() == OfflineErrc::already_downloading);

    SECTION("Other books are not blocked") {
        h.serve("b2", {{"x", 1}});
        h.provider->open_gate();
        auto other = manager.download_book(make_manifest("b2", {{"x", 1}}));
        CHECK(other.has_value());
    }

    h.provider->open_gate();
    auto first = running.get();
    REQUIRE(first.has_value());
    CHECK(first->status == DownloadStatus::completed);
    CHECK_FALSE(manager.is_downloading("b1"));
}

TEST_CASE("Cancelling removes the book", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(2));

    const std::vector<Resource> resources{{"a", 10}, {"b", 10}, {"c", 10}, {"d", 10}};
    auto manifest = make_manifest("b1", resources);
    h.serve("b1", resources);

    int cancel_events = 0;
    manager.events().on<DownloadCancelled>([&](const DownloadCancelled&) { ++cancel_events; });

    h.provider->close_gate();
    auto running = manager.download_book_async(manifest);
    REQUIRE(h.provider->wait_for_waiting(1));

    manager.cancel_download("b1");
    h.provider->open_gate();

    auto result = running.get();
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == OfflineErrc::cancelled);

    CHECK_FALSE(manager.offline_book("b1").has_value());
    CHECK_FALSE(manager.is_downloading("b1"));
    CHECK(cancel_events == 1);
    for (const auto& r : resources) {
        CHECK_FALSE(h.cache.has("b1", r.href));
    }
    CHECK(h.meta->size() == 0);
}

TEST_CASE("Storage quota check", "[offline]") {
    Harness h;
    const std::vector<Resource> resources{{"a", 100}, {"b", 100}};
    auto manifest = make_manifest("b1", resources);
    h.serve("b1", resources);

    SECTION("Insufficient space fails before any network access") {
        auto quota = std::make_shared<FixedQuota>(QuotaEstimate{.usage = 900, .quota = 1000});
        OfflineManager manager(h.cache, h.meta, fast_config(), quota);

        auto result = manager.download_book(manifest);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == OfflineErrc::insufficient_storage);
        CHECK(h.provider->total_calls() == 0);
        CHECK_FALSE(manager.offline_book("b1").has_value());
        CHECK_FALSE(manager.is_downloading("b1"));
        CHECK(h.meta->size() == 0);
    }

    SECTION("Crossing the warning threshold still downloads") {
        auto quota = std::make_shared<FixedQuota>(QuotaEstimate{.usage = 750, .quota = 1000});
        OfflineManager manager(h.cache, h.meta, fast_config(), quota);
        CHECK(manager.download_book(manifest).has_value());
    }

    SECTION("Unknown quota skips the check") {
        auto quota = std::make_shared<FixedQuota>(std::nullopt);
        OfflineManager manager(h.cache, h.meta, fast_config(), quota);
        CHECK(manager.download_book(manifest).has_value());

        auto info = manager.storage_info();
        CHECK(info.quota == 0);
        CHECK(info.percentage == 0.0);
    }

    SECTION("storage_info reflects the estimate") {
        auto quota = std::make_shared<FixedQuota>(QuotaEstimate{.usage = 250, .quota = 1000});
        OfflineManager manager(h.cache, h.meta, fast_config(), quota);
        auto info = manager.storage_info();
        CHECK(info.used == 250);
        CHECK(info.quota == 1000);
        CHECK(info.available == 750);
        CHECK(info.percentage == Catch::Approx(25.0));
    }
}

TEST_CASE("Manifest validation", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config());

    for (const std::string id : {"", "a:b", "_offline_meta"}) {
        auto result = manager.download_book(make_manifest(id, {{"x", 1}}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == OfflineErrc::invalid_manifest);
    }
    CHECK(h.provider->total_calls() == 0);
}

TEST_CASE("Resources without declared sizes", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(1));

    const std::vector<Resource> resources{{"a", 10, false}, {"b", 10, false}};
    h.serve("b1", resources);

    std::vector<double> percentages;
    manager.events().on<DownloadProgress>([&](const DownloadProgress& p) {
        percentages.push_back(p.percentage);
    });

    auto result = manager.download_book(make_manifest("b1", resources));
    REQUIRE(result.has_value());
    CHECK(result->total_size == 0);
    CHECK(result->downloaded_size <= result->total_size);
    CHECK(result->downloaded_count == 2);

    // Falls back to the resource count
    REQUIRE(percentages.size() == 2);
    CHECK(percentages[0] == Catch::Approx(50.0));
    CHECK(percentages[1] == Catch::Approx(100.0));
}

TEST_CASE("Cleanup and storage accounting", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config());

    for (const auto* id : {"b1", "b2", "b3"}) {
        const std::vector<Resource> resources{{"a", 60}, {"b", 40}};
        h.serve(id, resources);
        REQUIRE(manager.download_book(make_manifest(id, resources)).has_value());
    }
    CHECK(manager.total_storage_used() == 300);

    // Access order: b3 oldest, then b1, then b2
    for (const auto* id : {"b3", "b1", "b2"}) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        REQUIRE(manager.mark_accessed(id));
    }
    CHECK_FALSE(manager.mark_accessed("unknown"));

    SECTION("Removes oldest first until the target is met") {
        auto removed = manager.cleanup_old_books(150);
        CHECK((removed == std::vector<std::string>{"b3", "b1"}));
        CHECK(manager.offline_book("b2").has_value());
        CHECK_FALSE(manager.offline_book("b3").has_value());
        CHECK_FALSE(h.cache.has("b3", "a"));
        CHECK(manager.total_storage_used() == 100);
    }

    SECTION("A zero target removes nothing") {
        CHECK(manager.cleanup_old_books(0).empty());
        CHECK(manager.offline_books().size() == 3);
    }

    SECTION("Asking for more than exists removes every completed book") {
        auto removed = manager.cleanup_old_books(10'000);
        CHECK(removed.size() == 3);
        CHECK(manager.offline_books().empty());
    }

    SECTION("remove_offline_book drops cache entries and record") {
        CHECK(manager.remove_offline_book("b2"));
        CHECK_FALSE(manager.remove_offline_book("b2"));
        CHECK_FALSE(*h.l2->has("b2", "a"));
        CHECK_FALSE(h.meta->get(std::string(OFFLINE_META_BOOK_ID), "b2")->has_value());
    }
}

TEST_CASE("Records survive a restart", "[offline]") {
    Harness h;
    const std::vector<Resource> resources{{"a", 10}, {"b", 20}};
    h.serve("b1", resources);
    h.serve("b9", resources);

    {
        OfflineManager manager(h.cache, h.meta, fast_config());
        REQUIRE(manager.download_book(make_manifest("b1", resources)).has_value());
    }

    // A record left behind by a process that died mid-download
    OfflineBook interrupted;
    interrupted.book_id = "b9";
    interrupted.title = "Interrupted";
    interrupted.total_size = 30;
    interrupted.downloaded_size = 10;
    interrupted.resource_count = 2;
    interrupted.downloaded_count = 1;
    interrupted.status = DownloadStatus::downloading;
    const nlohmann::json j = interrupted;
    REQUIRE(h.meta->set(std::string(OFFLINE_META_BOOK_ID), "b9", share(to_bytes(j.dump())),
                        "application/json"));

    OfflineManager manager(h.cache, h.meta, fast_config());
    auto loaded = manager.init();
    REQUIRE(loaded.has_value());
    CHECK(*loaded == 2);

    CHECK(manager.is_book_offline("b1"));
    auto b9 = manager.offline_book("b9");
    REQUIRE(b9.has_value());
    CHECK(b9->status == DownloadStatus::partial);
    CHECK(manager.total_storage_used() == 30 + 10);

    SECTION("Interrupted books can be resumed") {
        auto resumed = manager.resume_download(make_manifest("b9", resources));
        REQUIRE(resumed.has_value());
        CHECK(resumed->status == DownloadStatus::completed);
    }

    SECTION("Failing metadata store is reported") {
        h.meta->fail(true);
        OfflineManager broken(h.cache, h.meta, fast_config());
        auto result = broken.init();
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == folio::store::StoreErrc::io_error);
    }
}

TEST_CASE("A pause after the last resource still completes the book", "[offline]") {
    Harness h;
    OfflineManager manager(h.cache, h.meta, fast_config(1));

    const std::vector<Resource> resources{{"a", 10}, {"b", 20}, {"c", 30}};
    h.serve("b1", resources);

    manager.events().on<DownloadProgress>([&](const DownloadProgress& p) {
        if (p.current_index == p.total_resources) {
            manager.pause_download(p.book_id);
        }
    });

    auto result = manager.download_book(make_manifest("b1", resources));
    REQUIRE(result.has_value());
    CHECK(result->status == DownloadStatus::completed);
    CHECK(result->downloaded_count == 3);
    CHECK(manager.is_book_offline("b1"));
    CHECK(manager.offline_book("b1")->status == DownloadStatus::completed);
}

TEST_CASE("Destroying the manager while books download", "[offline]") {
    Harness h;
    const std::vector<Resource> resources{{"a", 10}, {"b", 10}, {"c", 10}};
    h.serve("b1", resources);
    h.serve("b2", resources);
    h.provider->close_gate();

    auto manager = std::make_unique<OfflineManager>(h.cache, h.meta, fast_config(1));
    auto first = manager->download_book_async(make_manifest("b1", resources));
    auto second = manager->download_book_async(make_manifest("b2", resources));
    REQUIRE(h.provider->wait_for_waiting(2));

    // The destructor blocks until both downloads have wound down
    std::thread closer([&manager] { manager.reset(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    h.provider->open_gate();
    closer.join();

    for (auto* future : {&first, &second}) {
        auto result = future->get();
        if (result) {
            CHECK(result->status == DownloadStatus::completed);
        } else {
            CHECK(result.error() == OfflineErrc::cancelled);
        }
    }
    CHECK_FALSE(manager);
}
