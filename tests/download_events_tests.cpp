// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <folio/offline/download_events.hpp>
#include <stdexcept>

using namespace folio::offline;

TEST_CASE("DownloadEvents dispatch", "[events]") {
    DownloadEvents events;

    SECTION("Typed listeners only see their event kind") {
        int progress_calls = 0;
        int pause_calls = 0;
        events.on<DownloadProgress>([&](const DownloadProgress& p) {
            ++progress_calls;
            CHECK(p.book_id == "b1");
        });
        events.on<DownloadPaused>([&](const DownloadPaused&) { ++pause_calls; });

        events.emit(DownloadProgress{.book_id = "b1", .current_index = 1});
        events.emit(DownloadStarted{"b1", "Title", 3});

        CHECK(progress_calls == 1);
        CHECK(pause_calls == 0);
    }

    SECTION("on_any sees everything") {
        std::vector<std::string> ids;
        events.on_any([&](const DownloadEvent& e) { ids.push_back(event_book_id(e)); });

        events.emit(DownloadStarted{"a", "A", 1});
        events.emit(DownloadFailed{"b", "boom"});
        events.emit(DownloadCancelled{"c"});

        CHECK((ids == std::vector<std::string>{"a", "b", "c"}));
    }

    SECTION("A throwing listener does not stop the others") {
        int after = 0;
        events.on<DownloadCompleted>([](const DownloadCompleted&) {
            throw std::runtime_error("listener bug");
        });
        events.on<DownloadCompleted>([&](const DownloadCompleted&) { ++after; });

        CHECK_NOTHROW(events.emit(DownloadCompleted{"b1", {}}));
        CHECK(after == 1);
    }

    SECTION("off unsubscribes") {
        int calls = 0;
        auto id = events.on<DownloadResumed>([&](const DownloadResumed&) { ++calls; });
        CHECK(events.listener_count() == 1);
        CHECK(events.off(id));
        CHECK_FALSE(events.off(id));

        events.emit(DownloadResumed{"b1"});
        CHECK(calls == 0);
    }

    SECTION("Listeners may unsubscribe themselves while running") {
        int calls = 0;
        ListenerId id = 0;
        id = events.on<DownloadPaused>([&](const DownloadPaused&) {
            ++calls;
            events.off(id);
        });

        events.emit(DownloadPaused{"b1"});
        events.emit(DownloadPaused{"b1"});
        CHECK(calls == 1);
    }
}
