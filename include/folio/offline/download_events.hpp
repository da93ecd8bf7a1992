// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/offline/offline_book.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace folio::offline {

struct DownloadStarted {
    std::string book_id;
    std::string title;
    std::uint32_t total_resources{0};
};

// Emitted on every resource completion
struct DownloadProgress {
    std::string book_id;
    std::string current_resource;
    std::uint32_t current_index{0};
    std::uint32_t total_resources{0};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    double percentage{0.0};
    double speed{0.0};  // Bytes per second
    double eta{0.0};    // Seconds
};

struct DownloadCompleted {
    std::string book_id;
    OfflineBook book;
};

struct DownloadPaused {
    std::string book_id;
};

struct DownloadResumed {
    std::string book_id;
};

struct DownloadFailed {
    std::string book_id;
    std::string error;
};

struct DownloadCancelled {
    std::string book_id;
};

using DownloadEvent = std::variant<DownloadStarted,
                                   DownloadProgress,
                                   DownloadCompleted,
                                   DownloadPaused,
                                   DownloadResumed,
                                   DownloadFailed,
                                   DownloadCancelled>;

[[nodiscard]] const std::string& event_book_id(const DownloadEvent& event) noexcept;

using ListenerId = std::uint64_t;

// Typed publish/subscribe for download events. Listeners run on the
// emitting thread, outside any lock. A listener that throws is logged and
// does not affect the other listeners or the emitter.
class DownloadEvents {
public:
    using Listener = std::function<void(const DownloadEvent&)>;

    // Subscribe to one event kind
    template<typename Event>
    ListenerId on(std::function<void(const Event&)> handler) {
        static_assert(std::is_constructible_v<DownloadEvent, Event>,
                      "not a download event");
        return on_any([handler = std::move(handler)](const DownloadEvent& event) {
            if (const auto* typed = std::get_if<Event>(&event)) {
                handler(*typed);
            }
        });
    }

    // Subscribe to every event kind
    ListenerId on_any(Listener listener);

    // true when the listener was registered
    bool off(ListenerId id);

    void emit(const DownloadEvent& event) const;

    [[nodiscard]] std::size_t listener_count() const;

private:
    struct Entry {
        ListenerId id;
        std::shared_ptr<const Listener> listener;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> listeners_;
    ListenerId next_id_{1};
};

} // namespace folio::offline
