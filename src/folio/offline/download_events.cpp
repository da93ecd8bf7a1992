// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/offline/download_events.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace folio::offline {

const std::string& event_book_id(const DownloadEvent& event) noexcept {
    return std::visit([](const auto& e) -> const std::string& { return e.book_id; }, event);
}

ListenerId DownloadEvents::on_any(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto id = next_id_++;
    listeners_.push_back(Entry{id, std::make_shared<const Listener>(std::move(listener))});
    return id;
}

bool DownloadEvents::off(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

void DownloadEvents::emit(const DownloadEvent& event) const {
    // Snapshot so listeners may subscribe or unsubscribe while running
    std::vector<Entry> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = listeners_;
    }

    for (const auto& entry : snapshot) {
        try {
            (*entry.listener)(event);
        } catch (const std::exception& e) {
            spdlog::error("[DownloadEvents] listener {} failed for {}: {}",
                          entry.id, event_book_id(event), e.what());
        } catch (...) {
            spdlog::error("[DownloadEvents] listener {} failed for {}: unknown exception",
                          entry.id, event_book_id(event));
        }
    }
}

std::size_t DownloadEvents::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

} // namespace folio::offline
