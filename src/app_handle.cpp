#include "app_handle.hpp"
#include <spdlog/spdlog.h>
#include <vector>

namespace statisfy {

void AppHandle::emit(const std::string& event, const std::string& payload) {
    std::function<void()> waker;
    {
        std::lock_guard lock(mutex_);
        if (!has_listener_locked(event)) {
            spdlog::trace("No listener for '{}', dropping {}", event, payload);
            return;
        }
        queue_.push_back({event, payload});
        waker = waker_;
    }

    if (waker) {
        waker();
    }
}

AppHandle::ListenerId AppHandle::listen(const std::string& event, Listener listener) {
    std::lock_guard lock(mutex_);
    const ListenerId id = next_id_++;
    listeners_.emplace(id, Registration{event, std::move(listener)});
    return id;
}

void AppHandle::unlisten(ListenerId id) {
    std::lock_guard lock(mutex_);
    listeners_.erase(id);
}

size_t AppHandle::dispatch_pending() {
    std::deque<Event> events;
    {
        std::lock_guard lock(mutex_);
        events.swap(queue_);
    }

    size_t delivered = 0;
    for (const auto& event : events) {
        // Snapshot so listeners may (un)register while being called
        std::vector<Listener> targets;
        {
            std::lock_guard lock(mutex_);
            for (const auto& [id, registration] : listeners_) {
                if (registration.event == event.name) {
                    targets.push_back(registration.listener);
                }
            }
        }

        if (targets.empty()) continue;

        for (const auto& listener : targets) {
            listener(event.payload);
        }
        ++delivered;
    }
    return delivered;
}

void AppHandle::set_waker(std::function<void()> waker) {
    std::lock_guard lock(mutex_);
    waker_ = std::move(waker);
}

size_t AppHandle::pending_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

bool AppHandle::has_listener_locked(const std::string& event) const {
    for (const auto& [id, registration] : listeners_) {
        if (registration.event == event) return true;
    }
    return false;
}

} // namespace statisfy
