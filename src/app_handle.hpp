#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace statisfy {

// Event-publishing surface of the running application.
//
// emit() may be called from any thread; it only queues the event and wakes
// the run loop. Listeners run on the thread that calls dispatch_pending(),
// which is the UI run loop. An event emitted while nobody listens for its
// name is dropped.
class AppHandle {
public:
    using ListenerId = uint64_t;
    using Listener = std::function<void(const std::string& payload)>;

    AppHandle() = default;
    AppHandle(const AppHandle&) = delete;
    AppHandle& operator=(const AppHandle&) = delete;

    void emit(const std::string& event, const std::string& payload);

    ListenerId listen(const std::string& event, Listener listener);
    void unlisten(ListenerId id);

    // Deliver queued events in emission order; returns how many were delivered
    size_t dispatch_pending();

    // Called after each successful emit, typically to wake a blocked run loop
    void set_waker(std::function<void()> waker);

    [[nodiscard]] size_t pending_count() const;

private:
    struct Event {
        std::string name;
        std::string payload;
    };

    struct Registration {
        std::string event;
        Listener listener;
    };

    [[nodiscard]] bool has_listener_locked(const std::string& event) const;

    mutable std::mutex mutex_;
    std::deque<Event> queue_;
    std::map<ListenerId, Registration> listeners_;
    ListenerId next_id_ = 1;
    std::function<void()> waker_;
};

} // namespace statisfy
