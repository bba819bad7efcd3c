#pragma once

#include <chrono>
#include <cstddef>
#include <ctime>
#include <deque>
#include <string>

namespace statisfy {

struct ReceivedLink {
    std::string url;
    std::chrono::system_clock::time_point received_at;
};

// Deep links shown by the shells, newest last
struct DeepLinkViewModel {
    static constexpr std::size_t kMaxHistory = 200;

    std::deque<ReceivedLink> links;
    std::size_t total_received = 0;
    int selected_index = -1;
    bool auto_scroll = true;

    void add(std::string url) {
        links.push_back({std::move(url), std::chrono::system_clock::now()});
        ++total_received;
        if (links.size() > kMaxHistory) {
            links.pop_front();
            if (selected_index >= 0) --selected_index;
        }
    }

    void clear() {
        links.clear();
        selected_index = -1;
    }

    static std::string format_time(const std::chrono::system_clock::time_point tp) {
        const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_val;
        localtime_r(&time_t_val, &tm_val);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_val);
        return buf;
    }
};

} // namespace statisfy
