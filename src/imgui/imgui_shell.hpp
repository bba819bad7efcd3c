#pragma once

#include "../interfaces/i_ui_shell.hpp"
#include "../app_handle.hpp"
#include "../viewmodels/deep_link_view_model.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

struct GLFWwindow;

namespace statisfy {

class ImGuiShell : public IUiShell {
public:
    // `handle` is shared with the bridge; the shell listens for `event_name`
    // on it and drains it from the render loop.
    ImGuiShell(std::shared_ptr<AppHandle> handle, std::string title, const std::string& event_name);
    ~ImGuiShell() override;

    void run() override;
    void request_focus() override;

private:
    void render();

    std::shared_ptr<AppHandle> handle_;
    AppHandle::ListenerId listener_id_ = 0;
    std::string title_;

    DeepLinkViewModel view_model_;

    // Window pointer for focus handling
    std::atomic<GLFWwindow*> window_{nullptr};
    std::atomic<bool> focus_requested_{false};

    // Event debouncing
    void post_empty_event_debounced();
    std::mutex event_debounce_mutex_;
    std::chrono::steady_clock::time_point last_event_post_time_;
    static constexpr auto kEventDebounceInterval = std::chrono::milliseconds(16);
};

} // namespace statisfy
