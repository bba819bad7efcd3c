#pragma once

#include "../interfaces/i_ui_shell.hpp"
#include "../app_handle.hpp"
#include "../viewmodels/deep_link_view_model.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <string>

namespace statisfy {

// Terminal front end: lists received deep links, 'q' quits.
// A forwarded second launch flashes the screen since a terminal cannot be raised.
class TuiShell : public IUiShell {
public:
    TuiShell(std::shared_ptr<AppHandle> handle, std::string title, const std::string& event_name);
    ~TuiShell() override;

    void run() override;
    void request_focus() override;

private:
    void render();
    void render_status_bar(int rows, int cols);
    void handle_input(int ch);
    void move_selection(int delta);

    std::shared_ptr<AppHandle> handle_;
    AppHandle::ListenerId listener_id_ = 0;
    std::string title_;

    DeepLinkViewModel view_model_;
    int scroll_offset_ = 0;

    std::atomic<bool> running_{false};
    std::atomic<bool> focus_requested_{false};
    std::chrono::steady_clock::time_point attention_until_;
};

} // namespace statisfy
