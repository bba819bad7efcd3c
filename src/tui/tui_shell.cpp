#include "tui_shell.hpp"
#include "tui_colors.hpp"
#include <algorithm>
#include <cassert>
#include <csignal>
#include <cstdio>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace statisfy {

// Signal handler for terminal resize
static std::atomic<bool> g_resize_requested{false};

static void handle_resize([[maybe_unused]] int sig) {
    g_resize_requested.store(true);
}

TuiShell::TuiShell(std::shared_ptr<AppHandle> handle, std::string title, const std::string& event_name)
    : handle_(std::move(handle))
    , title_(std::move(title)) {

    assert(handle_ != nullptr);

    listener_id_ = handle_->listen(event_name, [this](const std::string& url) {
        view_model_.add(url);
    });
}

TuiShell::~TuiShell() {
    handle_->unlisten(listener_id_);
}

void TuiShell::run() {
    // Initialize ncurses
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);  // Hide cursor
    timeout(100); // getch() doubles as the loop's tick

    init_colors();

    printf("\033]0;%s\007", title_.c_str());
    fflush(stdout);

    signal(SIGWINCH, handle_resize);

    running_ = true;
    while (running_) {
        if (g_resize_requested.exchange(false)) {
            endwin();
            refresh();
        }

        if (focus_requested_.exchange(false)) {
            flash();
            attention_until_ = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        }

        handle_->dispatch_pending();

        render();

        const int ch = getch();
        if (ch != ERR) {
            handle_input(ch);
        }
    }

    endwin();
}

void TuiShell::request_focus() {
    focus_requested_ = true;
}

void TuiShell::handle_input(int ch) {
    switch (ch) {
        case 'q':
        case 'Q':
            running_ = false;
            break;
        case 'c':
            view_model_.clear();
            scroll_offset_ = 0;
            break;
        case 'a':
            view_model_.auto_scroll = !view_model_.auto_scroll;
            break;
        case KEY_UP:
        case 'k':
            move_selection(-1);
            break;
        case KEY_DOWN:
        case 'j':
            move_selection(1);
            break;
        case KEY_HOME:
            view_model_.selected_index = view_model_.links.empty() ? -1 : 0;
            break;
        case KEY_END:
            view_model_.selected_index = static_cast<int>(view_model_.links.size()) - 1;
            break;
        default:
            break;
    }
}

void TuiShell::move_selection(int delta) {
    if (view_model_.links.empty()) return;
    const int last = static_cast<int>(view_model_.links.size()) - 1;
    view_model_.selected_index = std::clamp(view_model_.selected_index + delta, 0, last);
    view_model_.auto_scroll = false;
}

void TuiShell::render() {
    int rows, cols;
    getmaxyx(stdscr, rows, cols);
    erase();

    attron(COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);
    mvprintw(0, 0, "%s", title_.c_str());
    attroff(COLOR_PAIR(COLOR_PAIR_TITLE) | A_BOLD);

    attron(COLOR_PAIR(COLOR_PAIR_HEADER));
    mvprintw(1, 0, "%-10s %s", "TIME", "URL");
    attroff(COLOR_PAIR(COLOR_PAIR_HEADER));

    const int list_top = 2;
    const int list_rows = std::max(0, rows - list_top - 1);
    const int count = static_cast<int>(view_model_.links.size());

    if (view_model_.auto_scroll) {
        scroll_offset_ = std::max(0, count - list_rows);
    } else if (view_model_.selected_index >= 0) {
        if (view_model_.selected_index < scroll_offset_) {
            scroll_offset_ = view_model_.selected_index;
        } else if (view_model_.selected_index >= scroll_offset_ + list_rows) {
            scroll_offset_ = view_model_.selected_index - list_rows + 1;
        }
    }
    scroll_offset_ = std::clamp(scroll_offset_, 0, std::max(0, count - 1));

    for (int row = 0; row < list_rows && scroll_offset_ + row < count; ++row) {
        const int index = scroll_offset_ + row;
        const auto& link = view_model_.links[static_cast<size_t>(index)];
        const bool selected = index == view_model_.selected_index;

        const int time_pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_TIME;
        const int url_pair = selected ? COLOR_PAIR_SELECTED : COLOR_PAIR_DEFAULT;

        attron(COLOR_PAIR(time_pair));
        mvprintw(list_top + row, 0, "%-10s", DeepLinkViewModel::format_time(link.received_at).c_str());
        attroff(COLOR_PAIR(time_pair));

        attron(COLOR_PAIR(url_pair));
        mvaddnstr(list_top + row, 11, link.url.c_str(), std::max(0, cols - 11));
        attroff(COLOR_PAIR(url_pair));
    }

    render_status_bar(rows, cols);
    refresh();
}

void TuiShell::render_status_bar(int rows, int cols) {
    const bool attention = std::chrono::steady_clock::now() < attention_until_;
    const int pair = attention ? COLOR_PAIR_ATTENTION : COLOR_PAIR_STATUS;

    const auto text = attention
        ? std::string(" Another launch was forwarded to this instance")
        : fmt::format(" {} received | q quit  c clear  a auto-scroll [{}]",
                      view_model_.total_received, view_model_.auto_scroll ? "on" : "off");

    attron(COLOR_PAIR(pair));
    mvhline(rows - 1, 0, ' ', cols);
    mvaddnstr(rows - 1, 0, text.c_str(), cols);
    attroff(COLOR_PAIR(pair));
}

} // namespace statisfy
