#include "tui_colors.hpp"

namespace statisfy {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_HEADER, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_TIME, COLOR_GREEN, -1);

    // Flashed status bar after a second launch
    init_pair(COLOR_PAIR_ATTENTION, COLOR_BLACK, COLOR_YELLOW);
}

} // namespace statisfy
