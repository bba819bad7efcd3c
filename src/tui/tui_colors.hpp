#pragma once

#include <ncurses.h>

namespace statisfy {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_HEADER,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_TIME,
    COLOR_PAIR_ATTENTION,
};

// Initialize ncurses color pairs
void init_colors();

} // namespace statisfy
