#pragma once

#include "config.hpp"

namespace statisfy {

// Installs the default "statisfy" spdlog logger: stderr (unless the terminal
// belongs to a curses UI) plus a rotating file under config.state_dir.
// SPDLOG_LEVEL in the environment overrides the level.
void init_logging(const AppConfig& config, bool log_to_stderr = true);

} // namespace statisfy
