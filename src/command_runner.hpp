#pragma once

#include <functional>
#include <string>
#include <vector>

namespace statisfy {

struct CommandResult {
    bool launched = false;   // false if the program could not be started at all
    int exit_code = -1;
    std::string output;      // captured stdout
};

using CommandRunner = std::function<CommandResult(const std::vector<std::string>& argv)>;

// Runs argv[0] from PATH without a shell and waits for it
CommandResult run_command(const std::vector<std::string>& argv);

} // namespace statisfy
