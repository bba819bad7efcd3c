#include "app_bootstrap.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "platform_factory.hpp"
#include "tui/tui_shell.hpp"
#include <ncurses.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    auto config = statisfy::AppConfig::from_environment(argc > 0 ? argv[0] : nullptr);

    // ncurses owns the terminal; log to file only
    statisfy::init_logging(config, false);

    try {
        const auto invocation = statisfy::LaunchInvocation::capture(argc, argv);

        statisfy::AppBootstrap bootstrap(
            config,
            [&config](std::shared_ptr<statisfy::AppHandle> handle) {
                return std::make_unique<statisfy::TuiShell>(std::move(handle), config.display_name,
                                                            config.event_name);
            },
            statisfy::make_scheme_registrar(config),
            statisfy::make_instance_guard(config));

        return bootstrap.run(invocation);
    } catch (const std::exception& e) {
        // Make sure we restore terminal state before printing error
        endwin();
        spdlog::critical("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
