#include "app_bootstrap.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "platform_factory.hpp"
#include "imgui/imgui_shell.hpp"
#include <spdlog/spdlog.h>
#include <memory>

int main(int argc, char* argv[]) {
    auto config = statisfy::AppConfig::from_environment(argc > 0 ? argv[0] : nullptr);
    statisfy::init_logging(config);

    try {
        const auto invocation = statisfy::LaunchInvocation::capture(argc, argv);

        // Bootstrap owns the guard, registrar and the AppHandle shared with the shell
        statisfy::AppBootstrap bootstrap(
            config,
            [&config](std::shared_ptr<statisfy::AppHandle> handle) {
                return std::make_unique<statisfy::ImGuiShell>(std::move(handle), config.display_name,
                                                              config.event_name);
            },
            statisfy::make_scheme_registrar(config),
            statisfy::make_instance_guard(config));

        return bootstrap.run(invocation);
    } catch (const std::exception& e) {
        spdlog::critical("Error: {}", e.what());
        return 1;
    }
}
