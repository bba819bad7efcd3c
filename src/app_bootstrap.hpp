#pragma once

#include "app_handle.hpp"
#include "config.hpp"
#include "deep_link_bridge.hpp"
#include "interfaces/i_instance_guard.hpp"
#include "interfaces/i_scheme_registrar.hpp"
#include "interfaces/i_ui_shell.hpp"
#include <functional>
#include <memory>

namespace statisfy {

// Composes guard, registrar, bridge and UI shell at process start.
//
// Order: build the shell (not shown yet), settle the instance role, register
// the scheme, hand this launch's own URLs to the registrar, start the bridge,
// then run the shell. Everything a scheme activation needs exists before the
// run loop starts.
class AppBootstrap {
public:
    using ShellFactory = std::function<std::unique_ptr<IUiShell>(std::shared_ptr<AppHandle>)>;

    AppBootstrap(AppConfig config,
                 ShellFactory make_shell,
                 std::unique_ptr<ISchemeRegistrar> registrar,
                 std::unique_ptr<IInstanceGuard> guard);
    ~AppBootstrap();

    AppBootstrap(const AppBootstrap&) = delete;
    AppBootstrap& operator=(const AppBootstrap&) = delete;

    // Returns the process exit code
    int run(const LaunchInvocation& invocation);

    [[nodiscard]] const std::shared_ptr<AppHandle>& handle() const { return handle_; }
    [[nodiscard]] const RegistrationResult& registration() const { return registration_; }

private:
    AppConfig config_;
    ShellFactory make_shell_;
    std::unique_ptr<ISchemeRegistrar> registrar_;
    std::unique_ptr<IInstanceGuard> guard_;

    std::shared_ptr<AppHandle> handle_;
    std::unique_ptr<IUiShell> shell_;
    std::unique_ptr<DeepLinkBridge> bridge_;
    RegistrationResult registration_;
};

// Guard backed by SingleInstance in config.runtime_dir
std::unique_ptr<IInstanceGuard> make_instance_guard(const AppConfig& config);

} // namespace statisfy
