#include "app_bootstrap.hpp"
#include "errors.hpp"
#include "single_instance.hpp"
#include <cassert>
#include <spdlog/spdlog.h>

namespace statisfy {

std::unique_ptr<IInstanceGuard> make_instance_guard(const AppConfig& config) {
    return std::make_unique<SingleInstance>(config.identity, config.runtime_dir, config.handoff_timeout);
}

AppBootstrap::AppBootstrap(AppConfig config,
                           ShellFactory make_shell,
                           std::unique_ptr<ISchemeRegistrar> registrar,
                           std::unique_ptr<IInstanceGuard> guard)
    : config_(std::move(config))
    , make_shell_(std::move(make_shell))
    , registrar_(std::move(registrar))
    , guard_(std::move(guard)) {

    assert(make_shell_ && "ShellFactory must not be empty");
    assert(registrar_ && "ISchemeRegistrar must not be null");
    assert(guard_ && "IInstanceGuard must not be null");
}

AppBootstrap::~AppBootstrap() {
    // The guard's listener thread and the registrar outlive the bridge
    if (bridge_) {
        guard_->set_handoff_callback({});
        registrar_->on_activate({});
    }
}

int AppBootstrap::run(const LaunchInvocation& invocation) {
    handle_ = std::make_shared<AppHandle>();
    shell_ = make_shell_(handle_);

    InstanceRole role;
    try {
        role = guard_->acquire(invocation);
    } catch (const HandoffError& e) {
        spdlog::error("Startup aborted: {}", e.what());
        return 1;
    }

    if (role == InstanceRole::Secondary) {
        return 0;
    }

    if (config_.register_scheme) {
        registration_ = registrar_->register_scheme(config_.scheme);
        if (registration_.success) {
            spdlog::info("Registered {}:// protocol handler", config_.scheme);
        } else {
            spdlog::warn("Failed to register {}:// protocol handler ({}): {}",
                         config_.scheme, to_string(registration_.error), registration_.error_message);
        }
    } else {
        spdlog::info("Scheme registration disabled");
    }

    bridge_ = std::make_unique<DeepLinkBridge>(registrar_.get(), guard_.get(), config_.scheme, config_.event_name);
    bridge_->set_on_handoff([shell = shell_.get()](const LaunchInvocation&) {
        shell->request_focus();
    });

    // A cold start by the OS carries the URL on our own command line. The
    // registrar holds it until the bridge subscribes, ahead of any handoff
    // the guard buffered during registration.
    registrar_->notify_launch(invocation);
    bridge_->start(handle_);

    shell_->run();
    return 0;
}

} // namespace statisfy
