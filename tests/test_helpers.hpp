#pragma once

#include "interfaces/i_instance_guard.hpp"
#include "interfaces/i_scheme_registrar.hpp"
#include "interfaces/i_ui_shell.hpp"
#include "activation_dispatcher.hpp"
#include "app_handle.hpp"
#include "errors.hpp"

#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace statisfy::test {

// Scratch directory removed on destruction. Kept under /tmp so Unix
// socket paths stay below the sun_path limit.
class TempDir {
public:
    TempDir() {
        std::string tmpl = "/tmp/statisfy-test-XXXXXX";
        if (!mkdtemp(tmpl.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = tmpl;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline LaunchInvocation make_invocation(std::vector<std::string> args, std::string cwd = "/home/user") {
    LaunchInvocation invocation;
    invocation.args = std::move(args);
    invocation.cwd = std::move(cwd);
    return invocation;
}

class FakeRegistrar : public ISchemeRegistrar {
public:
    RegistrationResult result{true, RegistrationError::None, {}};
    std::vector<std::string> register_calls;
    std::vector<LaunchInvocation> launches;
    std::function<void()> during_register;

    RegistrationResult register_scheme(const std::string& scheme) override {
        register_calls.push_back(scheme);
        if (during_register) during_register();
        return result;
    }

    [[nodiscard]] bool is_registered(const std::string&) const override {
        return result.success && !register_calls.empty();
    }

    void on_activate(ActivationCallback callback) override {
        dispatcher.set_listener(std::move(callback));
    }

    void notify_launch(const LaunchInvocation& invocation) override {
        launches.push_back(invocation);
        dispatcher.deliver(activation_from_launch(invocation, "statisfy"));
    }

    [[nodiscard]] std::vector<std::string> current() const override {
        return dispatcher.current();
    }

    // Simulates the OS calling the activation hook
    void activate(std::vector<std::string> urls) {
        dispatcher.deliver(ActivationEvent{std::move(urls)});
    }

    ActivationDispatcher dispatcher;
};

class FakeGuard : public IInstanceGuard {
public:
    InstanceRole role = InstanceRole::Primary;
    bool throw_handoff_error = false;
    std::vector<LaunchInvocation> acquired_with;

    InstanceRole acquire(const LaunchInvocation& invocation) override {
        acquired_with.push_back(invocation);
        if (throw_handoff_error) {
            throw HandoffError("primary unreachable");
        }
        return role;
    }

    void set_handoff_callback(HandoffCallback callback) override {
        callback_ = std::move(callback);
    }

    // Simulates a secondary handing off
    void forward(const LaunchInvocation& invocation) {
        if (callback_) callback_(invocation);
    }

    [[nodiscard]] bool has_callback() const { return static_cast<bool>(callback_); }

private:
    HandoffCallback callback_;
};

// Shell whose run loop drains the handle once, after an optional hook
class FakeShell : public IUiShell {
public:
    FakeShell(std::shared_ptr<AppHandle> handle, const std::string& event_name,
              std::vector<std::string>* received)
        : handle_(std::move(handle)) {
        listener_id_ = handle_->listen(event_name, [received](const std::string& url) {
            received->push_back(url);
        });
    }

    ~FakeShell() override {
        handle_->unlisten(listener_id_);
    }

    void run() override {
        ++run_count;
        if (during_run) during_run();
        handle_->dispatch_pending();
    }

    void request_focus() override {
        ++focus_requests;
    }

    int run_count = 0;
    std::atomic<int> focus_requests{0};
    std::function<void()> during_run;

private:
    std::shared_ptr<AppHandle> handle_;
    AppHandle::ListenerId listener_id_ = 0;
};

} // namespace statisfy::test
