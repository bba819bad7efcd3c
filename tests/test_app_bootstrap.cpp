#include <catch2/catch.hpp>
#include "app_bootstrap.hpp"
#include "single_instance.hpp"
#include "test_helpers.hpp"

using namespace statisfy;
using namespace std::chrono_literals;
using statisfy::test::FakeGuard;
using statisfy::test::FakeRegistrar;
using statisfy::test::FakeShell;
using statisfy::test::TempDir;
using statisfy::test::make_invocation;

namespace {

// Keeps non-owning views of the parts handed to AppBootstrap
struct Harness {
    AppConfig config;
    FakeRegistrar* registrar = nullptr;
    FakeGuard* guard = nullptr;
    FakeShell* shell = nullptr;
    std::vector<std::string> received;
    std::function<void()> during_run;
    std::function<void()> during_register;
    int shells_built = 0;

    std::unique_ptr<AppBootstrap> make(std::unique_ptr<IInstanceGuard> custom_guard = nullptr) {
        auto fake_registrar = std::make_unique<FakeRegistrar>();
        fake_registrar->during_register = during_register;
        registrar = fake_registrar.get();

        if (!custom_guard) {
            auto fake_guard = std::make_unique<FakeGuard>();
            guard = fake_guard.get();
            custom_guard = std::move(fake_guard);
        }

        auto factory = [this](std::shared_ptr<AppHandle> handle) -> std::unique_ptr<IUiShell> {
            ++shells_built;
            auto fake = std::make_unique<FakeShell>(std::move(handle), config.event_name, &received);
            fake->during_run = during_run;
            shell = fake.get();
            return fake;
        };

        return std::make_unique<AppBootstrap>(config, factory, std::move(fake_registrar), std::move(custom_guard));
    }
};

} // namespace

TEST_CASE("Primary registers, runs the shell and receives its own launch URL", "[bootstrap]") {
    Harness h;
    auto bootstrap = h.make();

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy", "statisfy://cold/start"})) == 0);

    REQUIRE(h.shells_built == 1);
    REQUIRE(h.shell->run_count == 1);
    REQUIRE(h.registrar->register_calls == std::vector<std::string>{"statisfy"});
    REQUIRE(bootstrap->registration().success);
    REQUIRE(h.received == std::vector<std::string>{"statisfy://cold/start"});
    REQUIRE(h.registrar->current() == std::vector<std::string>{"statisfy://cold/start"});
}

TEST_CASE("A plain launch shows the window with no events", "[bootstrap]") {
    Harness h;
    auto bootstrap = h.make();

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy"})) == 0);
    REQUIRE(h.shell->run_count == 1);
    REQUIRE(h.received.empty());
}

TEST_CASE("A secondary exits without running its shell", "[bootstrap]") {
    Harness h;
    auto bootstrap = h.make();
    h.guard->role = InstanceRole::Secondary;

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy", "statisfy://x"})) == 0);
    REQUIRE(h.shell->run_count == 0);
    REQUIRE(h.registrar->register_calls.empty());
    REQUIRE(h.guard->acquired_with.size() == 1);
    REQUIRE(h.guard->acquired_with[0].args.back() == "statisfy://x");
}

TEST_CASE("An unreachable primary fails startup", "[bootstrap]") {
    Harness h;
    auto bootstrap = h.make();
    h.guard->throw_handoff_error = true;

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy"})) == 1);
    REQUIRE(h.shell->run_count == 0);
}

TEST_CASE("Registration failure does not stop the application", "[bootstrap]") {
    Harness h;
    auto bootstrap = h.make();
    h.registrar->result = {false, RegistrationError::PermissionDenied, "read-only data dir"};

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy", "statisfy://still/works"})) == 0);
    REQUIRE(h.shell->run_count == 1);
    REQUIRE(bootstrap->registration().error == RegistrationError::PermissionDenied);
    REQUIRE(h.received == std::vector<std::string>{"statisfy://still/works"});
}

TEST_CASE("Registration can be turned off", "[bootstrap]") {
    Harness h;
    h.config.register_scheme = false;
    auto bootstrap = h.make();

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy"})) == 0);
    REQUIRE(h.registrar->register_calls.empty());
    REQUIRE(h.shell->run_count == 1);
}

TEST_CASE("A handoff while running publishes and requests focus", "[bootstrap]") {
    Harness h;
    h.during_run = [&h] {
        h.guard->forward(make_invocation({"/usr/bin/statisfy", "statisfy://second/launch"}));
    };
    auto bootstrap = h.make();

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy"})) == 0);
    REQUIRE(h.received == std::vector<std::string>{"statisfy://second/launch"});
    REQUIRE(h.shell->focus_requests == 1);
}

TEST_CASE("End to end with a real instance guard", "[bootstrap][single_instance]") {
    TempDir dir;
    Harness h;
    h.config.runtime_dir = dir.path();
    h.config.handoff_timeout = 1000ms;

    InstanceRole second_role = InstanceRole::Primary;
    h.during_run = [&] {
        // A second process launched by the OS with a new URL
        SingleInstance second(h.config.identity, h.config.runtime_dir, h.config.handoff_timeout);
        second_role = second.acquire(make_invocation({"/usr/bin/statisfy", "statisfy://open/2"}, "/elsewhere"));
    };
    auto bootstrap = h.make(make_instance_guard(h.config));

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy", "statisfy://open/1"})) == 0);
    REQUIRE(second_role == InstanceRole::Secondary);
    REQUIRE(h.received == std::vector<std::string>{"statisfy://open/1", "statisfy://open/2"});
    REQUIRE(h.shell->focus_requests == 1);
}

TEST_CASE("A launch forwarded during registration follows the primary's own URL", "[bootstrap][single_instance]") {
    TempDir dir;
    Harness h;
    h.config.runtime_dir = dir.path();
    h.config.handoff_timeout = 1000ms;

    // The second process gets through while xdg-mime is still running
    InstanceRole second_role = InstanceRole::Primary;
    h.during_register = [&] {
        SingleInstance second(h.config.identity, h.config.runtime_dir, h.config.handoff_timeout);
        second_role = second.acquire(make_invocation({"/usr/bin/statisfy", "statisfy://second"}));
    };
    auto bootstrap = h.make(make_instance_guard(h.config));

    REQUIRE(bootstrap->run(make_invocation({"/usr/bin/statisfy", "statisfy://first"})) == 0);
    REQUIRE(second_role == InstanceRole::Secondary);
    REQUIRE(h.received == std::vector<std::string>{"statisfy://first", "statisfy://second"});
}
