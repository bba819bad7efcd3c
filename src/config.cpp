#include "config.hpp"
#include <unistd.h>
#include <cstdlib>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace statisfy {

namespace {

// Non-empty environment value, or nullptr
const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

fs::path home_dir() {
    if (const char* home = env("HOME")) return home;
    return {};
}

} // namespace

AppConfig AppConfig::from_environment(const char* argv0) {
    AppConfig config;

    if (const char* dir = env("STATISFY_RUNTIME_DIR")) {
        config.runtime_dir = dir;
    } else if (const char* runtime_dir = env("XDG_RUNTIME_DIR")) {
        config.runtime_dir = runtime_dir;
    } else {
        // Fallback: use /tmp with UID
        config.runtime_dir = "/tmp/" + config.identity + "-" + std::to_string(getuid());
    }

    const fs::path home = home_dir();

    if (const char* data_home = env("XDG_DATA_HOME")) {
        config.applications_dir = fs::path(data_home) / "applications";
    } else if (!home.empty()) {
        config.applications_dir = home / ".local" / "share" / "applications";
    }

    if (const char* state_home = env("XDG_STATE_HOME")) {
        config.state_dir = fs::path(state_home) / config.identity;
    } else if (!home.empty()) {
        config.state_dir = home / ".local" / "state" / config.identity;
    }

    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
        config.executable = exe;
    } else if (argv0) {
        config.executable = fs::absolute(argv0, ec);
    }

    if (const char* no_register = env("STATISFY_NO_REGISTER")) {
        config.register_scheme = std::string_view(no_register) == "0";
    }

    return config;
}

} // namespace statisfy
