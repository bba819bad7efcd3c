#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace statisfy {

struct AppConfig {
    std::string identity = "statisfy";        // names the lock, socket and desktop entry
    std::string display_name = "Statisfy";
    std::string scheme = "statisfy";
    std::string event_name = "deep-link";

    std::filesystem::path runtime_dir;        // instance lock + handoff socket
    std::filesystem::path applications_dir;   // XDG desktop entries
    std::filesystem::path state_dir;          // log files; empty disables file logging
    std::filesystem::path executable;

    std::chrono::milliseconds handoff_timeout{2000};
    bool register_scheme = true;

    // Defaults resolved from the XDG environment variables.
    // `argv0` is the executable fallback when /proc/self/exe is unreadable.
    static AppConfig from_environment(const char* argv0 = nullptr);
};

} // namespace statisfy
