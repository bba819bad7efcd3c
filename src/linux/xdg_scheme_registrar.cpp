#include "xdg_scheme_registrar.hpp"
#include "../deep_link_url.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace statisfy {

namespace {

std::string to_lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

RegistrationResult failure(RegistrationError error, std::string message) {
    RegistrationResult result;
    result.error = error;
    result.error_message = std::move(message);
    return result;
}

bool is_permission_error(int err) {
    return err == EACCES || err == EPERM || err == EROFS;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

} // namespace

XdgSchemeRegistrar::XdgSchemeRegistrar(const AppConfig& config, CommandRunner runner)
    : identity_(config.identity)
    , display_name_(config.display_name)
    , scheme_(config.scheme)
    , applications_dir_(config.applications_dir)
    , executable_(config.executable)
    , runner_(std::move(runner)) {
}

std::string XdgSchemeRegistrar::desktop_file_name() const {
    return identity_ + "-handler.desktop";
}

fs::path XdgSchemeRegistrar::desktop_file_path() const {
    return applications_dir_ / desktop_file_name();
}

std::string XdgSchemeRegistrar::mime_type(const std::string& scheme) {
    return "x-scheme-handler/" + to_lower(scheme);
}

// Desktop Entry Specification, "The Exec key": quoting rules applied first,
// then the general string escaping, which doubles each backslash.
std::string XdgSchemeRegistrar::quote_exec_arg(const std::string& arg) {
    std::string quoted = "\"";
    for (const char c : arg) {
        switch (c) {
            case '"':
            case '`':
            case '$':
                quoted += "\\\\";
                quoted += c;
                break;
            case '\\':
                quoted += "\\\\\\\\";
                break;
            case '%':
                quoted += "%%";
                break;
            default:
                quoted += c;
        }
    }
    quoted += '"';
    return quoted;
}

std::string XdgSchemeRegistrar::desktop_entry(const std::string& scheme) const {
    return fmt::format(
        "[Desktop Entry]\n"
        "Type=Application\n"
        "Name={}\n"
        "Exec={} %u\n"
        "Terminal=false\n"
        "NoDisplay=true\n"
        "MimeType={};\n",
        display_name_, quote_exec_arg(executable_.string()), mime_type(scheme));
}

RegistrationResult XdgSchemeRegistrar::register_scheme(const std::string& scheme) {
    if (!is_valid_scheme(scheme)) {
        return failure(RegistrationError::InvalidScheme,
                       fmt::format("'{}' is not a valid URI scheme", scheme));
    }

    const auto key = to_lower(scheme);
    std::lock_guard lock(mutex_);
    if (registered_.contains(key)) {
        spdlog::debug("{}:// already registered", key);
        return {true, RegistrationError::None, {}};
    }
    if (!registered_.empty()) {
        return failure(RegistrationError::Failed,
                       fmt::format("already registered for {}://, only one scheme is supported",
                                   *registered_.begin()));
    }

    scheme_ = scheme;
    auto result = install(key);
    if (result.success) {
        registered_.insert(key);
    }
    return result;
}

RegistrationResult XdgSchemeRegistrar::install(const std::string& scheme) {
    if (applications_dir_.empty()) {
        return failure(RegistrationError::Unsupported, "no XDG data directory (HOME and XDG_DATA_HOME unset)");
    }
    if (executable_.empty()) {
        return failure(RegistrationError::Failed, "executable path unknown");
    }

    std::error_code ec;
    fs::create_directories(applications_dir_, ec);
    if (ec) {
        const auto error = ec == std::errc::permission_denied || ec == std::errc::read_only_file_system
            ? RegistrationError::PermissionDenied : RegistrationError::Failed;
        return failure(error, fmt::format("cannot create {}: {}", applications_dir_.string(), ec.message()));
    }

    const auto path = desktop_file_path();
    const auto contents = desktop_entry(scheme);
    if (read_file(path) != contents) {
        errno = 0;
        std::ofstream file(path, std::ios::trunc);
        const int open_errno = errno;
        if (!file) {
            const auto error = is_permission_error(open_errno)
                ? RegistrationError::PermissionDenied : RegistrationError::Failed;
            return failure(error, fmt::format("cannot write {}: {}", path.string(),
                                              open_errno ? strerror(open_errno) : "unknown error"));
        }
        file << contents;
        file.close();
        if (!file) {
            return failure(RegistrationError::Failed, fmt::format("cannot write {}", path.string()));
        }
        spdlog::debug("Wrote {}", path.string());
    }

    // Refreshes the MIME cache; not fatal, some desktops rebuild it themselves
    const auto update = runner_({"update-desktop-database", applications_dir_.string()});
    if (!update.launched || update.exit_code != 0) {
        spdlog::debug("update-desktop-database {} did not succeed", applications_dir_.string());
    }

    const auto mime = mime_type(scheme);
    const auto set_default = runner_({"xdg-mime", "default", desktop_file_name(), mime});
    if (!set_default.launched) {
        return failure(RegistrationError::Unsupported, "xdg-mime is not available");
    }
    if (set_default.exit_code != 0) {
        return failure(RegistrationError::Failed,
                       fmt::format("xdg-mime default exited with status {}", set_default.exit_code));
    }

    const auto query = runner_({"xdg-mime", "query", "default", mime});
    if (query.launched && query.exit_code == 0) {
        const auto owner = trim(query.output);
        if (!owner.empty() && owner != desktop_file_name()) {
            return failure(RegistrationError::Conflict,
                           fmt::format("{} is handled by {}", mime, owner));
        }
    }

    return {true, RegistrationError::None, {}};
}

bool XdgSchemeRegistrar::is_registered(const std::string& scheme) const {
    std::lock_guard lock(mutex_);
    return registered_.contains(to_lower(scheme));
}

void XdgSchemeRegistrar::on_activate(ActivationCallback callback) {
    dispatcher_.set_listener(std::move(callback));
}

void XdgSchemeRegistrar::notify_launch(const LaunchInvocation& invocation) {
    std::string scheme;
    {
        std::lock_guard lock(mutex_);
        scheme = scheme_;
    }
    dispatcher_.deliver(activation_from_launch(invocation, scheme));
}

std::vector<std::string> XdgSchemeRegistrar::current() const {
    return dispatcher_.current();
}

} // namespace statisfy
