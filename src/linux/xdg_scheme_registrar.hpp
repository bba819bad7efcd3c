#pragma once

#include "../interfaces/i_scheme_registrar.hpp"
#include "../activation_dispatcher.hpp"
#include "../command_runner.hpp"
#include "../config.hpp"
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace statisfy {

// freedesktop.org scheme registration: a hidden desktop entry declaring
// MimeType=x-scheme-handler/<scheme>, made the default handler with xdg-mime.
class XdgSchemeRegistrar : public ISchemeRegistrar {
public:
    explicit XdgSchemeRegistrar(const AppConfig& config, CommandRunner runner = run_command);
    ~XdgSchemeRegistrar() override = default;

    RegistrationResult register_scheme(const std::string& scheme) override;
    [[nodiscard]] bool is_registered(const std::string& scheme) const override;

    void on_activate(ActivationCallback callback) override;
    void notify_launch(const LaunchInvocation& invocation) override;
    [[nodiscard]] std::vector<std::string> current() const override;

    [[nodiscard]] std::string desktop_file_name() const;
    [[nodiscard]] std::filesystem::path desktop_file_path() const;
    [[nodiscard]] std::string desktop_entry(const std::string& scheme) const;

private:
    RegistrationResult install(const std::string& scheme);
    static std::string quote_exec_arg(const std::string& arg);
    static std::string mime_type(const std::string& scheme);

    std::string identity_;
    std::string display_name_;
    std::string scheme_;
    std::filesystem::path applications_dir_;
    std::filesystem::path executable_;
    CommandRunner runner_;

    mutable std::mutex mutex_;
    std::set<std::string> registered_;
    ActivationDispatcher dispatcher_;
};

} // namespace statisfy
