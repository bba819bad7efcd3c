#include "unsupported_scheme_registrar.hpp"
#include "../deep_link_url.hpp"
#include <fmt/format.h>

namespace statisfy {

UnsupportedSchemeRegistrar::UnsupportedSchemeRegistrar(const AppConfig& config)
    : scheme_(config.scheme) {
}

RegistrationResult UnsupportedSchemeRegistrar::register_scheme(const std::string& scheme) {
    RegistrationResult result;
    if (!is_valid_scheme(scheme)) {
        result.error = RegistrationError::InvalidScheme;
        result.error_message = fmt::format("'{}' is not a valid URI scheme", scheme);
        return result;
    }
    scheme_ = scheme;
    result.error = RegistrationError::Unsupported;
    result.error_message = "URI scheme registration is not implemented on this platform";
    return result;
}

bool UnsupportedSchemeRegistrar::is_registered(const std::string&) const {
    return false;
}

void UnsupportedSchemeRegistrar::on_activate(ActivationCallback callback) {
    dispatcher_.set_listener(std::move(callback));
}

void UnsupportedSchemeRegistrar::notify_launch(const LaunchInvocation& invocation) {
    dispatcher_.deliver(activation_from_launch(invocation, scheme_));
}

std::vector<std::string> UnsupportedSchemeRegistrar::current() const {
    return dispatcher_.current();
}

} // namespace statisfy
