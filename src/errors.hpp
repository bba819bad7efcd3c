#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace statisfy {

enum class RegistrationError {
    None,
    PermissionDenied,
    Unsupported,
    Conflict,
    InvalidScheme,
    Failed
};

// Outcome of a URI-scheme registration attempt. Failure is recoverable:
// the application keeps running without deep-link capability.
struct RegistrationResult {
    bool success = false;
    RegistrationError error = RegistrationError::None;
    std::string error_message;
};

constexpr std::string_view to_string(RegistrationError error) {
    switch (error) {
        case RegistrationError::None: return "none";
        case RegistrationError::PermissionDenied: return "permission denied";
        case RegistrationError::Unsupported: return "unsupported";
        case RegistrationError::Conflict: return "conflict";
        case RegistrationError::InvalidScheme: return "invalid scheme";
        case RegistrationError::Failed: return "failed";
    }
    return "unknown";
}

// Thrown by a secondary instance that could neither reach the primary
// nor take over the instance lock.
class HandoffError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace statisfy
