#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statisfy {

// True if `scheme` follows RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." )
[[nodiscard]] bool is_valid_scheme(std::string_view scheme);

// True if `candidate` starts with "<scheme>:" (scheme compared ignoring case).
// Says nothing about whether the rest is well formed.
[[nodiscard]] bool has_scheme(std::string_view candidate, std::string_view scheme);

// Returns the URL if it is a well-formed URL of `scheme`, std::nullopt otherwise.
[[nodiscard]] std::optional<std::string> parse_deep_link(std::string_view candidate,
                                                         std::string_view scheme);

// Deep links among `args`, in argument order. Everything else is skipped.
[[nodiscard]] std::vector<std::string> extract_deep_links(const std::vector<std::string>& args,
                                                          std::string_view scheme);

} // namespace statisfy
