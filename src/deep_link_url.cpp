#include "deep_link_url.hpp"
#include <algorithm>
#include <cctype>

namespace statisfy {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

bool is_hex(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace

bool is_valid_scheme(std::string_view scheme) {
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme.front()))) {
        return false;
    }
    return std::ranges::all_of(scheme, [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool has_scheme(std::string_view candidate, std::string_view scheme) {
    if (candidate.size() <= scheme.size() || candidate[scheme.size()] != ':') {
        return false;
    }
    return equals_ignore_case(candidate.substr(0, scheme.size()), scheme);
}

std::optional<std::string> parse_deep_link(std::string_view candidate, std::string_view scheme) {
    if (!is_valid_scheme(scheme) || !has_scheme(candidate, scheme)) {
        return std::nullopt;
    }

    const auto rest = candidate.substr(scheme.size() + 1);
    if (rest.empty()) return std::nullopt;

    for (size_t i = 0; i < rest.size(); ++i) {
        const auto c = static_cast<unsigned char>(rest[i]);
        if (c <= 0x20 || c == 0x7f) return std::nullopt;
        if (c == '%') {
            if (i + 2 >= rest.size()) return std::nullopt;
            if (!is_hex(rest[i + 1]) || !is_hex(rest[i + 2])) return std::nullopt;
            i += 2;
        }
    }

    return std::string(candidate);
}

std::vector<std::string> extract_deep_links(const std::vector<std::string>& args, std::string_view scheme) {
    std::vector<std::string> links;
    for (const auto& arg : args) {
        if (auto link = parse_deep_link(arg, scheme)) {
            links.push_back(std::move(*link));
        }
    }
    return links;
}

} // namespace statisfy
