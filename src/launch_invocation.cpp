#include "launch_invocation.hpp"
#include <charconv>
#include <filesystem>
#include <system_error>

namespace statisfy {

namespace {

constexpr std::string_view kStartToken = "START";
constexpr char kDelimiter = '\0';

// Splits off the next NUL-terminated token, advancing `rest`.
std::optional<std::string_view> next_token(std::string_view& rest) {
    const size_t end = rest.find(kDelimiter);
    if (end == std::string_view::npos) return std::nullopt;
    auto token = rest.substr(0, end);
    rest.remove_prefix(end + 1);
    return token;
}

} // namespace

LaunchInvocation LaunchInvocation::capture(int argc, char* argv[]) {
    LaunchInvocation invocation;
    invocation.args.reserve(argc > 0 ? static_cast<size_t>(argc) : 0);
    for (int i = 0; i < argc; ++i) {
        if (argv[i]) invocation.args.emplace_back(argv[i]);
    }

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        invocation.cwd = cwd.string();
    }
    return invocation;
}

std::string encode_handoff(const LaunchInvocation& invocation) {
    std::string frame;
    frame.append(kStartToken);
    frame.push_back(kDelimiter);
    frame.append(invocation.cwd);
    frame.push_back(kDelimiter);
    frame.append(std::to_string(invocation.args.size()));
    frame.push_back(kDelimiter);
    for (const auto& arg : invocation.args) {
        frame.append(arg);
        frame.push_back(kDelimiter);
    }
    return frame;
}

std::optional<LaunchInvocation> decode_handoff(std::string_view frame) {
    if (frame.size() > kMaxHandoffFrameSize) return std::nullopt;

    auto header = next_token(frame);
    if (!header || *header != kStartToken) return std::nullopt;

    auto cwd = next_token(frame);
    if (!cwd) return std::nullopt;

    auto count_token = next_token(frame);
    if (!count_token || count_token->empty()) return std::nullopt;

    size_t count = 0;
    auto [ptr, ec] = std::from_chars(count_token->data(), count_token->data() + count_token->size(), count);
    if (ec != std::errc{} || ptr != count_token->data() + count_token->size()) return std::nullopt;

    // Every argument costs at least its delimiter
    if (count > frame.size()) return std::nullopt;

    LaunchInvocation invocation;
    invocation.cwd = std::string(*cwd);
    invocation.args.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto arg = next_token(frame);
        if (!arg) return std::nullopt;
        invocation.args.emplace_back(*arg);
    }

    if (!frame.empty()) return std::nullopt;  // trailing garbage
    return invocation;
}

} // namespace statisfy
