#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statisfy {

// Arguments and working directory a process was started with.
struct LaunchInvocation {
    std::vector<std::string> args;  // includes argv[0]
    std::string cwd;

    static LaunchInvocation capture(int argc, char* argv[]);
};

// Handoff frame: "START\0<cwd>\0<argc>\0<arg0>\0...<argN-1>\0"
[[nodiscard]] std::string encode_handoff(const LaunchInvocation& invocation);
[[nodiscard]] std::optional<LaunchInvocation> decode_handoff(std::string_view frame);

inline constexpr std::size_t kMaxHandoffFrameSize = 1024 * 1024;

} // namespace statisfy
