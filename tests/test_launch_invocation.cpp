#include <catch2/catch.hpp>
#include "launch_invocation.hpp"
#include <filesystem>

using namespace statisfy;
using namespace std::string_literals;

TEST_CASE("LaunchInvocation captures argv and the working directory", "[invocation]") {
    char arg0[] = "/usr/bin/statisfy";
    char arg1[] = "statisfy://open/1";
    char* argv[] = {arg0, arg1, nullptr};

    const auto invocation = LaunchInvocation::capture(2, argv);
    REQUIRE(invocation.args == std::vector<std::string>{"/usr/bin/statisfy", "statisfy://open/1"});
    REQUIRE(invocation.cwd == std::filesystem::current_path().string());
}

TEST_CASE("Handoff frames", "[invocation]") {
    LaunchInvocation invocation;
    invocation.cwd = "/home/user/music";
    invocation.args = {"/usr/bin/statisfy", "--flag", "statisfy://open/42", ""};

    SECTION("Layout is START, cwd, count, arguments, each NUL terminated") {
        const auto frame = encode_handoff(invocation);
        REQUIRE(frame == "START\0/home/user/music\0" "4\0/usr/bin/statisfy\0--flag\0statisfy://open/42\0\0"s);
    }

    SECTION("Decoding restores arguments, empty ones included") {
        const auto decoded = decode_handoff(encode_handoff(invocation));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->cwd == invocation.cwd);
        REQUIRE(decoded->args == invocation.args);
    }

    SECTION("Arguments with spaces and newlines survive") {
        LaunchInvocation odd;
        odd.args = {"a b", "line1\nline2"};
        const auto decoded = decode_handoff(encode_handoff(odd));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->args == odd.args);
        REQUIRE(decoded->cwd.empty());
    }
}

TEST_CASE("Malformed handoff frames are rejected", "[invocation]") {
    REQUIRE_FALSE(decode_handoff(""));
    REQUIRE_FALSE(decode_handoff("RAISE\n"));
    REQUIRE_FALSE(decode_handoff("START\0/tmp\0"s));
    REQUIRE_FALSE(decode_handoff("START\0/tmp\0x\0"s));
    REQUIRE_FALSE(decode_handoff("START\0/tmp\0" "2\0only-one\0"s));
    REQUIRE_FALSE(decode_handoff("START\0/tmp\0" "1\0a\0trailing"s));
    REQUIRE_FALSE(decode_handoff("START\0/tmp\0" "99999999999999999999\0"s));
    REQUIRE(decode_handoff("START\0/tmp\0" "0\0"s).has_value());
}
