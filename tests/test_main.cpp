#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>

int main(int argc, char* argv[]) {
    // Quiet by default; SPDLOG_LEVEL=debug shows the library's logging
    spdlog::set_level(spdlog::level::off);
    spdlog::cfg::load_env_levels();

    return Catch::Session().run(argc, argv);
}
