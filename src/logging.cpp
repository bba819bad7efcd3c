#include "logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <system_error>
#include <vector>

namespace statisfy {

void init_logging(const AppConfig& config, bool log_to_stderr) {
    std::vector<spdlog::sink_ptr> sinks;

    if (log_to_stderr) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    std::string file_error;
    if (!config.state_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.state_dir, ec);
        try {
            const auto file = (config.state_dir / (config.identity + ".log")).string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 3)); // 1MB * 3
        } catch (const spdlog::spdlog_ex& e) {
            file_error = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>(config.identity, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::flush_on(spdlog::level::warn);
    spdlog::cfg::load_env_levels();

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled: {}", file_error);
    }
    spdlog::debug("Logging started");
}

} // namespace statisfy
