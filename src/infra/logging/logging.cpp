#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/chrono.h>
#include <chrono>
#include <ctime>
#include <memory>
#include <vector>

namespace shootsync::infra {

namespace {

constexpr auto kPattern = "[%Y-%m-%d %H:%M:%S] [%l] %v";

auto log_file_name() -> std::string {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    ::localtime_r(&now, &local);
    return fmt::format("shootsync_{:%Y%m%d_%H%M%S}.log", local);
}

} // namespace

std::optional<std::filesystem::path> setup_logging(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::optional<std::filesystem::path> log_file;
    std::string file_error;

    if (options.log_dir) {
        std::error_code ec;
        std::filesystem::create_directories(*options.log_dir, ec);
        if (ec) {
            file_error = ec.message();
        } else {
            const auto path = *options.log_dir / log_file_name();
            try {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string()));
                log_file = path;
            } catch (const spdlog::spdlog_ex& e) {
                file_error = e.what();
            }
        }
    }

    auto logger = std::make_shared<spdlog::logger>("shootsync", sinks.begin(), sinks.end());
    logger->set_level(options.level);
    logger->set_pattern(kPattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    if (!file_error.empty()) {
        spdlog::warn("File logging disabled, cannot use {}: {}",
                     options.log_dir->string(), file_error);
    }
    return log_file;
}

} // namespace shootsync::infra
