#include <iostream>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/logging/logging.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/mounted_share.hpp"
#include "core/destination/destination.hpp"
#include "core/layout/layout.hpp"
#include "core/transfer_engine/transfer_engine.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = shootsync::build_info::GitInfo;
using ARGS = shootsync::args_parser::CLIArgs;

constexpr auto load_from_cli = shootsync::infra::config_from_cli;
constexpr auto load_config_file = shootsync::infra::load_config_from_file;
constexpr auto args_parser = shootsync::args_parser::parse_args;
constexpr auto git =  shootsync::build_info::get_git_info();

static auto
out_git_verse(const GIT& git)
-> void {
    fmt::print("shootsync {}\n", git.commit_short);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
out_args_verse(const ARGS& args, const shootsync::infra::Config& config)
-> void {
    spdlog::debug("Source: {}", args.source);
    spdlog::debug("Name: {}", args.name);
    spdlog::debug("Workers: {}", config.effective_workers());
    spdlog::debug("Queue capacity: {}", config.effective_queue_capacity());
    spdlog::debug("Timeout: {}s", config.effective_timeout().count());
    spdlog::debug("Extensions: {}", config.effective_extensions());
    spdlog::debug("Only: {}", config.only);
}

static auto
out_failure_summary(const std::vector<shootsync::core::TransferFailure>& failures)
-> void {
    fmt::print("\n=== Transfer Error Summary ===\n");
    for (const auto& f : failures) {
        fmt::print("File: {}\n  Destination: {}\n  Error: {}\n\n",
                   f.source_path.string(), f.destination, f.cause.what());
    }
}

static auto
out_stats(const shootsync::core::RunStatsSnapshot& stats)
-> void {
    spdlog::info("Photos found: {}", stats.files_discovered);
    spdlog::info("Copies succeeded: {}, failed: {}", stats.copies_succeeded, stats.copies_failed);
    spdlog::info("Bytes copied: {} ({:.2f} MB)", stats.bytes_copied, stats.bytes_copied / 1024.0 / 1024.0);
    spdlog::info("Date folders: {}", stats.date_folders.size());
    for (const auto& [date, count] : stats.date_folders) {
        spdlog::info("  {}: {} photos", date, count);
    }
    spdlog::info("Time elapsed: {:.2f} seconds", stats.elapsed.count() / 1000.0);
}

int main(int argc, char** argv)
{
    using namespace shootsync;

    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        infra::install_signal_handler();

        int parse_exit = 0;
        auto args_opt = ::args_parser(argc, argv, parse_exit);
        if (!args_opt) {
            return parse_exit; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            out_git_verse(git);
            return infra::kExitSuccess;
        }

        // 1. Загрузить из файла (config.yaml в текущем каталоге, если --config не задан)
        std::optional<std::filesystem::path> config_path;
        if (args.config_path) {
            config_path = *args.config_path;
        } else if (std::error_code ec; std::filesystem::exists("config.yaml", ec)) {
            config_path = "config.yaml";
        }

        auto config_res = load_config_file(config_path);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return infra::kExitFailure;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет
        if (auto valid = infra::validate(config); !valid) {
            spdlog::error("Config error: {}", valid.error());
            return infra::kExitFailure;
        }

        infra::LogOptions log_options;
        log_options.level = config.verbose ? spdlog::level::debug
                          : config.quiet   ? spdlog::level::warn
                                           : spdlog::level::info;
        log_options.log_dir = config.log_dir;
        if (auto log_file = infra::setup_logging(log_options)) {
            spdlog::info("Log file: {}", log_file->string());
        }
        out_args_verse(args, config);

        auto selected = config.selected_destinations();
        if (!selected) {
            spdlog::error("Config error: {}", selected.error());
            return infra::kExitFailure;
        }
        if (selected->empty()) {
            spdlog::error("No destinations configured");
            return infra::kExitFailure;
        }

        const std::filesystem::path source(args.source);
        std::error_code source_ec;
        if (!std::filesystem::is_directory(source, source_ec)) {
            spdlog::error("Source directory does not exist: {}", source.string());
            return infra::kExitFailure;
        }

        const auto folder_name = core::layout::organizing_folder_name(args.name, core::layout::current_year());
        spdlog::info("Starting photo transfer: folder '{}', source {}", folder_name, source.string());

        infra::CancellationController cancellation;

        // Все назначения подключаются заранее; любая ошибка прерывает запуск
        adapters::remote::MountedShareClient client;
        auto destinations = core::connect_all(
            client, *selected,
            std::chrono::duration_cast<std::chrono::milliseconds>(config.effective_timeout()),
            cancellation.token());
        if (!destinations) {
            const auto& err = destinations.error();
            // Отмена во время медленного подключения тоже считается отменой
            if (err.code == infra::ErrorCode::Interrupted || cancellation.cancelled()) {
                spdlog::info("Photo transfer cancelled by user");
                return infra::kExitInterrupted;
            }
            spdlog::error("Failed to establish connections");
            return infra::log_and_return(infra::Error(err)).to_exit_code();
        }

        core::RunResult result;
        {
            infra::ProgressMonitor monitor(config.progress, config.quiet);

            core::EngineOptions options;
            options.workers = config.effective_workers();
            options.queue_capacity = config.effective_queue_capacity();
            options.extensions = config.effective_extensions();

            core::TransferEngine engine(std::move(options), monitor);
            result = engine.run(source, folder_name, *destinations, cancellation.token());
        }

        // Освобождаем соединения и при успехе, и при отмене
        destinations->clear();

        switch (result.outcome()) {
            case core::RunOutcome::Failed:
                spdlog::error("Failed to process photos: {}", result.fatal->message);
                break;
            case core::RunOutcome::Cancelled:
                spdlog::info("Photo transfer cancelled by user");
                out_stats(result.stats);
                if (!result.failures.empty()) {
                    out_failure_summary(result.failures);
                }
                break;
            case core::RunOutcome::CompletedWithErrors:
                out_stats(result.stats);
                spdlog::warn("Transfer completed with errors: {} failed", result.failures.size());
                out_failure_summary(result.failures);
                break;
            case core::RunOutcome::Success:
                out_stats(result.stats);
                spdlog::info("Photo transfer completed successfully");
                break;
        }

        return result.exit_code();
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return shootsync::infra::kExitFailure;
    }
}
