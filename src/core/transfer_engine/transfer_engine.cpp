#include "transfer_engine.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/thread_pool/bounded_queue.hpp"
#include "../../infra/thread_pool/worker_pool.hpp"
#include "../layout/layout.hpp"

namespace shootsync::core {

namespace {

struct CopiedFile {
    std::string remote_path;
    std::uint64_t bytes = 0;
};

// Один шаг: каталог, имя, копирование в одно назначение
auto transfer_to(Destination& dest, const TransferJob& job, const std::string& file_name)
    -> infra::Result<CopiedFile>
{
    const auto remote_dir = layout::remote_directory(dest.base_path(), job.organizing_folder, job.timestamp);
    if (auto dir = dest.ensure_directory(remote_dir); !dir) {
        return std::unexpected(std::move(dir.error()));
    }

    const auto remote_name = dest.reserve_name(remote_dir, file_name);
    auto remote_path = layout::join_remote_path({remote_dir, remote_name});

    spdlog::debug("Copying {} to {}:{}", file_name, dest.label(), remote_path);
    auto copied = dest.upload(job.source_path, remote_path);
    if (!copied) {
        return std::unexpected(std::move(copied.error()));
    }
    return CopiedFile{std::move(remote_path), *copied};
}

} // namespace

auto RunResult::outcome() const -> RunOutcome {
    if (fatal) return RunOutcome::Failed;
    if (cancelled) return RunOutcome::Cancelled;
    if (!failures.empty()) return RunOutcome::CompletedWithErrors;
    return RunOutcome::Success;
}

auto RunResult::exit_code() const -> int {
    switch (outcome()) {
        case RunOutcome::Success:             return infra::kExitSuccess;
        case RunOutcome::CompletedWithErrors: return infra::kExitCompletedWithErrors;
        case RunOutcome::Cancelled:           return infra::kExitInterrupted;
        case RunOutcome::Failed:              break;
    }
    return fatal ? fatal->to_exit_code() : infra::kExitFailure;
}

TransferEngine::TransferEngine(EngineOptions options,
                               infra::ProgressMonitor& monitor,
                               TimestampResolver resolver)
    : options_(std::move(options))
    , monitor_(monitor)
    , resolver_(std::move(resolver))
{
    if (options_.workers == 0) options_.workers = 1;
    if (options_.queue_capacity == 0) options_.queue_capacity = options_.workers;
}

auto TransferEngine::run(const std::filesystem::path& source_root,
                         const std::string& organizing_folder,
                         const DestinationList& destinations,
                         std::stop_token st) -> RunResult
{
    RunResult result;
    const auto start_time = std::chrono::steady_clock::now();

    if (destinations.empty()) {
        result.fatal = infra::make_error(infra::ErrorCode::NoDestinations, "No destinations configured");
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(source_root, ec)) {
        result.fatal = ec
            ? infra::make_error(ec, fmt::format("Cannot access source {}", source_root.string()))
            : infra::make_error(infra::ErrorCode::InvalidPath,
                                fmt::format("Source {} is not a directory", source_root.string()));
        return result;
    }

    spdlog::info("Transferring {} to {} destination(s) with {} workers (queue capacity {})",
                 organizing_folder, destinations.size(), options_.workers, options_.queue_capacity);

    infra::BoundedQueue<TransferJob> queue{options_.queue_capacity};
    ErrorCollector errors;
    RunStats stats;

    std::optional<infra::Result<DiscoveryStats>> discovery_result;
    std::atomic<bool> workers_lost{false};
    {
        infra::WorkerPool pool{options_.workers,
            [&](std::size_t worker_id) {
                spdlog::debug("Worker {} started", worker_id);
                while (auto job = queue.pop(st)) {
                    process_job(*job, destinations, errors, stats, st);
                }
                spdlog::debug("Worker {} finished", worker_id);
            },
            [&] {
                // Некому разбирать очередь: обнаружение не должно ждать вечно
                workers_lost = true;
                queue.close();
            }};
        // Рабочие не должны остаться в ожидании, даже если обход бросит исключение
        struct CloseOnExit {
            infra::BoundedQueue<TransferJob>& queue;
            ~CloseOnExit() { queue.close(); }
        } close_guard{queue};

        FileDiscovery discovery{options_.extensions, resolver_};
        discovery_result = discovery.walk(source_root, organizing_folder,
            [&](TransferJob job) {
                const auto date = layout::date_folder(job.timestamp);
                const auto size = job.size;
                if (!queue.push(std::move(job), st)) {
                    return false;
                }
                stats.files_discovered.fetch_add(1, std::memory_order_relaxed);
                ++result.stats.date_folders[date];
                monitor_.add_expected(destinations.size(), size * destinations.size());
                return true;
            },
            st);

        // Закрываем очередь только после полной остановки обнаружения
        queue.close();
        pool.join();
    }

    if (!*discovery_result && discovery_result->error().code != infra::ErrorCode::Interrupted) {
        result.fatal = discovery_result->error();
    } else if (workers_lost) {
        result.fatal = infra::make_error(infra::ErrorCode::Unknown, "All transfer workers terminated");
    }

    spdlog::debug("{} transfer failure(s) recorded", errors.count());
    result.failures = errors.drain();
    result.cancelled = st.stop_requested();
    result.stats.files_discovered = stats.files_discovered.load();
    result.stats.copies_succeeded = stats.copies_succeeded.load();
    result.stats.copies_failed = stats.copies_failed.load();
    result.stats.bytes_copied = stats.bytes_copied.load();
    result.stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    return result;
}

void TransferEngine::process_job(const TransferJob& job,
                                 const DestinationList& destinations,
                                 ErrorCollector& errors,
                                 RunStats& stats,
                                 std::stop_token st)
{
    const auto file_name = job.source_path.filename().string();

    for (const auto& dest : destinations) {
        if (st.stop_requested()) {
            spdlog::debug("Cancelled before copying {} to {}", file_name, dest->label());
            return;
        }

        infra::Result<CopiedFile> copied;
        try {
            copied = transfer_to(*dest, job, file_name);
        } catch (const std::exception& e) {
            // Исключение из клиента считается ошибкой пары файл/назначение
            copied = std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                fmt::format("unexpected error: {}", e.what())));
        }

        if (!copied) {
            auto cause = std::move(copied.error());
            spdlog::error("Failed to transfer {} to {}: {}", job.source_path.string(), dest->label(), cause.what());
            stats.copies_failed.fetch_add(1, std::memory_order_relaxed);
            monitor_.copy_failed();
            errors.record(TransferFailure{
                .source_path = job.source_path,
                .destination_id = dest->id(),
                .destination = dest->label(),
                .cause = std::move(cause),
            });
            continue;
        }

        stats.copies_succeeded.fetch_add(1, std::memory_order_relaxed);
        stats.bytes_copied.fetch_add(copied->bytes, std::memory_order_relaxed);
        monitor_.copy_succeeded(copied->bytes);
        spdlog::info("Transferred {} to {} as {}", file_name, dest->label(), copied->remote_path);
    }
}

} // namespace shootsync::core
