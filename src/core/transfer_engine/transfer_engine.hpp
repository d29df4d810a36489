#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <atomic>
#include <chrono>
#include <stop_token>
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../destination/destination.hpp"
#include "../discovery/discovery.hpp"
#include "../error_collector/error_collector.hpp"

namespace shootsync::core {

struct EngineOptions {
    std::size_t workers = infra::kDefaultWorkers;
    std::size_t queue_capacity = 0;               // 0: равна числу рабочих
    std::vector<std::string> extensions = infra::default_extensions();
};

struct RunStatsSnapshot {
    std::uint64_t files_discovered = 0;
    std::uint64_t copies_succeeded = 0;
    std::uint64_t copies_failed = 0;
    std::uint64_t bytes_copied = 0;
    std::map<std::string, std::uint64_t> date_folders;   // файлов на дату
    std::chrono::milliseconds elapsed{0};
};

struct RunStats {
    std::atomic<std::uint64_t> files_discovered{0};
    std::atomic<std::uint64_t> copies_succeeded{0};
    std::atomic<std::uint64_t> copies_failed{0};
    std::atomic<std::uint64_t> bytes_copied{0};

    RunStats() = default;

    // Запрещаем копирование и перемещение (из-за atomic)
    RunStats(const RunStats&) = delete;
    RunStats& operator=(const RunStats&) = delete;
    RunStats(RunStats&&) = delete;
    RunStats& operator=(RunStats&&) = delete;
};

enum class RunOutcome {
    Success,
    CompletedWithErrors,
    Cancelled,
    Failed,
};

struct RunResult {
    std::vector<TransferFailure> failures;
    std::optional<infra::Error> fatal;     // ошибка до или во время обнаружения
    bool cancelled = false;
    RunStatsSnapshot stats;

    [[nodiscard]] auto outcome() const -> RunOutcome;
    [[nodiscard]] auto exit_code() const -> int;
};

class TransferEngine {
public:
    TransferEngine(EngineOptions options,
                   infra::ProgressMonitor& monitor,
                   TimestampResolver resolver = extensions::read_capture_time);

    /// Обнаружение -> ограниченная очередь -> пул рабочих -> сборщик ошибок.
    /// Назначения должны быть уже подключены; освобождает их вызывающий.
    [[nodiscard]] auto run(const std::filesystem::path& source_root,
                           const std::string& organizing_folder,
                           const DestinationList& destinations,
                           std::stop_token st) -> RunResult;

private:
    void process_job(const TransferJob& job,
                     const DestinationList& destinations,
                     ErrorCollector& errors,
                     RunStats& stats,
                     std::stop_token st);

    EngineOptions options_;
    infra::ProgressMonitor& monitor_;
    TimestampResolver resolver_;
};

} // namespace shootsync::core
