#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <thread>

namespace shootsync::infra {

class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t expected_copies = 0;
        std::uint64_t completed_copies = 0;
        std::uint64_t failed_copies = 0;
        std::uint64_t expected_bytes = 0;
        std::uint64_t transferred_bytes = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    // Общий объём растёт по мере обнаружения файлов
    void add_expected(std::uint64_t copies, std::uint64_t bytes);
    void copy_succeeded(std::uint64_t bytes);
    void copy_failed();

    [[nodiscard]] auto get_stats() const -> Stats;

private:
    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    // Атомики для thread-safe обновления
    std::atomic<std::uint64_t> expected_copies_{0};
    std::atomic<std::uint64_t> completed_copies_{0};
    std::atomic<std::uint64_t> failed_copies_{0};
    std::atomic<std::uint64_t> expected_bytes_{0};
    std::atomic<std::uint64_t> transferred_bytes_{0};

    const bool enabled_;
    const bool quiet_;
    std::chrono::steady_clock::time_point start_time_;
    mutable std::atomic<bool> shutdown_{false};
    mutable std::unique_ptr<std::jthread> render_thread_;
};

} // namespace shootsync::infra
