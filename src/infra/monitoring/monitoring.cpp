#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iostream>
#include <thread>

namespace shootsync::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
        render_thread_.reset(); // join
    }
    if (enabled_ && !quiet_) {
        render_();
        std::cerr << "\n"; // финальный перенос
    }
}

void ProgressMonitor::add_expected(std::uint64_t copies, std::uint64_t bytes) {
    expected_copies_ += copies;
    expected_bytes_ += bytes;
}

void ProgressMonitor::copy_succeeded(std::uint64_t bytes) {
    completed_copies_ += 1;
    transferred_bytes_ += bytes;
}

void ProgressMonitor::copy_failed() {
    completed_copies_ += 1;
    failed_copies_ += 1;
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .expected_copies = expected_copies_.load(),
        .completed_copies = completed_copies_.load(),
        .failed_copies = failed_copies_.load(),
        .expected_bytes = expected_bytes_.load(),
        .transferred_bytes = transferred_bytes_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested() && !shutdown_.load()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    shutdown_.store(true);
    if (render_thread_) {
        render_thread_->request_stop();
    }
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return;

    auto stats = get_stats();
    if (stats.expected_copies == 0) return;

    const double progress = static_cast<double>(stats.completed_copies) / stats.expected_copies;
    const int bar_width = 20;
    const int filled = std::min(bar_width, static_cast<int>(progress * bar_width));

    // Скорость (байт/сек)
    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double speed = elapsed_sec > 0 ? stats.transferred_bytes / elapsed_sec : 0.0;

    const char* unit = "B/s";
    if (speed > 1024*1024*1024) { speed /= 1024*1024*1024; unit = "GB/s"; }
    else if (speed > 1024*1024) { speed /= 1024*1024; unit = "MB/s"; }
    else if (speed > 1024) { speed /= 1024; unit = "KB/s"; }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) bar += i < filled ? "█" : "░";

    // Очистка строки и вывод в stderr, чтобы не смешиваться со сводкой
    std::cerr << "\r\033[K";
    fmt::print(stderr,
        "[{}] {:.1f} {} | {}/{} copies | {} failed",
        bar,
        speed, unit,
        stats.completed_copies,
        stats.expected_copies,
        stats.failed_copies
    );
    std::cerr << std::flush;
}

} // namespace shootsync::infra
