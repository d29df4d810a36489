#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <stop_token>
#include <thread>

namespace shootsync::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Единственный сигнал отмены на запуск.
/// Фоновый поток переводит флаг из обработчика сигнала в request_stop(),
/// так что все точки ожидания видят отмену через std::stop_token.
class CancellationController {
public:
    explicit CancellationController(
        std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));
    ~CancellationController();

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    [[nodiscard]] auto token() const noexcept -> std::stop_token { return source_.get_token(); }
    [[nodiscard]] auto cancelled() const noexcept -> bool { return source_.stop_requested(); }

private:
    std::stop_source source_;
    std::jthread listener_;
};

} // namespace shootsync::infra
