#include "interrupt.hpp"
#include <spdlog/spdlog.h>

namespace shootsync::infra {

std::atomic<bool> g_interrupted{false};

namespace {

// Только async-signal-safe операции; логирование делает слушатель
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

} // namespace

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

CancellationController::CancellationController(std::chrono::milliseconds poll_interval)
    : listener_([this, poll_interval](std::stop_token st) {
        while (!st.stop_requested() && !source_.stop_requested()) {
            if (is_interrupted()) {
                spdlog::warn("Received interrupt signal. Shutting down gracefully...");
                source_.request_stop();
                break;
            }
            std::this_thread::sleep_for(poll_interval);
        }
    })
{}

CancellationController::~CancellationController() {
    listener_.request_stop();
    // jthread сам выполнит join
}

} // namespace shootsync::infra
