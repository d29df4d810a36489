#pragma once

#include <cstddef>
#include <functional>
#include <thread>
#include <vector>
#include <atomic>
#include <exception>
#include <spdlog/spdlog.h>

namespace shootsync::infra {

/// Фиксированный набор рабочих потоков, каждый выполняет один и тот же цикл
/// (обычно: брать задания из очереди, пока она не закрыта и не пуста).
class WorkerPool {
public:
    using Body = std::function<void(std::size_t worker_id)>;
    using OnLost = std::function<void()>;

    // on_all_lost вызывается, если последний работающий поток завершился исключением
    WorkerPool(std::size_t nthreads, Body body, OnLost on_all_lost = {});
    ~WorkerPool();

    // Удалить копирование и присваивание
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Блокирующее ожидание завершения всех потоков
    void join();

    [[nodiscard]] auto size() const noexcept -> std::size_t { return workers_.size(); }
    [[nodiscard]] auto active() const noexcept -> std::size_t {
        return active_.load(std::memory_order_acquire);
    }

private:
    Body body_;
    OnLost on_all_lost_;
    std::vector<std::jthread> workers_;
    std::atomic<std::size_t> active_{0}; // Счётчик работающих потоков
};

} // namespace shootsync::infra

namespace shootsync::infra {

inline WorkerPool::WorkerPool(std::size_t nthreads, Body body, OnLost on_all_lost)
    : body_(std::move(body))
    , on_all_lost_(std::move(on_all_lost))
{
    if (nthreads == 0) nthreads = 1;
    workers_.reserve(nthreads);
    active_.store(nthreads, std::memory_order_release);

    for (std::size_t i = 0; i < nthreads; ++i) {
        workers_.emplace_back([this, i] {
            bool lost = false;
            try {
                body_(i);
            } catch (const std::exception& e) {
                spdlog::error("Worker {} terminated: {}", i, e.what());
                lost = true;
            }
            const auto remaining = active_.fetch_sub(1, std::memory_order_acq_rel) - 1;
            if (lost && remaining == 0 && on_all_lost_) {
                on_all_lost_();
            }
        });
    }
}

inline WorkerPool::~WorkerPool() {
    join();
}

inline void WorkerPool::join() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace shootsync::infra
