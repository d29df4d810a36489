#pragma once

#include <cstddef>
#include <mutex>
#include <queue>
#include <condition_variable>
#include <optional>
#include <stop_token>
#include <stdexcept>

namespace shootsync::infra {

/// Очередь фиксированной ёмкости между производителем и рабочими потоками.
/// push() блокируется, пока очередь заполнена: это единственный механизм
/// обратного давления. Все ожидания прерываются через std::stop_token.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity);

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // false, если сработала отмена или очередь закрыта; элемент отбрасывается
    [[nodiscard]] auto push(T item, std::stop_token st) -> bool;

    // nullopt, если очередь закрыта и пуста, либо сработала отмена
    [[nodiscard]] auto pop(std::stop_token st) -> std::optional<T>;

    // Больше элементов не будет; ожидающие pop() завершаются после опустошения
    void close();

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }
    [[nodiscard]] auto closed() const -> bool;

private:
    const std::size_t capacity_;
    std::queue<T> items_;
    mutable std::mutex mutex_;
    std::condition_variable_any not_full_;
    std::condition_variable_any not_empty_;
    bool closed_ = false;
};

// =============== Реализация шаблонов ===============

template<typename T>
BoundedQueue<T>::BoundedQueue(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0) {
        throw std::invalid_argument("BoundedQueue capacity must be at least 1");
    }
}

template<typename T>
auto BoundedQueue<T>::push(T item, std::stop_token st) -> bool {
    {
        std::unique_lock lock(mutex_);
        const bool ready = not_full_.wait(lock, st, [this] {
            return closed_ || items_.size() < capacity_;
        });
        if (!ready || closed_) {
            return false;
        }
        items_.push(std::move(item));
    }
    not_empty_.notify_one();
    return true;
}

template<typename T>
auto BoundedQueue<T>::pop(std::stop_token st) -> std::optional<T> {
    std::optional<T> item;
    {
        std::unique_lock lock(mutex_);
        if (st.stop_requested()) {
            return std::nullopt;
        }
        const bool ready = not_empty_.wait(lock, st, [this] {
            return closed_ || !items_.empty();
        });
        if (!ready || items_.empty()) {
            return std::nullopt;
        }
        item.emplace(std::move(items_.front()));
        items_.pop();
    }
    not_full_.notify_one();
    return item;
}

template<typename T>
void BoundedQueue<T>::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

template<typename T>
auto BoundedQueue<T>::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return items_.size();
}

template<typename T>
auto BoundedQueue<T>::closed() const -> bool {
    std::lock_guard lock(mutex_);
    return closed_;
}

} // namespace shootsync::infra
