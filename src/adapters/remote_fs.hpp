#pragma once

#include <chrono>
#include <cstdint>
#include <istream>
#include <memory>
#include <string_view>
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"

namespace shootsync::adapters::remote {

enum class MkdirOutcome {
    Created,
    AlreadyExists,   // не ошибка: другой поток или прошлый запуск успел раньше
};

/// Смонтированная шара. Пути относительные, разделитель '/'.
class Share {
public:
    virtual ~Share() = default;

    [[nodiscard]] virtual auto mkdir(std::string_view path)
        -> infra::Result<MkdirOutcome> = 0;

    // Создаёт (или перезаписывает) файл и копирует в него поток; возвращает число байт
    [[nodiscard]] virtual auto create_and_write(std::string_view path, std::istream& data)
        -> infra::Result<std::uint64_t> = 0;

    virtual void close() noexcept = 0;

    // Можно ли вызывать методы одновременно из нескольких потоков
    [[nodiscard]] virtual auto supports_concurrent_use() const noexcept -> bool { return false; }
};

/// Аутентифицированная сессия с удалённым хостом.
class Session {
public:
    virtual ~Session() = default;

    [[nodiscard]] virtual auto mount(std::string_view share_name)
        -> infra::Result<std::unique_ptr<Share>> = 0;

    virtual void logoff() noexcept = 0;
};

/// Точка входа клиента удалённой файловой системы.
class Client {
public:
    virtual ~Client() = default;

    [[nodiscard]] virtual auto connect(const infra::DestinationConfig& destination,
                                       std::chrono::milliseconds timeout)
        -> infra::Result<std::unique_ptr<Session>> = 0;
};

} // namespace shootsync::adapters::remote
