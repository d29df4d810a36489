#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace shootsync::infra {

enum class ErrorCode {
    // Фатальные ошибки (запуск прерывается до начала передачи)
    FileNotFound,
    PermissionDenied,
    InvalidPath,
    InvalidConfig,
    NoDestinations,
    ConnectionFailed,

    // Восстанавливаемые (фиксируются для пары файл/назначение)
    RemoteIo,
    AlreadyExists,
    MetadataUnavailable,
    Interrupted,

    // Системные
    Unknown,
    NetworkTimeout,
};

// Коды завершения процесса
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitCompletedWithErrors = 2;
inline constexpr int kExitInterrupted = 130; // SIGINT

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    // Добавляет контекст к сообщению, сохраняя код и место возникновения
    [[nodiscard]] auto with_context(std::string_view context) const -> Error;
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Вспомогательные функции-конструкторы
[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Перевод errno / std::error_code в ErrorCode
[[nodiscard]] auto classify(const std::error_code& ec) -> ErrorCode;

[[nodiscard]] auto make_error(
    const std::error_code& ec,
    std::string_view context,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace shootsync::infra
