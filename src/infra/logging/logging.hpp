#pragma once

#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>

namespace shootsync::infra {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::optional<std::filesystem::path> log_dir;   // nullopt: только консоль
};

/// Настраивает логгер по умолчанию: цветной вывод в stderr и,
/// если задан каталог, файл shootsync_YYYYMMDD_HHMMSS.log в нём.
/// Возвращает путь к файлу журнала, если файловый вывод включён.
auto setup_logging(const LogOptions& options) -> std::optional<std::filesystem::path>;

} // namespace shootsync::infra
