// include/shootsync/extensions/metadata.hpp
#pragma once

#include <chrono>
#include <filesystem>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace shootsync::extensions {

// Время по часам камеры / локальное время файловой системы (без часового пояса)
using LocalTime = std::chrono::local_seconds;

/// Дата съёмки из EXIF (DateTimeOriginal, затем DateTimeDigitized, затем DateTime).
/// Поддерживаются JPEG (APP1) и TIFF-контейнеры RAW (NEF, CR2, DNG, ARW, ORF, RW2...).
[[nodiscard]] auto read_capture_time(const std::filesystem::path& path)
    -> infra::Result<LocalTime>;

/// Время последней модификации файла в локальном времени.
[[nodiscard]] auto file_modified_time(const std::filesystem::path& path)
    -> infra::Result<LocalTime>;

/// Разбор строки EXIF вида "YYYY:MM:DD HH:MM:SS".
[[nodiscard]] auto parse_exif_datetime(std::string_view text)
    -> infra::Result<LocalTime>;

} // namespace shootsync::extensions
