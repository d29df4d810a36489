#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>
#include "../../extensions/metadata.hpp"

namespace shootsync::core::layout {

// "<год> - <название>", например "2025 - Wedding"
[[nodiscard]] auto organizing_folder_name(std::string_view shoot_name, int year) -> std::string;

// Текущий год по локальному времени
[[nodiscard]] auto current_year() -> int;

// "YYYY-MM-DD"
[[nodiscard]] auto date_folder(extensions::LocalTime timestamp) -> std::string;

// Компоненты удалённого пути без пустых сегментов; '\\' считается разделителем
[[nodiscard]] auto split_remote_path(std::string_view path) -> std::vector<std::string>;

// Соединяет части через '/', без ведущего и завершающего разделителя
[[nodiscard]] auto join_remote_path(std::initializer_list<std::string_view> parts) -> std::string;

// base_path/organizing_folder/date_folder(timestamp)
[[nodiscard]] auto remote_directory(std::string_view base_path,
                                    std::string_view organizing_folder,
                                    extensions::LocalTime timestamp) -> std::string;

// "IMG_1.jpg" для n = 1; n = 0 возвращает имя без изменений
[[nodiscard]] auto numbered_name(std::string_view file_name, unsigned n) -> std::string;

} // namespace shootsync::core::layout
