#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <chrono>

namespace YAML {
class Node;
}

namespace shootsync::args_parser {
    struct CLIArgs;
}

namespace shootsync::infra {

inline constexpr std::uint16_t kDefaultSmbPort = 445;
inline constexpr std::uint32_t kDefaultWorkers = 4;
inline constexpr std::chrono::seconds kDefaultTimeout{30};

// Одно удалённое назначение (хост + шара + базовый путь + учётные данные)
struct DestinationConfig {
    std::string name;            // для --only и отчётов; по умолчанию host/share
    std::string host;
    std::uint16_t port = kDefaultSmbPort;
    std::string share;
    std::string username;
    std::string password;
    std::string domain;
    std::string base_path;       // путь внутри шары
    std::string mount_path;      // локальная точка монтирования шары (cifs/gvfs)

    [[nodiscard]] auto label() const -> std::string;
};

struct Config {
    // Назначения
    std::vector<DestinationConfig> destinations;
    std::vector<std::string> only;            // выбор назначений по имени

    // Параллелизм
    std::optional<std::uint32_t> workers;
    std::optional<std::uint32_t> queue_capacity;
    std::optional<std::chrono::seconds> timeout;

    // Обнаружение файлов
    std::vector<std::string> extensions;

    // Вывод
    std::optional<std::filesystem::path> log_dir;
    bool progress = false;
    bool verbose = false;
    bool quiet = false;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_workers() const -> std::uint32_t;
    [[nodiscard]] auto effective_queue_capacity() const -> std::uint32_t;
    [[nodiscard]] auto effective_timeout() const -> std::chrono::seconds;
    [[nodiscard]] auto effective_extensions() const -> std::vector<std::string>;

    // Назначения с учётом фильтра --only, в исходном порядке
    [[nodiscard]] auto selected_destinations() const
        -> std::expected<std::vector<DestinationConfig>, std::string>;
};

/// Расширения снимков, распознаваемые по умолчанию (в нижнем регистре, с точкой).
[[nodiscard]] auto default_extensions() -> const std::vector<std::string>&;

/// Подставляет $VAR и ${VAR} из окружения; неизвестные переменные дают пустую строку.
[[nodiscard]] auto expand_env(std::string_view value) -> std::string;

/// Разбирает уже загруженный YAML-документ.
[[nodiscard]] auto parse_config(const YAML::Node& root) -> std::expected<Config, std::string>;

/// Разбирает YAML из строки (удобно для тестов).
[[nodiscard]] auto parse_config_string(const std::string& yaml) -> std::expected<Config, std::string>;

/// Загружает конфигурацию из файла YAML.
/// Если путь задан явно, файл обязан существовать. Иначе ищет в порядке:
///   1. ./.shootsync.yaml
///   2. $XDG_CONFIG_HOME/shootsync/config.yaml или ~/.config/shootsync/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

/// Проверяет согласованность итоговой конфигурации.
[[nodiscard]] auto validate(const Config& config) -> std::expected<void, std::string>;

} // namespace shootsync::infra
