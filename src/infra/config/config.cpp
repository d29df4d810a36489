#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <set>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace shootsync::infra {

    std::string DestinationConfig::label() const {
        if (!name.empty()) return name;
        return fmt::format("{}/{}", host, share);
    }

    void Config::merge_with(const Config& other) {
        if (!other.destinations.empty()) destinations = other.destinations;
        if (!other.only.empty()) only = other.only;
        if (other.workers) workers = other.workers;
        if (other.queue_capacity) queue_capacity = other.queue_capacity;
        if (other.timeout) timeout = other.timeout;
        if (!other.extensions.empty()) extensions = other.extensions;
        if (other.log_dir) log_dir = other.log_dir;
        if (other.progress) progress = true;
        if (other.verbose) verbose = true;
        if (other.quiet) quiet = true;
    }

    std::uint32_t Config::effective_workers() const {
        return workers.value_or(kDefaultWorkers);
    }

    std::uint32_t Config::effective_queue_capacity() const {
        // По умолчанию буфер равен числу рабочих потоков
        return queue_capacity.value_or(effective_workers());
    }

    std::chrono::seconds Config::effective_timeout() const {
        return timeout.value_or(kDefaultTimeout);
    }

    std::vector<std::string> Config::effective_extensions() const {
        return extensions.empty() ? default_extensions() : extensions;
    }

    auto Config::selected_destinations() const
        -> std::expected<std::vector<DestinationConfig>, std::string>
    {
        if (only.empty()) return destinations;

        std::vector<DestinationConfig> selected;
        for (const auto& dest : destinations) {
            if (std::find(only.begin(), only.end(), dest.label()) != only.end()) {
                selected.push_back(dest);
            }
        }
        for (const auto& wanted : only) {
            auto it = std::find_if(destinations.begin(), destinations.end(),
                                   [&](const DestinationConfig& d) { return d.label() == wanted; });
            if (it == destinations.end()) {
                return std::unexpected(fmt::format("Unknown destination '{}' in --only", wanted));
            }
        }
        return selected;
    }

    const std::vector<std::string>& default_extensions() {
        static const std::vector<std::string> exts{
            ".jpg", ".jpeg", ".png", ".cr2", ".cr3", ".nef", ".arw", ".dng", ".orf",
            ".rw2", ".raw", ".raf", ".heic", ".tif", ".tiff", ".gif", ".bmp",
        };
        return exts;
    }

    std::string expand_env(std::string_view value) {
        std::string out;
        out.reserve(value.size());

        auto is_name_char = [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
        };
        auto lookup = [](const std::string& var) -> std::string {
            const char* v = std::getenv(var.c_str());
            return v ? std::string(v) : std::string{};
        };

        for (std::size_t i = 0; i < value.size(); ++i) {
            if (value[i] != '$' || i + 1 >= value.size()) {
                out.push_back(value[i]);
                continue;
            }
            if (value[i + 1] == '{') {
                auto close = value.find('}', i + 2);
                if (close == std::string_view::npos) {
                    out.append(value.substr(i));
                    break;
                }
                out += lookup(std::string(value.substr(i + 2, close - i - 2)));
                i = close;
                continue;
            }
            std::size_t end = i + 1;
            while (end < value.size() && is_name_char(value[end])) ++end;
            if (end == i + 1) {
                out.push_back('$');
                continue;
            }
            out += lookup(std::string(value.substr(i + 1, end - i - 1)));
            i = end - 1;
        }
        return out;
    }

    static auto normalize_extension(std::string ext) -> std::string {
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
        return ext;
    }

    static auto parse_destination(const YAML::Node& node, std::size_t index)
        -> std::expected<DestinationConfig, std::string>
    {
        if (!node.IsMap()) {
            return std::unexpected(fmt::format("destination #{} is not a mapping", index));
        }

        DestinationConfig dest{};
        if (node["name"]) dest.name = node["name"].as<std::string>();
        if (node["host"]) dest.host = node["host"].as<std::string>();
        if (node["share"]) dest.share = node["share"].as<std::string>();
        if (node["username"]) dest.username = expand_env(node["username"].as<std::string>());
        if (node["password"]) dest.password = expand_env(node["password"].as<std::string>());
        if (node["domain"]) dest.domain = expand_env(node["domain"].as<std::string>());
        if (node["base_path"]) dest.base_path = node["base_path"].as<std::string>();
        if (node["mount_path"]) dest.mount_path = expand_env(node["mount_path"].as<std::string>());

        if (node["port"]) {
            const auto port = node["port"].as<int>();
            // 0 в конфиге означает порт по умолчанию
            if (port == 0) {
                dest.port = kDefaultSmbPort;
            } else if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
                return std::unexpected(fmt::format("destination #{}: port {} out of range", index, port));
            } else {
                dest.port = static_cast<std::uint16_t>(port);
            }
        }

        if (dest.host.empty() || dest.share.empty()) {
            return std::unexpected(fmt::format("destination #{}: 'host' and 'share' are required", index));
        }
        return dest;
    }

    auto parse_config(const YAML::Node& root) -> std::expected<Config, std::string> {
        Config cfg{};
        if (!root || root.IsNull()) return cfg;

        try {
            if (!root.IsMap()) {
                return std::unexpected("top-level YAML node must be a mapping");
            }

            // smb_shares - прежнее имя ключа
            YAML::Node dests = root["destinations"] ? root["destinations"] : root["smb_shares"];
            if (dests) {
                if (!dests.IsSequence()) {
                    return std::unexpected("'destinations' must be a sequence");
                }
                for (std::size_t i = 0; i < dests.size(); ++i) {
                    auto dest = parse_destination(dests[i], i);
                    if (!dest) return std::unexpected(dest.error());
                    cfg.destinations.push_back(std::move(*dest));
                }
            }

            if (root["workers"]) cfg.workers = root["workers"].as<std::uint32_t>();
            if (root["queue_capacity"]) cfg.queue_capacity = root["queue_capacity"].as<std::uint32_t>();
            if (root["timeout_seconds"]) {
                cfg.timeout = std::chrono::seconds(root["timeout_seconds"].as<std::uint32_t>());
            }
            if (root["log_dir"]) cfg.log_dir = std::filesystem::path(root["log_dir"].as<std::string>());
            if (root["progress"]) cfg.progress = root["progress"].as<bool>();

            if (root["extensions"]) {
                for (const auto& ext : root["extensions"]) {
                    cfg.extensions.push_back(normalize_extension(ext.as<std::string>()));
                }
            }
        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("invalid value: {}", e.what()));
        }

        return cfg;
    }

    auto parse_config_string(const std::string& yaml) -> std::expected<Config, std::string> {
        try {
            return parse_config(YAML::Load(yaml));
        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse YAML: {}", e.what()));
        }
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".shootsync.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "shootsync" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "shootsync" / "config.yaml");
            }
        }

        return paths;
    }

    static auto load_file(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node root = YAML::LoadFile(path.string());
            auto cfg = parse_config(root);
            if (!cfg) {
                return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), cfg.error()));
            }
            spdlog::debug("Loaded config from {}", path.string());
            return cfg;
        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
        -> std::expected<Config, std::string>
    {
        if (explicit_path) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(*explicit_path, ec)) {
                return std::unexpected(fmt::format("Config file not found: {}", explicit_path->string()));
            }
            return load_file(*explicit_path);
        }

        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_file(path);
        }

        // Файл не найден: пустой конфиг, не ошибка
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.workers = args.workers;
        cfg.queue_capacity = args.queue_capacity;
        if (args.timeout_seconds) cfg.timeout = std::chrono::seconds(*args.timeout_seconds);
        if (args.log_dir) cfg.log_dir = std::filesystem::path(*args.log_dir);
        cfg.only = args.only;
        cfg.progress = args.progress;
        cfg.verbose = args.verbose;
        cfg.quiet = args.quiet;
        return cfg;
    }

    auto validate(const Config& config) -> std::expected<void, std::string> {
        if (config.workers && *config.workers == 0) {
            return std::unexpected("workers must be at least 1");
        }
        if (config.queue_capacity && *config.queue_capacity == 0) {
            return std::unexpected("queue_capacity must be at least 1");
        }
        if (config.timeout && config.timeout->count() <= 0) {
            return std::unexpected("timeout_seconds must be positive");
        }

        std::set<std::string> labels;
        for (const auto& dest : config.destinations) {
            if (!labels.insert(dest.label()).second) {
                return std::unexpected(fmt::format("duplicate destination '{}'", dest.label()));
            }
        }
        return {};
    }

} // namespace shootsync::infra
