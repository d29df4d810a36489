#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>
#include "../../adapters/remote_fs.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "directory_cache.hpp"

namespace shootsync::core {

/// Установленное соединение с одним назначением и его кэш каталогов.
/// Все методы можно вызывать из нескольких рабочих потоков. Если шара не
/// допускает одновременного использования, удалённые вызовы сериализуются.
class Destination {
public:
    Destination(std::size_t id,
                infra::DestinationConfig config,
                std::unique_ptr<adapters::remote::Session> session,
                std::unique_ptr<adapters::remote::Share> share);
    ~Destination();

    Destination(const Destination&) = delete;
    Destination& operator=(const Destination&) = delete;

    [[nodiscard]] auto id() const noexcept -> std::size_t { return id_; }
    [[nodiscard]] auto label() const -> std::string { return config_.label(); }
    [[nodiscard]] auto base_path() const noexcept -> const std::string& { return config_.base_path; }

    // Создаёт недостающие компоненты пути сверху вниз; "уже существует" - успех
    [[nodiscard]] auto ensure_directory(const std::string& directory) -> infra::VoidResult;

    // Уникальное в пределах запуска имя файла в каталоге
    [[nodiscard]] auto reserve_name(const std::string& directory, const std::string& file_name) -> std::string;

    // Потоковое копирование локального файла по удалённому пути
    [[nodiscard]] auto upload(const std::filesystem::path& source, const std::string& remote_path)
        -> infra::Result<std::uint64_t>;

    // Отмонтирование шары и завершение сессии; повторный вызов ничего не делает
    void release() noexcept;

    [[nodiscard]] auto cache() const noexcept -> const DirectoryCache& { return cache_; }

private:
    template<typename F>
    auto with_share(F&& op) -> decltype(op(std::declval<adapters::remote::Share&>()));

    const std::size_t id_;
    const infra::DestinationConfig config_;
    std::unique_ptr<adapters::remote::Session> session_;
    std::unique_ptr<adapters::remote::Share> share_;
    const bool serialize_;
    std::mutex io_mutex_;
    DirectoryCache cache_;
    NameRegistry names_;
};

using DestinationList = std::vector<std::unique_ptr<Destination>>;

/// Подключается ко всем назначениям по порядку. Любая ошибка прерывает весь
/// запуск: уже подключённые назначения освобождаются.
[[nodiscard]] auto connect_all(adapters::remote::Client& client,
                               const std::vector<infra::DestinationConfig>& configs,
                               std::chrono::milliseconds timeout,
                               std::stop_token st)
    -> infra::Result<DestinationList>;

} // namespace shootsync::core
