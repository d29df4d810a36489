#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace shootsync::core {

/// Множество удалённых каталогов, о которых известно, что они существуют.
/// Записи не удаляются до конца запуска.
class DirectoryCache {
public:
    [[nodiscard]] auto contains(const std::string& path) const -> bool;

    // true, если путь добавлен впервые
    auto insert(const std::string& path) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> paths_;
};

/// Имена файлов, уже выданные в каждом удалённом каталоге за этот запуск.
/// Два исходных файла с одинаковым именем получают IMG.jpg, IMG_1.jpg, ...
class NameRegistry {
public:
    [[nodiscard]] auto reserve(const std::string& directory, const std::string& file_name) -> std::string;

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::unordered_set<std::string>> used_;
};

} // namespace shootsync::core
