#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace shootsync::core {

// Неудачная передача одного файла в одно назначение
struct TransferFailure {
    std::filesystem::path source_path;
    std::size_t destination_id = 0;
    std::string destination;
    infra::Error cause;
};

/// Собирает ошибки от всех рабочих потоков. Запись занимает одну короткую
/// критическую секцию; drain() вызывается после остановки пула.
class ErrorCollector {
public:
    void record(TransferFailure failure);

    [[nodiscard]] auto count() const -> std::size_t;

    // Отсортировано по исходному пути, затем по назначению
    [[nodiscard]] auto drain() -> std::vector<TransferFailure>;

private:
    mutable std::mutex mutex_;
    std::vector<TransferFailure> failures_;
};

} // namespace shootsync::core
