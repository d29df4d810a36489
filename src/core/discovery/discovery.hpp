#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>
#include <vector>
#include "../../extensions/metadata.hpp"
#include "../../infra/error_handler/error.hpp"

namespace shootsync::core {

// Один найденный снимок; создаётся обнаружением, обрабатывается ровно одним рабочим
struct TransferJob {
    std::filesystem::path source_path;
    std::string organizing_folder;
    extensions::LocalTime timestamp{};
    std::uint64_t size = 0;
};

struct DiscoveryStats {
    std::uint64_t files_queued = 0;
    std::uint64_t files_skipped = 0;   // не подходящее расширение
    std::uint64_t warnings = 0;        // непрочитанные записи
};

using TimestampResolver = std::function<infra::Result<extensions::LocalTime>(const std::filesystem::path&)>;

// Принимает задание; false означает, что поставить его не удалось (отмена)
using JobSink = std::function<bool(TransferJob)>;

class FileDiscovery {
public:
    explicit FileDiscovery(std::vector<std::string> recognized,
                           TimestampResolver resolver = extensions::read_capture_time);

    [[nodiscard]] auto matches(const std::filesystem::path& path) const -> bool;

    /// Обходит дерево в глубину и передаёт в sink по заданию на каждый
    /// подходящий файл. Ошибки отдельных записей логируются и пропускаются.
    /// Недоступный корень - фатальная ошибка; отмена - ErrorCode::Interrupted.
    [[nodiscard]] auto walk(const std::filesystem::path& root,
                            const std::string& organizing_folder,
                            const JobSink& sink,
                            std::stop_token st) -> infra::Result<DiscoveryStats>;

private:
    [[nodiscard]] auto resolve_timestamp(const std::filesystem::path& path) const
        -> infra::Result<extensions::LocalTime>;

    std::vector<std::string> extensions_;
    TimestampResolver resolver_;
};

} // namespace shootsync::core
