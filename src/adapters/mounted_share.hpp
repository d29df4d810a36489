#pragma once

#include <filesystem>
#include "remote_fs.hpp"

namespace shootsync::adapters::remote {

/// Клиент для шар, смонтированных ядром (mount.cifs) или gvfs.
/// Протокол SMB обслуживает ОС; здесь только проверка доступности точки
/// монтирования и файловые операции внутри неё.
class MountedShareClient final : public Client {
public:
    [[nodiscard]] auto connect(const infra::DestinationConfig& destination,
                               std::chrono::milliseconds timeout)
        -> infra::Result<std::unique_ptr<Session>> override;
};

/// Точка монтирования по умолчанию: $XDG_RUNTIME_DIR/gvfs/smb-share:server=HOST,share=SHARE
[[nodiscard]] auto default_mount_path(const infra::DestinationConfig& destination)
    -> std::filesystem::path;

} // namespace shootsync::adapters::remote
