#include "mounted_share.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <future>
#include <system_error>
#include <thread>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shootsync::adapters::remote {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

class MountedShare final : public Share {
public:
    explicit MountedShare(std::filesystem::path root) : root_(std::move(root)) {}

    auto mkdir(std::string_view path) -> infra::Result<MkdirOutcome> override {
        const auto full = root_ / std::filesystem::path(path);
        if (::mkdir(full.c_str(), 0755) == 0) {
            return MkdirOutcome::Created;
        }
        const std::error_code ec(errno, std::generic_category());
        if (ec == std::errc::file_exists) {
            std::error_code st;
            if (std::filesystem::is_directory(full, st)) {
                return MkdirOutcome::AlreadyExists;
            }
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteIo,
                                 fmt::format("{} exists and is not a directory", full.string())));
        }
        return std::unexpected(infra::make_error(ec, fmt::format("mkdir {}", full.string())));
    }

    auto create_and_write(std::string_view path, std::istream& data)
        -> infra::Result<std::uint64_t> override
    {
        const auto full = root_ / std::filesystem::path(path);
        std::ofstream ofs(full, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            const std::error_code ec(errno, std::generic_category());
            return std::unexpected(infra::make_error(ec, fmt::format("Cannot create {}", full.string())));
        }

        std::uint64_t written = 0;
        std::vector<char> buffer(kCopyBufferSize);
        while (data) {
            data.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto n = data.gcount();
            if (n <= 0) break;
            if (!ofs.write(buffer.data(), n)) break;
            written += static_cast<std::uint64_t>(n);
        }
        ofs.flush();

        if (data.bad() || !ofs) {
            ofs.close();
            discard_partial(full);
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteIo,
                                 fmt::format("Write to {} failed after {} bytes", full.string(), written)));
        }
        return written;
    }

    void close() noexcept override {
        spdlog::debug("Releasing mount {}", root_.string());
    }

    auto supports_concurrent_use() const noexcept -> bool override {
        // Каждый вызов открывает собственные дескрипторы в смонтированной ФС
        return true;
    }

private:
    static void discard_partial(const std::filesystem::path& path) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            spdlog::warn("Failed to remove partial file {}: {}", path.string(), ec.message());
        }
    }

    std::filesystem::path root_;
};

class MountedSession final : public Session {
public:
    explicit MountedSession(std::filesystem::path root) : root_(std::move(root)) {}

    auto mount(std::string_view share_name) -> infra::Result<std::unique_ptr<Share>> override {
        std::error_code ec;
        if (!std::filesystem::is_directory(root_, ec)) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                                 fmt::format("Share '{}' is not mounted at {}", share_name, root_.string())));
        }
        return std::make_unique<MountedShare>(root_);
    }

    void logoff() noexcept override {}

private:
    std::filesystem::path root_;
};

// Проверка точки монтирования с ограничением по времени: зависшая сетевая ФС
// блокирует stat(), поэтому проверка идёт в отдельном потоке
auto probe_mount(const std::filesystem::path& root, std::chrono::milliseconds timeout)
    -> infra::VoidResult
{
    auto promise = std::make_shared<std::promise<std::error_code>>();
    auto future = promise->get_future();

    // Поток намеренно не присоединяется: при зависшей точке монтирования он
    // остаётся в stat() до конца процесса, а promise и root живут в его захвате
    std::thread([promise, root] {
        std::error_code ec;
        const bool is_dir = std::filesystem::is_directory(root, ec);
        if (!ec && !is_dir) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        promise->set_value(ec);
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NetworkTimeout,
                             fmt::format("Timed out after {} ms probing {}", timeout.count(), root.string())));
    }
    if (auto ec = future.get()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                             fmt::format("Mount point {} unavailable: {}", root.string(), ec.message())));
    }
    return {};
}

} // namespace

std::filesystem::path default_mount_path(const infra::DestinationConfig& destination) {
    std::filesystem::path runtime_dir;
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR")) {
        runtime_dir = xdg;
    } else {
        runtime_dir = fmt::format("/run/user/{}", ::getuid());
    }
    return runtime_dir / "gvfs" /
           fmt::format("smb-share:server={},share={}", destination.host, destination.share);
}

auto MountedShareClient::connect(const infra::DestinationConfig& destination,
                                 std::chrono::milliseconds timeout)
    -> infra::Result<std::unique_ptr<Session>>
{
    const std::filesystem::path root = destination.mount_path.empty()
        ? default_mount_path(destination)
        : std::filesystem::path(destination.mount_path);

    spdlog::debug("Probing //{}:{}/{} at {}", destination.host, destination.port,
                  destination.share, root.string());

    if (auto probe = probe_mount(root, timeout); !probe) {
        return std::unexpected(std::move(probe.error()));
    }
    return std::make_unique<MountedSession>(root);
}

} // namespace shootsync::adapters::remote
