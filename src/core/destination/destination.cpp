#include "destination.hpp"
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../layout/layout.hpp"

namespace shootsync::core {

Destination::Destination(std::size_t id,
                         infra::DestinationConfig config,
                         std::unique_ptr<adapters::remote::Session> session,
                         std::unique_ptr<adapters::remote::Share> share)
    : id_(id)
    , config_(std::move(config))
    , session_(std::move(session))
    , share_(std::move(share))
    , serialize_(!share_->supports_concurrent_use())
{
    if (serialize_) {
        spdlog::debug("Destination {} does not allow concurrent use; remote calls are serialized", label());
    }
}

Destination::~Destination() {
    release();
}

template<typename F>
auto Destination::with_share(F&& op) -> decltype(op(std::declval<adapters::remote::Share&>())) {
    if (serialize_) {
        std::lock_guard lock(io_mutex_);
        return op(*share_);
    }
    return op(*share_);
}

auto Destination::ensure_directory(const std::string& directory) -> infra::VoidResult {
    if (cache_.contains(directory)) {
        return {};
    }

    std::string current;
    for (const auto& part : layout::split_remote_path(directory)) {
        current = current.empty() ? part : current + "/" + part;
        if (cache_.contains(current)) continue;

        // Оптимистичное создание без предварительной проверки существования
        auto res = with_share([&](adapters::remote::Share& share) { return share.mkdir(current); });
        if (!res) {
            return std::unexpected(res.error().with_context(
                fmt::format("creating directory {}", current)));
        }
        if (*res == adapters::remote::MkdirOutcome::Created) {
            spdlog::info("Created directory {} on {}", current, label());
        } else {
            spdlog::debug("Directory {} already exists on {}", current, label());
        }
        cache_.insert(current);
    }
    return {};
}

std::string Destination::reserve_name(const std::string& directory, const std::string& file_name) {
    return names_.reserve(directory, file_name);
}

auto Destination::upload(const std::filesystem::path& source, const std::string& remote_path)
    -> infra::Result<std::uint64_t>
{
    std::ifstream ifs(source, std::ios::binary);
    if (!ifs) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                             fmt::format("Cannot open source file {}", source.string())));
    }

    auto res = with_share([&](adapters::remote::Share& share) {
        return share.create_and_write(remote_path, ifs);
    });
    if (!res) {
        return std::unexpected(res.error().with_context(fmt::format("copying to {}", remote_path)));
    }
    return res;
}

void Destination::release() noexcept {
    if (share_) {
        spdlog::info("Unmounting share {}", label());
        share_->close();
        share_.reset();
    }
    if (session_) {
        session_->logoff();
        session_.reset();
    }
}

auto connect_all(adapters::remote::Client& client,
                 const std::vector<infra::DestinationConfig>& configs,
                 std::chrono::milliseconds timeout,
                 std::stop_token st)
    -> infra::Result<DestinationList>
{
    if (configs.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::NoDestinations,
                                                 "No destinations configured"));
    }

    // При выходе с ошибкой деструкторы освободят уже подключённые назначения
    DestinationList destinations;
    destinations.reserve(configs.size());

    for (std::size_t i = 0; i < configs.size(); ++i) {
        const auto& cfg = configs[i];
        if (st.stop_requested()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                                     "Interrupted while connecting"));
        }

        spdlog::info("Establishing connection {} to {} ({}:{}/{})", i, cfg.label(), cfg.host, cfg.port, cfg.share);

        auto session = client.connect(cfg, timeout);
        if (!session) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                fmt::format("connecting to destination {} ({}): {}", i, cfg.label(), session.error().message)));
        }

        auto share = (*session)->mount(cfg.share);
        if (!share) {
            (*session)->logoff();
            return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                fmt::format("mounting share {} on destination {} ({}): {}",
                            cfg.share, i, cfg.label(), share.error().message)));
        }

        destinations.push_back(std::make_unique<Destination>(
            i, cfg, std::move(*session), std::move(*share)));
        spdlog::info("Connected to {}", cfg.label());
    }

    return destinations;
}

} // namespace shootsync::core
