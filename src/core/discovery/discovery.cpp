#include "discovery.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace shootsync::core {

namespace fs = std::filesystem;

namespace {

auto lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto interrupted() -> infra::Error {
    return infra::make_error(infra::ErrorCode::Interrupted, "Discovery interrupted");
}

} // namespace

FileDiscovery::FileDiscovery(std::vector<std::string> recognized, TimestampResolver resolver)
    : extensions_(std::move(recognized))
    , resolver_(std::move(resolver))
{
    for (auto& ext : extensions_) {
        ext = lower(std::move(ext));
    }
}

// Расширение от последней точки имени: у ".jpg" это ".jpg", а не пустая строка
bool FileDiscovery::matches(const fs::path& path) const {
    const auto name = path.filename().string();
    const auto dot = name.rfind('.');
    if (dot == std::string::npos) return false;
    const auto ext = lower(name.substr(dot));
    return std::find(extensions_.begin(), extensions_.end(), ext) != extensions_.end();
}

auto FileDiscovery::resolve_timestamp(const fs::path& path) const
    -> infra::Result<extensions::LocalTime>
{
    if (resolver_) {
        auto ts = resolver_(path);
        if (ts) return ts;
        spdlog::debug("No capture date for {} ({}), using modification time",
                      path.string(), ts.error().message);
    }
    return extensions::file_modified_time(path);
}

auto FileDiscovery::walk(const fs::path& root,
                         const std::string& organizing_folder,
                         const JobSink& sink,
                         std::stop_token st) -> infra::Result<DiscoveryStats>
{
    DiscoveryStats stats;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(ec, fmt::format("Cannot access source {}", root.string())));
        }
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Source {} is not a directory", root.string())));
    }

    spdlog::info("Scanning {} for photos", root.string());

    std::vector<fs::path> pending{root};
    while (!pending.empty()) {
        if (st.stop_requested()) return std::unexpected(interrupted());

        const fs::path dir = std::move(pending.back());
        pending.pop_back();

        fs::directory_iterator it(dir, ec);
        if (ec) {
            if (dir == root) {
                return std::unexpected(infra::make_error(ec, fmt::format("Cannot read source {}", root.string())));
            }
            spdlog::warn("Error accessing path {}: {}", dir.string(), ec.message());
            ++stats.warnings;
            continue;
        }

        std::vector<fs::directory_entry> entries;
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            entries.push_back(*it);
        }
        if (ec) {
            spdlog::warn("Error listing {}: {}", dir.string(), ec.message());
            ++stats.warnings;
        }
        std::sort(entries.begin(), entries.end());

        std::vector<fs::path> subdirs;
        for (const auto& entry : entries) {
            if (st.stop_requested()) return std::unexpected(interrupted());

            std::error_code entry_ec;
            const bool is_link = entry.is_symlink(entry_ec);
            const auto status = entry.status(entry_ec);
            if (entry_ec || !fs::exists(status)) {
                spdlog::warn("Error accessing path {}: {}", entry.path().string(),
                             entry_ec ? entry_ec.message() : std::string("broken symlink"));
                ++stats.warnings;
                continue;
            }

            if (fs::is_directory(status)) {
                // Симлинки на каталоги не обходим: возможны циклы
                if (!is_link) subdirs.push_back(entry.path());
                continue;
            }
            if (!fs::is_regular_file(status) || !matches(entry.path())) {
                spdlog::debug("Skipping {}", entry.path().string());
                ++stats.files_skipped;
                continue;
            }

            auto timestamp = resolve_timestamp(entry.path());
            if (!timestamp) {
                spdlog::warn("Cannot determine date of {}: {}", entry.path().string(), timestamp.error().message);
                ++stats.warnings;
                continue;
            }

            std::error_code size_ec;
            const auto size = entry.file_size(size_ec);

            spdlog::info("Processing photo {}", entry.path().string());
            TransferJob job{
                .source_path = entry.path(),
                .organizing_folder = organizing_folder,
                .timestamp = *timestamp,
                .size = size_ec ? 0 : static_cast<std::uint64_t>(size),
            };

            // Блокируется, пока очередь заполнена (обратное давление)
            if (!sink(std::move(job))) {
                return std::unexpected(interrupted());
            }
            ++stats.files_queued;
        }

        // Обратный порядок, чтобы подкаталоги обходились по алфавиту
        pending.insert(pending.end(), subdirs.rbegin(), subdirs.rend());
    }

    spdlog::info("Found {} photos ({} other files skipped)", stats.files_queued, stats.files_skipped);
    return stats;
}

} // namespace shootsync::core
