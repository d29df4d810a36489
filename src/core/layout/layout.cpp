#include "layout.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fmt/core.h>

namespace shootsync::core::layout {

std::string organizing_folder_name(std::string_view shoot_name, int year) {
    return fmt::format("{} - {}", year, shoot_name);
}

int current_year() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    ::localtime_r(&now, &local);
    return local.tm_year + 1900;
}

std::string date_folder(extensions::LocalTime timestamp) {
    const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(timestamp)};
    return fmt::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

std::vector<std::string> split_remote_path(std::string_view path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

std::string join_remote_path(std::initializer_list<std::string_view> parts) {
    std::string out;
    for (auto part : parts) {
        for (auto& segment : split_remote_path(part)) {
            if (!out.empty()) out.push_back('/');
            out += segment;
        }
    }
    return out;
}

std::string remote_directory(std::string_view base_path,
                             std::string_view organizing_folder,
                             extensions::LocalTime timestamp) {
    const auto date = date_folder(timestamp);
    return join_remote_path({base_path, organizing_folder, date});
}

std::string numbered_name(std::string_view file_name, unsigned n) {
    if (n == 0) return std::string(file_name);
    const std::filesystem::path p{file_name};
    return fmt::format("{}_{}{}", p.stem().string(), n, p.extension().string());
}

} // namespace shootsync::core::layout
