// metadata.cpp
#include <array>
#include <cstddef>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <optional>
#include <string>
#include <fmt/core.h>
#include "metadata.hpp"

namespace shootsync::extensions {

namespace {

constexpr std::uint16_t kTagDateTime          = 0x0132;
constexpr std::uint16_t kTagExifIfdPointer    = 0x8769;
constexpr std::uint16_t kTagDateTimeOriginal  = 0x9003;
constexpr std::uint16_t kTagDateTimeDigitized = 0x9004;
constexpr std::uint16_t kTypeAscii = 2;
constexpr std::uint16_t kMaxIfdEntries = 1024;

// Чтение TIFF-структуры по смещениям относительно начала заголовка
class TiffReader {
public:
    TiffReader(std::ifstream& in, std::streamoff base) : in_(in), base_(base) {}

    auto read_header() -> std::optional<std::uint32_t> {
        std::array<char, 2> order{};
        if (!read_raw(0, order.data(), order.size())) return std::nullopt;
        if (order[0] == 'I' && order[1] == 'I') little_ = true;
        else if (order[0] == 'M' && order[1] == 'M') little_ = false;
        else return std::nullopt;

        auto magic = u16(2);
        // 42 - TIFF, "RO"/"RS" - Olympus ORF, 0x55 - Panasonic RW2
        if (!magic || (*magic != 42 && *magic != 0x4F52 && *magic != 0x5352 && *magic != 0x55)) {
            return std::nullopt;
        }
        return u32(4);
    }

    struct Entry {
        std::uint16_t type = 0;
        std::uint32_t count = 0;
        std::uint32_t value = 0;
    };

    auto find_entry(std::uint32_t ifd_offset, std::uint16_t tag) -> std::optional<Entry> {
        auto count = u16(ifd_offset);
        if (!count || *count > kMaxIfdEntries) return std::nullopt;

        for (std::uint16_t i = 0; i < *count; ++i) {
            const std::uint32_t off = ifd_offset + 2 + i * 12u;
            auto entry_tag = u16(off);
            if (!entry_tag) return std::nullopt;
            if (*entry_tag != tag) continue;

            auto type = u16(off + 2);
            auto n = u32(off + 4);
            auto value = u32(off + 8);
            if (!type || !n || !value) return std::nullopt;
            return Entry{*type, *n, *value};
        }
        return std::nullopt;
    }

    auto ascii(const Entry& entry) -> std::optional<std::string> {
        if (entry.type != kTypeAscii || entry.count == 0 || entry.count > 64) return std::nullopt;
        std::string text(entry.count, '\0');
        if (entry.count <= 4) {
            // Значение лежит прямо в поле смещения
            for (std::uint32_t i = 0; i < entry.count; ++i) {
                text[i] = static_cast<char>(little_ ? (entry.value >> (8 * i)) & 0xFF
                                                    : (entry.value >> (8 * (3 - i))) & 0xFF);
            }
        } else if (!read_raw(entry.value, text.data(), text.size())) {
            return std::nullopt;
        }
        if (auto nul = text.find('\0'); nul != std::string::npos) text.resize(nul);
        return text;
    }

    auto u16(std::uint32_t off) -> std::optional<std::uint16_t> {
        std::array<char, 2> b{};
        if (!read_raw(off, b.data(), b.size())) return std::nullopt;
        return static_cast<std::uint16_t>(assemble(b));
    }

    auto u32(std::uint32_t off) -> std::optional<std::uint32_t> {
        std::array<char, 4> b{};
        if (!read_raw(off, b.data(), b.size())) return std::nullopt;
        return assemble(b);
    }

private:
    // Сборка числа из байтов с учётом порядка байт файла
    template<std::size_t N>
    auto assemble(const std::array<char, N>& b) const -> std::uint32_t {
        std::uint32_t value = 0;
        for (std::size_t i = 0; i < N; ++i) {
            const auto byte = static_cast<std::uint32_t>(static_cast<unsigned char>(b[little_ ? N - 1 - i : i]));
            value = (value << 8) | byte;
        }
        return value;
    }

    auto read_raw(std::uint32_t off, char* out, std::size_t n) -> bool {
        in_.clear();
        in_.seekg(base_ + static_cast<std::streamoff>(off));
        return static_cast<bool>(in_.read(out, static_cast<std::streamsize>(n)));
    }

    std::ifstream& in_;
    std::streamoff base_;
    bool little_ = true;
};

// Ищет сегмент APP1 "Exif\0\0" и возвращает смещение TIFF-заголовка в файле
auto find_jpeg_exif(std::ifstream& in) -> std::optional<std::streamoff> {
    in.clear();
    in.seekg(2);
    while (in) {
        int byte = in.get();
        if (byte != 0xFF) return std::nullopt;
        int marker = in.get();
        while (marker == 0xFF) marker = in.get();
        if (marker == std::ifstream::traits_type::eof() || marker == 0xD9 || marker == 0xDA) return std::nullopt;
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) continue;

        const int hi = in.get();
        const int lo = in.get();
        if (hi == std::ifstream::traits_type::eof() || lo == std::ifstream::traits_type::eof()) return std::nullopt;
        const int length = (hi << 8) | lo;
        if (length < 2) return std::nullopt;
        const std::streamoff data_start = in.tellg();

        if (marker == 0xE1 && length >= 8) {
            std::array<char, 6> ident{};
            in.read(ident.data(), ident.size());
            if (in && std::string_view(ident.data(), ident.size()) == std::string_view("Exif\0\0", 6)) {
                return data_start + 6;
            }
        }
        in.clear();
        in.seekg(data_start + length - 2);
    }
    return std::nullopt;
}

auto extract_datetime(TiffReader& tiff, std::uint32_t ifd0) -> std::optional<std::string> {
    if (auto exif_ptr = tiff.find_entry(ifd0, kTagExifIfdPointer)) {
        for (auto tag : {kTagDateTimeOriginal, kTagDateTimeDigitized}) {
            if (auto entry = tiff.find_entry(exif_ptr->value, tag)) {
                if (auto text = tiff.ascii(*entry)) return text;
            }
        }
    }
    if (auto entry = tiff.find_entry(ifd0, kTagDateTime)) {
        return tiff.ascii(*entry);
    }
    return std::nullopt;
}

auto parse_number(std::string_view text, std::size_t pos, std::size_t len) -> std::optional<int> {
    int value = 0;
    for (std::size_t i = pos; i < pos + len; ++i) {
        if (text[i] < '0' || text[i] > '9') return std::nullopt;
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // namespace

auto parse_exif_datetime(std::string_view text) -> infra::Result<LocalTime>
{
    using namespace std::chrono;

    auto invalid = [&] {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataUnavailable,
                               fmt::format("Malformed EXIF date '{}'", text)));
    };

    if (text.size() < 19) return invalid();
    auto y = parse_number(text, 0, 4);
    auto mo = parse_number(text, 5, 2);
    auto d = parse_number(text, 8, 2);
    auto h = parse_number(text, 11, 2);
    auto mi = parse_number(text, 14, 2);
    auto s = parse_number(text, 17, 2);
    if (!y || !mo || !d || !h || !mi || !s) return invalid();

    const year_month_day ymd{year{*y}, month{static_cast<unsigned>(*mo)}, day{static_cast<unsigned>(*d)}};
    if (!ymd.ok() || *h > 23 || *mi > 59 || *s > 60) return invalid();

    return local_days{ymd} + hours{*h} + minutes{*mi} + seconds{*s};
}

auto read_capture_time(const std::filesystem::path& path) -> infra::Result<LocalTime>
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                             fmt::format("Cannot open {} for metadata", path.string())));
    }

    std::array<char, 2> magic{};
    if (!in.read(magic.data(), static_cast<std::streamsize>(magic.size()))) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataUnavailable,
                             fmt::format("{} is too short for metadata", path.string())));
    }

    std::optional<std::streamoff> tiff_base;
    if (static_cast<unsigned char>(magic[0]) == 0xFF && static_cast<unsigned char>(magic[1]) == 0xD8) {
        tiff_base = find_jpeg_exif(in);
    } else if ((magic[0] == 'I' && magic[1] == 'I') || (magic[0] == 'M' && magic[1] == 'M')) {
        tiff_base = 0;
    }

    if (!tiff_base) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataUnavailable,
                             fmt::format("No EXIF block in {}", path.string())));
    }

    TiffReader tiff(in, *tiff_base);
    auto ifd0 = tiff.read_header();
    if (!ifd0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataUnavailable,
                             fmt::format("Invalid TIFF header in {}", path.string())));
    }

    auto text = extract_datetime(tiff, *ifd0);
    if (!text) {
        return std::unexpected(infra::make_error(infra::ErrorCode::MetadataUnavailable,
                             fmt::format("No capture date in {}", path.string())));
    }
    return parse_exif_datetime(*text);
}

auto file_modified_time(const std::filesystem::path& path) -> infra::Result<LocalTime>
{
    using namespace std::chrono;

    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::unexpected(infra::make_error(ec, fmt::format("Cannot stat {}", path.string())));
    }

    const auto sys = time_point_cast<seconds>(file_clock::to_sys(ftime));
    const std::time_t tt = system_clock::to_time_t(sys);
    std::tm local{};
    if (::localtime_r(&tt, &local) == nullptr) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Cannot convert modification time of {}", path.string())));
    }

    const year_month_day ymd{year{local.tm_year + 1900},
                             month{static_cast<unsigned>(local.tm_mon + 1)},
                             day{static_cast<unsigned>(local.tm_mday)}};
    return local_days{ymd} + hours{local.tm_hour} + minutes{local.tm_min} + seconds{local.tm_sec};
}

} // namespace shootsync::extensions
