#include "error.hpp"
#include <fmt/core.h>

namespace shootsync::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::FileNotFound:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidPath:
        case ErrorCode::InvalidConfig:
        case ErrorCode::NoDestinations:
        case ErrorCode::ConnectionFailed:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    // Ошибки отдельных пар не завершают процесс: код 2 выдаёт RunResult
    return code == ErrorCode::Interrupted ? kExitInterrupted : kExitFailure;
}

const char* Error::what() const {
    return message.c_str();
}

Error Error::with_context(std::string_view context) const {
    Error err = *this;
    err.message = fmt::format("{}: {}", context, message);
    return err;
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::FileNotFound:        return "file not found";
        case ErrorCode::PermissionDenied:    return "permission denied";
        case ErrorCode::InvalidPath:         return "invalid path";
        case ErrorCode::InvalidConfig:       return "invalid config";
        case ErrorCode::NoDestinations:      return "no destinations";
        case ErrorCode::ConnectionFailed:    return "connection failed";
        case ErrorCode::RemoteIo:            return "remote i/o error";
        case ErrorCode::AlreadyExists:       return "already exists";
        case ErrorCode::MetadataUnavailable: return "metadata unavailable";
        case ErrorCode::Interrupted:         return "interrupted";
        case ErrorCode::NetworkTimeout:      return "network timeout";
        case ErrorCode::Unknown:             break;
    }
    return "unknown error";
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

ErrorCode classify(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory) return ErrorCode::FileNotFound;
    if (ec == std::errc::permission_denied ||
        ec == std::errc::operation_not_permitted)   return ErrorCode::PermissionDenied;
    if (ec == std::errc::file_exists)               return ErrorCode::AlreadyExists;
    if (ec == std::errc::timed_out)                 return ErrorCode::NetworkTimeout;
    if (ec == std::errc::not_a_directory ||
        ec == std::errc::filename_too_long ||
        ec == std::errc::invalid_argument)          return ErrorCode::InvalidPath;
    if (ec.category() == std::generic_category() ||
        ec.category() == std::system_category())    return ErrorCode::RemoteIo;
    return ErrorCode::Unknown;
}

Error make_error(const std::error_code& ec, std::string_view context,
                 const std::source_location& loc) {
    return Error{classify(ec), fmt::format("{}: {}", context, ec.message()), loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace shootsync::infra
