#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace strata {

enum class ErrorKind {
    ExternalCommandFailure,
    ParseFailure,
    LayerConflict,
    LayerMissing,
    MountVerificationFailure,
    ConfigurationError,
    InvalidArgument,
    IoFailure,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::ExternalCommandFailure:
        return "external command failure";
    case ErrorKind::ParseFailure:
        return "parse failure";
    case ErrorKind::LayerConflict:
        return "layer conflict";
    case ErrorKind::LayerMissing:
        return "layer missing";
    case ErrorKind::MountVerificationFailure:
        return "mount verification failure";
    case ErrorKind::ConfigurationError:
        return "configuration error";
    case ErrorKind::InvalidArgument:
        return "invalid argument";
    case ErrorKind::IoFailure:
        return "I/O failure";
    }
    return "unknown error";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Shorthand for returning a failed `Result`.
 *
 * @code
 * return fail(ErrorKind::ParseFailure, "Cannot parse version from {}", line);
 * @endcode
 */
template <typename... Args>
std::unexpected<Error> fail(ErrorKind kind, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...)});
}

} // namespace strata

template <>
struct std::formatter<strata::Error> : std::formatter<std::string> {
    auto format(const strata::Error &err, std::format_context &ctx) const {
        return std::formatter<std::string>::format(std::format("{}: {}", strata::to_string(err.kind), err.message),
                                                   ctx);
    }
};
