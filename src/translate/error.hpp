#pragma once

#include <expected>
#include <string>

enum class ErrorCode {
    InvalidArgument,
    NotFound,
    ConversionError,
    ConfigError,
    NetworkError,
    ApiError,
};

struct Error {
    ErrorCode code;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}
