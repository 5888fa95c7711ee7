// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace tinyirc
{

/// @brief Error codes for categorizing failures across the client.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    ConfigError,
    ConnectError,
    TransportError,
    ProtocolError,
    UserInputError,
};

/// @brief Returns a short name for an error code, used in log output.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::ConnectError: return "connect";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::UserInputError: return "input";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace tinyirc

template <>
struct std::formatter<tinyirc::Error>: std::formatter<std::string>
{
    auto format(const tinyirc::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", tinyirc::errorCodeName(error.code), error.message), ctx);
    }
};
