// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace agentmesh
{

/// @brief Error codes for categorizing failures across the library.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    StoreError,
    ConflictError,
    NamingConflict,
    NotFound,
    TransportError,
    ProtocolError,
    ToolCallError,
    InferenceError,
};

/// @brief Returns a short, stable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid-argument";
        case ErrorCode::IoError: return "io";
        case ErrorCode::ConfigError: return "config";
        case ErrorCode::StoreError: return "store";
        case ErrorCode::ConflictError: return "conflict";
        case ErrorCode::NamingConflict: return "naming-conflict";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::TransportError: return "transport";
        case ErrorCode::ProtocolError: return "protocol";
        case ErrorCode::ToolCallError: return "tool-call";
        case ErrorCode::InferenceError: return "inference";
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

} // namespace agentmesh

template <>
struct std::formatter<agentmesh::Error>: std::formatter<std::string>
{
    auto format(const agentmesh::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", agentmesh::errorCodeName(error.code), error.message), ctx);
    }
};
