#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace execbox {

/// Failure categories. Policy denials are not errors: they are reported as
/// negative ValidationResult / ExecutionResult values.
enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,       // config file unreadable or a policy field malformed
    InvalidArgument,     // bad tool arguments or request params
    NotFound,            // unknown tool or RPC method
    Forbidden,
    Timeout,
    ProtocolError,       // valid JSON that is not a JSON-RPC 2.0 request
    SerializationError,  // input that is not JSON at all
    IoError,
    SpawnFailed,         // the interpreter could not be started
    InternalError,
};

/// An error code, a short message, and an optional detail (usually the
/// offending value or the OS error text).
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    /// "message: detail", or just the message.
    [[nodiscard]] auto what() const -> std::string {
        return detail_.empty() ? message_ : message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Upper-case name used in log lines.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::Forbidden: return "FORBIDDEN";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::ProtocolError: return "PROTOCOL_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::SpawnFailed: return "SPAWN_FAILED";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        case ErrorCode::Unknown: break;
    }
    return "UNKNOWN";
}

// Coroutines return errors through this wrapper: GCC 14 hits an internal
// compiler error on `co_return std::unexpected(...)` (GCC bug 112341). The
// conversion to Result<T> happens outside the coroutine frame.
struct Fail {
    Error error;

    explicit Fail(Error e) : error(std::move(e)) {}

    template <typename T>
    operator Result<T>() && { return std::unexpected(std::move(error)); }
};

inline auto make_fail(Error e) -> Fail { return Fail(std::move(e)); }

} // namespace execbox
