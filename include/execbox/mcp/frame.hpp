#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "execbox/core/error.hpp"

namespace execbox::mcp {

using json = nlohmann::json;

/// JSON-RPC 2.0 error codes.
enum class RpcErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

/// Maps an internal error to the JSON-RPC code reported to the client.
auto rpc_code_for(ErrorCode code) -> RpcErrorCode;

/// A JSON-RPC request, or a notification when `id` is empty.
struct RequestFrame {
    std::optional<json> id;
    std::string method;
    json params = json::object();

    [[nodiscard]] auto is_notification() const noexcept -> bool {
        return !id.has_value();
    }
};

void to_json(json& j, const RequestFrame& f);

struct RpcError {
    RpcErrorCode code = RpcErrorCode::InternalError;
    std::string message;
    std::optional<json> data;
};

/// A JSON-RPC response. Exactly one of `result` and `error` is set.
struct ResponseFrame {
    json id;   // null when the request id could not be read
    std::optional<json> result;
    std::optional<RpcError> error;

    [[nodiscard]] auto is_error() const noexcept -> bool {
        return error.has_value();
    }
};

void to_json(json& j, const ResponseFrame& f);
void from_json(const json& j, ResponseFrame& f);

/// Parses one line of input into a request.
/// Malformed JSON fails with SerializationError; valid JSON that is not a
/// JSON-RPC 2.0 request fails with ProtocolError.
auto parse_request(std::string_view data) -> Result<RequestFrame>;

/// Serializes a response as a single line of JSON (no trailing newline).
auto serialize_response(const ResponseFrame& frame) -> std::string;

auto make_response(json id, json result) -> ResponseFrame;

auto make_error_response(json id, RpcErrorCode code, std::string message,
                         std::optional<json> data = std::nullopt) -> ResponseFrame;

/// Error response for an internal Error, with the code mapped by rpc_code_for.
auto make_error_response(json id, const Error& error) -> ResponseFrame;

} // namespace execbox::mcp
