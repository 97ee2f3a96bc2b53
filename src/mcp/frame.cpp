#include "execbox/mcp/frame.hpp"

namespace execbox::mcp {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

auto protocol_error(std::string message) -> Error {
    return make_error(ErrorCode::ProtocolError, std::move(message));
}

} // anonymous namespace

auto rpc_code_for(ErrorCode code) -> RpcErrorCode {
    switch (code) {
        case ErrorCode::SerializationError: return RpcErrorCode::ParseError;
        case ErrorCode::ProtocolError: return RpcErrorCode::InvalidRequest;
        case ErrorCode::NotFound: return RpcErrorCode::MethodNotFound;
        case ErrorCode::InvalidArgument: return RpcErrorCode::InvalidParams;
        default: return RpcErrorCode::InternalError;
    }
}

// -- RequestFrame serialization --

void to_json(json& j, const RequestFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"method", f.method},
        {"params", f.params},
    };
    if (f.id) j["id"] = *f.id;
}

// -- ResponseFrame serialization --

void to_json(json& j, const ResponseFrame& f) {
    j = json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", f.id},
    };
    if (f.error) {
        json err{
            {"code", static_cast<int>(f.error->code)},
            {"message", f.error->message},
        };
        if (f.error->data) err["data"] = *f.error->data;
        j["error"] = std::move(err);
    } else {
        j["result"] = f.result.value_or(json::object());
    }
}

void from_json(const json& j, ResponseFrame& f) {
    f.id = j.value("id", json(nullptr));
    if (j.contains("result")) f.result = j.at("result");
    if (j.contains("error")) {
        const auto& err = j.at("error");
        RpcError e;
        e.code = static_cast<RpcErrorCode>(err.at("code").get<int>());
        e.message = err.value("message", "");
        if (err.contains("data")) e.data = err.at("data");
        f.error = std::move(e);
    }
}

// -- Request parsing --

auto parse_request(std::string_view data) -> Result<RequestFrame> {
    json j;
    try {
        j = json::parse(data);
    } catch (const json::parse_error& e) {
        return std::unexpected(
            make_error(ErrorCode::SerializationError,
                       "Parse error", e.what()));
    }

    if (!j.is_object()) {
        return std::unexpected(protocol_error("Request must be a JSON object"));
    }
    if (!j.contains("jsonrpc") || j["jsonrpc"] != kJsonRpcVersion) {
        return std::unexpected(protocol_error("Missing or unsupported jsonrpc version"));
    }
    if (!j.contains("method") || !j["method"].is_string()) {
        return std::unexpected(protocol_error("Request method must be a string"));
    }

    RequestFrame f;
    f.method = j["method"].get<std::string>();

    if (j.contains("id")) {
        const auto& id = j["id"];
        if (!id.is_string() && !id.is_number_integer() && !id.is_null()) {
            return std::unexpected(protocol_error("Request id must be a string or integer"));
        }
        f.id = id;
    }

    if (j.contains("params")) {
        const auto& params = j["params"];
        if (!params.is_object() && !params.is_array()) {
            return std::unexpected(protocol_error("Request params must be an object or array"));
        }
        f.params = params;
    }

    return f;
}

auto serialize_response(const ResponseFrame& frame) -> std::string {
    json j = frame;
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// -- Factory helpers --

auto make_response(json id, json result) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::move(result),
        .error = std::nullopt,
    };
}

auto make_error_response(json id, RpcErrorCode code, std::string message,
                         std::optional<json> data) -> ResponseFrame {
    return ResponseFrame{
        .id = std::move(id),
        .result = std::nullopt,
        .error = RpcError{
            .code = code,
            .message = std::move(message),
            .data = std::move(data),
        },
    };
}

auto make_error_response(json id, const Error& error) -> ResponseFrame {
    std::optional<json> data;
    if (!error.detail().empty()) {
        data = json{{"detail", std::string(error.detail())}};
    }
    return make_error_response(std::move(id), rpc_code_for(error.code()),
                               std::string(error.message()), std::move(data));
}

} // namespace execbox::mcp
