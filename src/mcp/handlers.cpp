#include "execbox/mcp/handlers.hpp"

#include "execbox/core/logger.hpp"

namespace execbox::mcp {

namespace {

auto invalid_params(std::string message, std::string detail = "") -> Error {
    return make_error(ErrorCode::InvalidArgument, std::move(message), std::move(detail));
}

} // anonymous namespace

auto make_tool_call_result(const json& value, bool is_error) -> json {
    // Command output may hold invalid UTF-8; dump must not throw on it.
    auto text = value.is_string()
        ? value.get<std::string>()
        : value.dump(2, ' ', false, json::error_handler_t::replace);
    json text_block{
        {"type", "text"},
        {"text", std::move(text)},
    };

    json result{
        {"content", json::array({std::move(text_block)})},
        {"isError", is_error},
    };
    if (value.is_object()) {
        result["structuredContent"] = value;
    } else if (value.is_array()) {
        result["structuredContent"] = json{{"result", value}};
    }
    return result;
}

void register_mcp_handlers(Protocol& protocol, tools::ToolRegistry& tools,
                           ServerInfo info) {
    // initialize
    protocol.register_method("initialize",
        [info](json params) -> awaitable<Result<json>> {
            std::string version = kDefaultProtocolVersion;
            if (params.is_object() && params.contains("protocolVersion") &&
                params["protocolVersion"].is_string()) {
                version = params["protocolVersion"].get<std::string>();
            }

            if (params.is_object() && params.contains("clientInfo") &&
                params["clientInfo"].is_object()) {
                const auto& client = params["clientInfo"];
                LOG_INFO("Client connected: {} {}",
                         client.value("name", "unknown"), client.value("version", ""));
            }

            co_return json{
                {"protocolVersion", version},
                {"capabilities", {{"tools", {{"listChanged", false}}}}},
                {"serverInfo", {{"name", info.name}, {"version", info.version}}},
            };
        },
        "Negotiate protocol version and capabilities");

    // notifications/initialized
    protocol.register_method("notifications/initialized",
        []([[maybe_unused]] json params) -> awaitable<Result<json>> {
            LOG_DEBUG("Client finished initialization");
            co_return json::object();
        },
        "Client finished initialization");

    // ping
    protocol.register_method("ping",
        []([[maybe_unused]] json params) -> awaitable<Result<json>> {
            co_return json::object();
        },
        "Liveness check");

    // tools/list
    protocol.register_method("tools/list",
        [&tools]([[maybe_unused]] json params) -> awaitable<Result<json>> {
            co_return json{{"tools", tools.to_json()}};
        },
        "List available tools");

    // tools/call
    protocol.register_method("tools/call",
        [&tools](json params) -> awaitable<Result<json>> {
            if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
                co_return make_fail(invalid_params("Tool name must be a string"));
            }
            auto name = params["name"].get<std::string>();
            if (!tools.contains(name)) {
                co_return make_fail(invalid_params("Unknown tool", name));
            }

            json arguments = json::object();
            if (params.contains("arguments") && !params["arguments"].is_null()) {
                if (!params["arguments"].is_object()) {
                    co_return make_fail(invalid_params("Tool arguments must be an object", name));
                }
                arguments = params["arguments"];
            }

            LOG_INFO("Tool call: {}", name);
            auto result = co_await tools.execute(name, std::move(arguments));
            if (!result) {
                co_return make_tool_call_result(json(result.error().what()), true);
            }
            co_return make_tool_call_result(*result, false);
        },
        "Invoke a tool");
}

} // namespace execbox::mcp
