#pragma once

#include <string>

#include "execbox/mcp/protocol.hpp"
#include "execbox/tools/tool_registry.hpp"

namespace execbox::mcp {

inline constexpr const char* kDefaultProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "ExecBoxMCP";

struct ServerInfo {
    std::string name = kServerName;
    std::string version;
};

/// Wraps a tool's JSON output as an MCP tools/call result. Arrays are
/// placed under "result" in structuredContent, which must be an object.
auto make_tool_call_result(const json& value, bool is_error) -> json;

/// Registers initialize, notifications/initialized, ping, tools/list and
/// tools/call.
void register_mcp_handlers(Protocol& protocol, tools::ToolRegistry& tools,
                           ServerInfo info);

} // namespace execbox::mcp
