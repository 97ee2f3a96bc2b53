#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "execbox/core/error.hpp"

namespace execbox::tools {

using json = nlohmann::json;
using boost::asio::awaitable;

/// Describes a single parameter for a tool.
struct ToolParameter {
    std::string name;
    std::string type;         // JSON Schema type: "string", "integer", "boolean", ...
    std::string description;
    bool required = true;
    std::optional<json> default_value;
};

/// Name, description and parameters of a tool, as advertised to MCP clients.
struct ToolDefinition {
    std::string name;
    std::string description;
    std::vector<ToolParameter> parameters;

    /// JSON Schema object describing the parameters.
    [[nodiscard]] auto input_schema() const -> json;

    /// MCP tools/list entry: {name, description, inputSchema}.
    [[nodiscard]] auto to_json() const -> json;
};

/// Abstract base class for tools exposed over MCP.
///
/// Each tool provides a definition and an execute method that performs the
/// tool's action asynchronously.
class Tool {
public:
    virtual ~Tool() = default;

    [[nodiscard]] virtual auto definition() const -> ToolDefinition = 0;

    /// Execute the tool with the given arguments.
    /// Returns the tool result as JSON, or an error.
    virtual auto execute(json params) -> awaitable<Result<json>> = 0;
};

} // namespace execbox::tools
