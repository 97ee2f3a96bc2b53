#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>

#include "execbox/core/error.hpp"
#include "execbox/tools/tool.hpp"

namespace execbox::tools {

/// Holds the tools served over MCP.
///
/// Tools are registered by name and can be looked up, listed, or executed
/// by name. The registry owns all registered tool instances and lists them
/// in registration order.
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;

    /// Register a tool. The registry takes ownership. A tool with the same
    /// name is replaced in place.
    void register_tool(std::unique_ptr<Tool> tool);

    /// Look up a tool by name. Returns nullptr if not found.
    [[nodiscard]] auto get(std::string_view name) -> Tool*;
    [[nodiscard]] auto get(std::string_view name) const -> const Tool*;

    [[nodiscard]] auto list() const -> std::vector<ToolDefinition>;

    /// Definitions as MCP tools/list entries.
    [[nodiscard]] auto to_json() const -> std::vector<json>;

    /// Execute a tool by name. Fails with NotFound for an unknown name.
    auto execute(std::string_view name, json params) -> awaitable<Result<json>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;

private:
    std::unordered_map<std::string, std::unique_ptr<Tool>> tools_;
    std::vector<std::string> order_;
};

} // namespace execbox::tools
