#include "execbox/tools/tool_registry.hpp"

#include <chrono>

#include "execbox/core/logger.hpp"

namespace execbox::tools {

void ToolRegistry::register_tool(std::unique_ptr<Tool> tool) {
    if (!tool) {
        LOG_WARN("Attempted to register a null tool");
        return;
    }

    auto name = tool->definition().name;

    if (tools_.contains(name)) {
        LOG_WARN("Replacing existing tool: {}", name);
    } else {
        LOG_DEBUG("Registered tool: {}", name);
        order_.push_back(name);
    }

    tools_[std::move(name)] = std::move(tool);
}

auto ToolRegistry::get(std::string_view name) -> Tool* {
    auto it = tools_.find(std::string(name));
    return it != tools_.end() ? it->second.get() : nullptr;
}

auto ToolRegistry::get(std::string_view name) const -> const Tool* {
    auto it = tools_.find(std::string(name));
    return it != tools_.end() ? it->second.get() : nullptr;
}

auto ToolRegistry::list() const -> std::vector<ToolDefinition> {
    std::vector<ToolDefinition> defs;
    defs.reserve(order_.size());
    for (const auto& name : order_) {
        defs.push_back(tools_.at(name)->definition());
    }
    return defs;
}

auto ToolRegistry::to_json() const -> std::vector<json> {
    std::vector<json> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.push_back(tools_.at(name)->definition().to_json());
    }
    return result;
}

auto ToolRegistry::execute(std::string_view name, json params)
    -> awaitable<Result<json>> {
    auto* tool = get(name);
    if (!tool) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Tool not found",
                                       std::string(name)));
    }

    auto started = std::chrono::steady_clock::now();
    auto result = co_await tool->execute(std::move(params));
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (!result) {
        LOG_WARN("Tool {} rejected after {}ms: {}", name, elapsed.count(),
                 result.error().what());
    } else {
        LOG_DEBUG("Tool {} finished in {}ms", name, elapsed.count());
    }
    co_return result;
}

auto ToolRegistry::size() const noexcept -> std::size_t {
    return tools_.size();
}

auto ToolRegistry::contains(std::string_view name) const -> bool {
    return tools_.contains(std::string(name));
}

} // namespace execbox::tools
