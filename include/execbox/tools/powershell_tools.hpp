#pragma once

#include <boost/asio/thread_pool.hpp>

#include "execbox/tools/tool.hpp"
#include "execbox/tools/tool_registry.hpp"
#include "execbox/tools/tool_surface.hpp"

namespace execbox::tools {

/// Runs a command through the gatekeeper. The blocking execution is moved
/// onto `pool` so the caller's executor stays free.
class ExecutePowerShellTool : public Tool {
public:
    ExecutePowerShellTool(const ToolSurface& surface, boost::asio::thread_pool& pool)
        : surface_(surface), pool_(pool) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

private:
    const ToolSurface& surface_;
    boost::asio::thread_pool& pool_;
};

class ValidateCommandTool : public Tool {
public:
    explicit ValidateCommandTool(const ToolSurface& surface) : surface_(surface) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

private:
    const ToolSurface& surface_;
};

class ListAllowedCommandsTool : public Tool {
public:
    explicit ListAllowedCommandsTool(const ToolSurface& surface) : surface_(surface) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

private:
    const ToolSurface& surface_;
};

class ListAllowedDirectoriesTool : public Tool {
public:
    explicit ListAllowedDirectoriesTool(const ToolSurface& surface) : surface_(surface) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

private:
    const ToolSurface& surface_;
};

class GetSecurityConfigTool : public Tool {
public:
    explicit GetSecurityConfigTool(const ToolSurface& surface) : surface_(surface) {}

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

private:
    const ToolSurface& surface_;
};

/// Registers the five gatekeeper tools.
void register_builtin_tools(ToolRegistry& registry, const ToolSurface& surface,
                            boost::asio::thread_pool& pool);

} // namespace execbox::tools
