#include "execbox/tools/powershell_tools.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "execbox/core/logger.hpp"

namespace execbox::tools {

namespace {

auto required_string(const json& params, const std::string& key) -> Result<std::string> {
    if (!params.is_object() || !params.contains(key)) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Missing required argument", key));
    }
    if (!params.at(key).is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Argument must be a string", key));
    }
    return params.at(key).get<std::string>();
}

/// Absent, null and "" all mean no working directory.
auto optional_string(const json& params, const std::string& key)
    -> Result<std::optional<std::string>> {
    if (!params.is_object() || !params.contains(key) || params.at(key).is_null()) {
        return std::optional<std::string>{};
    }
    if (!params.at(key).is_string()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Argument must be a string", key));
    }
    auto value = params.at(key).get<std::string>();
    if (value.empty()) return std::optional<std::string>{};
    return std::optional<std::string>(std::move(value));
}

const ToolParameter kCommandParam{
    .name = "command",
    .type = "string",
    .description = "The PowerShell command",
    .required = true,
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// execute_powershell
// ---------------------------------------------------------------------------

auto ExecutePowerShellTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "execute_powershell",
        .description = "Execute a PowerShell command with security restrictions.",
        .parameters = {
            ToolParameter{
                .name = "command",
                .type = "string",
                .description = "The PowerShell command to execute",
                .required = true,
            },
            ToolParameter{
                .name = "working_directory",
                .type = "string",
                .description = "Optional working directory for command execution",
                .required = false,
            },
        },
    };
}

auto ExecutePowerShellTool::execute(json params) -> awaitable<Result<json>> {
    auto command = required_string(params, "command");
    if (!command) co_return make_fail(command.error());

    auto working_directory = optional_string(params, "working_directory");
    if (!working_directory) co_return make_fail(working_directory.error());

    const auto& surface = surface_;
    auto result = co_await boost::asio::co_spawn(
        pool_,
        [&surface, cmd = std::move(*command),
         wd = std::move(*working_directory)]() -> awaitable<exec::ExecutionResult> {
            co_return surface.execute_powershell(cmd, wd);
        },
        boost::asio::use_awaitable);

    co_return json(result);
}

// ---------------------------------------------------------------------------
// validate_command
// ---------------------------------------------------------------------------

auto ValidateCommandTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "validate_command",
        .description = "Validate a PowerShell command without executing it.",
        .parameters = {kCommandParam},
    };
}

auto ValidateCommandTool::execute(json params) -> awaitable<Result<json>> {
    auto command = required_string(params, "command");
    if (!command) co_return make_fail(command.error());

    co_return json(surface_.validate_command(*command));
}

// ---------------------------------------------------------------------------
// list_allowed_commands / list_allowed_directories
// ---------------------------------------------------------------------------

auto ListAllowedCommandsTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "list_allowed_commands",
        .description = "Get the list of allowed PowerShell commands.",
        .parameters = {},
    };
}

auto ListAllowedCommandsTool::execute([[maybe_unused]] json params)
    -> awaitable<Result<json>> {
    co_return json(surface_.list_allowed_commands());
}

auto ListAllowedDirectoriesTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "list_allowed_directories",
        .description = "Get the list of allowed working directories.",
        .parameters = {},
    };
}

auto ListAllowedDirectoriesTool::execute([[maybe_unused]] json params)
    -> awaitable<Result<json>> {
    co_return json(surface_.list_allowed_directories());
}

// ---------------------------------------------------------------------------
// get_security_config
// ---------------------------------------------------------------------------

auto GetSecurityConfigTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = "get_security_config",
        .description = "Get the current security configuration.",
        .parameters = {},
    };
}

auto GetSecurityConfigTool::execute([[maybe_unused]] json params)
    -> awaitable<Result<json>> {
    co_return json(surface_.get_security_config());
}

void register_builtin_tools(ToolRegistry& registry, const ToolSurface& surface,
                            boost::asio::thread_pool& pool) {
    registry.register_tool(std::make_unique<ExecutePowerShellTool>(surface, pool));
    registry.register_tool(std::make_unique<ValidateCommandTool>(surface));
    registry.register_tool(std::make_unique<ListAllowedCommandsTool>(surface));
    registry.register_tool(std::make_unique<ListAllowedDirectoriesTool>(surface));
    registry.register_tool(std::make_unique<GetSecurityConfigTool>(surface));

    LOG_INFO("Registered {} tools", registry.size());
}

} // namespace execbox::tools
