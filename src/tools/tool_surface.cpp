#include "execbox/tools/tool_surface.hpp"

#include <filesystem>

#include "execbox/core/logger.hpp"
#include "execbox/security/path_rules.hpp"

namespace execbox::tools {

namespace {

auto denied(std::string_view command, const std::optional<std::string>& working_directory,
            std::string reason) -> exec::ExecutionResult {
    return exec::ExecutionResult{
        .success = false,
        .return_code = std::nullopt,
        .stdout_text = "",
        .stderr_text = std::move(reason),
        .command = std::string(command),
        .working_directory = working_directory,
        .timed_out = false,
    };
}

} // anonymous namespace

void to_json(nlohmann::json& j, const SecuritySummary& s) {
    j = nlohmann::json{
        {"allowed_commands_count", s.allowed_commands_count},
        {"allowed_directories_count", s.allowed_directories_count},
        {"blocked_patterns_count", s.blocked_patterns_count},
        {"max_command_length", s.max_command_length},
        {"timeout_seconds", s.timeout_seconds},
    };
}

auto ToolSurface::execute_powershell(std::string_view command,
                                     const std::optional<std::string>& working_directory) const
    -> exec::ExecutionResult {
    auto policy = policies_.current();

    auto verdict = security::Validator(*policy).validate(command, working_directory);
    if (!verdict.is_allowed) {
        return denied(command, working_directory, std::move(verdict.reason));
    }

    // Check the same normalized path the validator matched and the executor
    // will enter.
    if (working_directory) {
        auto normalized = security::normalize_path(*working_directory);
        std::error_code ec;
        if (!normalized || !std::filesystem::is_directory(normalized->str(), ec)) {
            LOG_WARN("Working directory does not exist: {}", *working_directory);
            return denied(command, working_directory,
                          "Directory does not exist: " + *working_directory);
        }
    }

    return executor_.execute(command, working_directory, policy->timeout_seconds());
}

auto ToolSurface::validate_command(std::string_view command) const
    -> security::ValidationResult {
    auto policy = policies_.current();
    return security::Validator(*policy).validate(command);
}

auto ToolSurface::list_allowed_commands() const -> std::vector<std::string> {
    return policies_.current()->allowed_commands();
}

auto ToolSurface::list_allowed_directories() const -> std::vector<std::string> {
    return policies_.current()->allowed_directories();
}

auto ToolSurface::get_security_config() const -> SecuritySummary {
    auto policy = policies_.current();
    return SecuritySummary{
        .allowed_commands_count = policy->allowed_commands().size(),
        .allowed_directories_count = policy->allowed_directories().size(),
        .blocked_patterns_count = policy->blocked_patterns().size(),
        .max_command_length = policy->max_command_length(),
        .timeout_seconds = policy->timeout_seconds(),
    };
}

} // namespace execbox::tools
