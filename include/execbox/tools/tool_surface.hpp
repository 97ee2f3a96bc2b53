#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "execbox/exec/executor.hpp"
#include "execbox/security/policy_store.hpp"
#include "execbox/security/validator.hpp"

namespace execbox::tools {

/// Policy limits and rule counts. Pattern sources are never included.
struct SecuritySummary {
    std::size_t allowed_commands_count = 0;
    std::size_t allowed_directories_count = 0;
    std::size_t blocked_patterns_count = 0;
    std::size_t max_command_length = 0;
    int timeout_seconds = 0;
};

void to_json(nlohmann::json& j, const SecuritySummary& s);

/// The five operations offered to callers. Each call reads one policy
/// snapshot from the store and uses it throughout.
class ToolSurface {
public:
    ToolSurface(const security::PolicyStore& policies, const exec::Executor& executor)
        : policies_(policies), executor_(executor) {}

    /// Validates, then runs the command if allowed. A denied command never
    /// reaches the executor.
    [[nodiscard]] auto execute_powershell(std::string_view command,
                                          const std::optional<std::string>& working_directory = std::nullopt) const
        -> exec::ExecutionResult;

    [[nodiscard]] auto validate_command(std::string_view command) const
        -> security::ValidationResult;

    [[nodiscard]] auto list_allowed_commands() const -> std::vector<std::string>;
    [[nodiscard]] auto list_allowed_directories() const -> std::vector<std::string>;
    [[nodiscard]] auto get_security_config() const -> SecuritySummary;

private:
    const security::PolicyStore& policies_;
    const exec::Executor& executor_;
};

} // namespace execbox::tools
