#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "execbox/core/config.hpp"

namespace execbox::exec {

struct ExecutionResult {
    bool success = false;
    std::optional<int> return_code;
    std::string stdout_text;
    std::string stderr_text;
    std::string command;
    std::optional<std::string> working_directory;
    bool timed_out = false;
};

/// Flat object with success, return_code, stdout, stderr, command and
/// working_directory. `timed_out` is not serialized.
void to_json(nlohmann::json& j, const ExecutionResult& r);

/// Runs an already-validated command through the configured interpreter.
///
/// execute() never fails: a spawn failure or timeout comes back as an
/// unsuccessful ExecutionResult with the reason in stderr.
class Executor {
public:
    explicit Executor(ShellConfig shell);

    [[nodiscard]] auto execute(std::string_view command,
                               const std::optional<std::string>& working_directory,
                               int timeout_seconds) const -> ExecutionResult;

    [[nodiscard]] auto shell() const noexcept -> const ShellConfig& { return shell_; }

private:
    ShellConfig shell_;
};

} // namespace execbox::exec
