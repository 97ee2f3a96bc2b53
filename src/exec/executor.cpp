#include "execbox/exec/executor.hpp"

#include "execbox/core/logger.hpp"
#include "execbox/core/utils.hpp"
#include "execbox/exec/process.hpp"
#include "execbox/security/path_rules.hpp"

namespace execbox::exec {

namespace {

auto failed(std::string_view command, std::optional<std::string> working_directory,
            std::string message) -> ExecutionResult {
    return ExecutionResult{
        .success = false,
        .return_code = std::nullopt,
        .stdout_text = "",
        .stderr_text = std::move(message),
        .command = std::string(command),
        .working_directory = std::move(working_directory),
        .timed_out = false,
    };
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ExecutionResult& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"return_code", r.return_code},
        {"stdout", r.stdout_text},
        {"stderr", r.stderr_text},
        {"command", r.command},
        {"working_directory", r.working_directory},
    };
}

Executor::Executor(ShellConfig shell) : shell_(std::move(shell)) {}

auto Executor::execute(std::string_view command,
                       const std::optional<std::string>& working_directory,
                       int timeout_seconds) const -> ExecutionResult {
    ProcessSpec spec;
    spec.argv.reserve(shell_.arguments.size() + 2);
    spec.argv.push_back(shell_.program);
    spec.argv.insert(spec.argv.end(), shell_.arguments.begin(), shell_.arguments.end());
    spec.argv.emplace_back(command);

    std::optional<std::string> cwd;
    if (working_directory) {
        auto normalized = security::normalize_path(*working_directory);
        if (!normalized) {
            return failed(command, working_directory,
                          "Invalid working directory: " + normalized.error().what());
        }
        cwd = normalized->str();
        spec.working_directory = *cwd;
    }

    LOG_INFO("Executing command: {}", command);

    auto outcome = run_process(spec, std::chrono::seconds(timeout_seconds));
    if (!outcome) {
        LOG_ERROR("Failed to start command: {}", outcome.error().what());
        return failed(command, cwd, outcome.error().what());
    }

    ExecutionResult result{
        .success = !outcome->timed_out && outcome->exit_code == 0,
        .return_code = outcome->exit_code,
        .stdout_text = utils::trim(utils::sanitize_utf8(outcome->stdout_text)),
        .stderr_text = utils::trim(utils::sanitize_utf8(outcome->stderr_text)),
        .command = std::string(command),
        .working_directory = std::move(cwd),
        .timed_out = outcome->timed_out,
    };

    if (result.timed_out) {
        auto notice = "Command timed out after " + std::to_string(timeout_seconds) + " seconds";
        if (!result.stderr_text.empty()) result.stderr_text += '\n';
        result.stderr_text += notice;
        LOG_WARN("{}: {}", notice, command);
    } else {
        LOG_INFO("Command finished with exit code {}", result.return_code.value_or(-1));
    }
    return result;
}

} // namespace execbox::exec
