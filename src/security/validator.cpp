#include "execbox/security/validator.hpp"

#include "execbox/core/logger.hpp"
#include "execbox/core/utils.hpp"

namespace execbox::security {

namespace {

auto deny(std::string_view command, std::string reason) -> ValidationResult {
    LOG_WARN("Command blocked: {}", reason);
    return ValidationResult{
        .is_allowed = false,
        .reason = std::move(reason),
        .command = std::string(command),
    };
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ValidationResult& r) {
    j = nlohmann::json{
        {"is_allowed", r.is_allowed},
        {"reason", r.reason},
        {"command", r.command},
    };
}

auto Validator::validate(std::string_view command,
                         const std::optional<std::string>& working_directory) const
    -> ValidationResult {
    LOG_DEBUG("Validating command: {}", command);

    if (utils::trim(command).empty()) {
        return deny(command, "Command is empty");
    }

    if (utils::utf8_length(command) > policy_.max_command_length()) {
        return deny(command, "Command exceeds maximum length of " +
                             std::to_string(policy_.max_command_length()) + " characters");
    }

    if (const auto* blocked = policy_.find_blocked_pattern(command)) {
        return deny(command, "Command contains blocked pattern (" + blocked->label +
                             "): " + blocked->source);
    }

    auto token = utils::first_token(command);
    if (!policy_.is_command_allowed(token)) {
        return deny(command, "Command '" + token + "' is not in the allowed commands list");
    }

    if (working_directory.has_value()) {
        auto normalized = normalize_path(*working_directory);
        if (!normalized) {
            return deny(command, "Invalid working directory: " + *working_directory);
        }
        if (!policy_.is_directory_allowed(*normalized)) {
            return deny(command, "Directory not allowed: " + normalized->str());
        }
    }

    LOG_DEBUG("Command allowed: {}", command);
    return ValidationResult{
        .is_allowed = true,
        .reason = "Command is allowed",
        .command = std::string(command),
    };
}

} // namespace execbox::security
