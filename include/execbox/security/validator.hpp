#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "execbox/security/policy.hpp"

namespace execbox::security {

struct ValidationResult {
    bool is_allowed = false;
    std::string reason;
    std::string command;
};

void to_json(nlohmann::json& j, const ValidationResult& r);

/// Decides whether a command may run under a policy.
///
/// Checks run in a fixed order and the first failure is reported:
///   1. empty command / length ceiling
///   2. blocked patterns, searched over the whole raw string
///   3. leading token against the allowed commands
///   4. working directory (when given) against the directory rules
///
/// Blocked patterns are checked before the allowlist so that an allowed
/// command name cannot carry a blocked payload along with it.
class Validator {
public:
    explicit Validator(const SecurityPolicy& policy) : policy_(policy) {}

    [[nodiscard]] auto validate(std::string_view command,
                                const std::optional<std::string>& working_directory = std::nullopt) const
        -> ValidationResult;

private:
    const SecurityPolicy& policy_;
};

} // namespace execbox::security
