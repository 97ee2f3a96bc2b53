#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "execbox/core/config.hpp"
#include "execbox/core/error.hpp"
#include "execbox/security/path_rules.hpp"

namespace execbox::security {

/// A compiled blocked pattern. `label` names the pattern class reported in
/// denial reasons.
struct BlockedPattern {
    std::string source;
    std::string label;
    std::regex regex;
};

/// Derives a pattern class name from a regex source when the config gives
/// no explicit label.
auto classify_blocked_pattern(std::string_view source) -> std::string;

/// The validated rule set every request is checked against.
///
/// Instances are only produced by create(), which compiles every blocked
/// pattern and parses every directory rule up front; a policy that exists is
/// a policy that is fully valid. There are no mutators. Share it as
/// std::shared_ptr<const SecurityPolicy> and replace the whole object to
/// reload.
class SecurityPolicy {
public:
    static auto create(const PolicyConfig& config) -> Result<SecurityPolicy>;

    [[nodiscard]] auto allowed_commands() const -> const std::vector<std::string>& {
        return allowed_commands_;
    }

    /// Case-insensitive membership test for a command's leading token.
    [[nodiscard]] auto is_command_allowed(std::string_view token) const -> bool;

    /// Directory patterns as written in the config.
    [[nodiscard]] auto allowed_directories() const -> const std::vector<std::string>& {
        return allowed_directories_;
    }

    [[nodiscard]] auto directory_rules() const -> const std::vector<DirectoryRule>& {
        return directory_rules_;
    }

    [[nodiscard]] auto is_directory_allowed(const NormalizedPath& path) const -> bool;

    [[nodiscard]] auto blocked_patterns() const -> const std::vector<BlockedPattern>& {
        return blocked_patterns_;
    }

    /// First blocked pattern found anywhere in `command`, or nullptr.
    [[nodiscard]] auto find_blocked_pattern(std::string_view command) const
        -> const BlockedPattern*;

    [[nodiscard]] auto max_command_length() const noexcept -> std::size_t {
        return max_command_length_;
    }

    [[nodiscard]] auto timeout_seconds() const noexcept -> int {
        return timeout_seconds_;
    }

private:
    SecurityPolicy() = default;

    std::vector<std::string> allowed_commands_;
    std::unordered_set<std::string> allowed_commands_lower_;
    std::vector<std::string> allowed_directories_;
    std::vector<DirectoryRule> directory_rules_;
    std::vector<BlockedPattern> blocked_patterns_;
    std::size_t max_command_length_ = 0;
    int timeout_seconds_ = 0;
};

/// Loads the config file at `path` and builds the policy from it.
auto load_policy(const std::filesystem::path& path)
    -> Result<std::shared_ptr<const SecurityPolicy>>;

} // namespace execbox::security
