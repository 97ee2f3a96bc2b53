#include "execbox/security/policy.hpp"

#include "execbox/core/logger.hpp"
#include "execbox/core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace execbox::security {

namespace {

constexpr std::array kExecutableExtensions = {"exe", "com", "dll", "msi", "scr"};
constexpr std::array kInterpreters = {"powershell", "pwsh", "cmd\\.exe", "cmd.exe", "bash", "wscript", "cscript"};

auto compile_pattern(const BlockedPatternConfig& config) -> Result<BlockedPattern> {
    try {
        return BlockedPattern{
            .source = config.pattern,
            .label = config.label.value_or(classify_blocked_pattern(config.pattern)),
            .regex = std::regex(config.pattern,
                std::regex::ECMAScript | std::regex::icase | std::regex::optimize),
        };
    } catch (const std::regex_error& e) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Invalid blocked pattern", config.pattern + ": " + e.what()));
    }
}

} // anonymous namespace

auto classify_blocked_pattern(std::string_view source) -> std::string {
    auto lower = utils::to_lower(source);

    if (lower.find_first_of(";&|`") != std::string::npos) {
        return "command separator";
    }
    for (const auto* name : kInterpreters) {
        if (lower.find(name) != std::string::npos) {
            return "nested interpreter";
        }
    }
    if (lower.starts_with("\\.") || lower.starts_with("[.]")) {
        auto ext = lower.substr(lower.starts_with("\\.") ? 2 : 3);
        for (const auto* exe : kExecutableExtensions) {
            if (ext.starts_with(exe)) return "executable extension";
        }
        return "script extension";
    }
    if (!lower.empty() && std::isalpha(static_cast<unsigned char>(lower[0]))) {
        return "dangerous cmdlet";
    }
    return "blocked pattern";
}

auto SecurityPolicy::create(const PolicyConfig& config) -> Result<SecurityPolicy> {
    if (config.max_command_length <= 0 || config.timeout_seconds <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "Policy limits must be greater than zero"));
    }

    SecurityPolicy policy;
    policy.allowed_commands_ = config.allowed_commands;
    for (const auto& cmd : config.allowed_commands) {
        policy.allowed_commands_lower_.insert(utils::to_lower(utils::trim(cmd)));
    }

    policy.allowed_directories_ = config.allowed_directories;
    policy.directory_rules_.reserve(config.allowed_directories.size());
    for (const auto& pattern : config.allowed_directories) {
        auto rule = parse_directory_rule(pattern);
        if (!rule) return std::unexpected(rule.error());
        policy.directory_rules_.push_back(std::move(*rule));
    }

    policy.blocked_patterns_.reserve(config.blocked_patterns.size());
    for (const auto& entry : config.blocked_patterns) {
        auto compiled = compile_pattern(entry);
        if (!compiled) return std::unexpected(compiled.error());
        policy.blocked_patterns_.push_back(std::move(*compiled));
    }

    policy.max_command_length_ = static_cast<std::size_t>(config.max_command_length);
    policy.timeout_seconds_ = static_cast<int>(config.timeout_seconds);

    LOG_DEBUG("Security policy built: {} commands, {} directories, {} blocked patterns",
              policy.allowed_commands_.size(), policy.directory_rules_.size(),
              policy.blocked_patterns_.size());
    return policy;
}

auto SecurityPolicy::is_command_allowed(std::string_view token) const -> bool {
    return allowed_commands_lower_.contains(utils::to_lower(token));
}

auto SecurityPolicy::is_directory_allowed(const NormalizedPath& path) const -> bool {
    return std::ranges::any_of(directory_rules_, [&path](const DirectoryRule& rule) {
        return rule.matches(path);
    });
}

auto SecurityPolicy::find_blocked_pattern(std::string_view command) const
    -> const BlockedPattern* {
    for (const auto& pattern : blocked_patterns_) {
        try {
            if (std::regex_search(command.begin(), command.end(), pattern.regex)) {
                return &pattern;
            }
        } catch (const std::regex_error& e) {
            // An input the matcher cannot finish on is treated as a match.
            LOG_WARN("Blocked pattern '{}' failed to evaluate: {}", pattern.source, e.what());
            return &pattern;
        }
    }
    return nullptr;
}

auto load_policy(const std::filesystem::path& path)
    -> Result<std::shared_ptr<const SecurityPolicy>> {
    auto config = load_config(path);
    if (!config) return std::unexpected(config.error());

    auto policy = SecurityPolicy::create(config->policy);
    if (!policy) return std::unexpected(policy.error());

    return std::make_shared<const SecurityPolicy>(std::move(*policy));
}

} // namespace execbox::security
