#include "execbox/core/config.hpp"
#include "execbox/core/logger.hpp"

#include <fstream>
#include <limits>

namespace execbox {

namespace {

auto invalid(std::string message, std::string detail = "") -> Error {
    return make_error(ErrorCode::InvalidConfig, std::move(message), std::move(detail));
}

auto require_string_list(const json& j, std::string_view key)
    -> Result<std::vector<std::string>> {
    auto name = std::string(key);
    if (!j.contains(name)) {
        return std::unexpected(invalid("Missing required field", name));
    }
    const auto& value = j.at(name);
    if (!value.is_array()) {
        return std::unexpected(invalid("Field must be an array of strings", name));
    }

    std::vector<std::string> out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (!value[i].is_string()) {
            return std::unexpected(invalid("Field must be an array of strings",
                name + "[" + std::to_string(i) + "]"));
        }
        auto s = value[i].get<std::string>();
        if (s.empty()) {
            return std::unexpected(invalid("Empty string not allowed",
                name + "[" + std::to_string(i) + "]"));
        }
        out.push_back(std::move(s));
    }
    return out;
}

auto require_positive_int(const json& j, std::string_view key) -> Result<int64_t> {
    auto name = std::string(key);
    if (!j.contains(name)) {
        return std::unexpected(invalid("Missing required field", name));
    }
    const auto& value = j.at(name);
    // Booleans and floats are rejected; only JSON integers are accepted.
    if (!value.is_number_integer()) {
        return std::unexpected(invalid("Field must be an integer", name));
    }

    int64_t n = 0;
    if (value.is_number_unsigned()) {
        auto u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            return std::unexpected(invalid("Field is out of range", name));
        }
        n = static_cast<int64_t>(u);
    } else {
        n = value.get<int64_t>();
    }

    if (n <= 0) {
        return std::unexpected(invalid("Field must be greater than zero", name));
    }
    if (n > std::numeric_limits<int32_t>::max()) {
        return std::unexpected(invalid("Field is out of range", name));
    }
    return n;
}

auto parse_blocked_patterns(const json& j) -> Result<std::vector<BlockedPatternConfig>> {
    if (!j.contains("blocked_patterns")) {
        return std::unexpected(invalid("Missing required field", "blocked_patterns"));
    }
    const auto& value = j.at("blocked_patterns");
    if (!value.is_array()) {
        return std::unexpected(invalid("Field must be an array", "blocked_patterns"));
    }

    std::vector<BlockedPatternConfig> out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        auto where = "blocked_patterns[" + std::to_string(i) + "]";
        const auto& entry = value[i];

        BlockedPatternConfig p;
        if (entry.is_string()) {
            p.pattern = entry.get<std::string>();
        } else if (entry.is_object()) {
            if (!entry.contains("pattern") || !entry.at("pattern").is_string()) {
                return std::unexpected(invalid("Pattern object needs a string 'pattern'", where));
            }
            p.pattern = entry.at("pattern").get<std::string>();
            if (entry.contains("label")) {
                if (!entry.at("label").is_string()) {
                    return std::unexpected(invalid("Pattern label must be a string", where));
                }
                p.label = entry.at("label").get<std::string>();
            }
        } else {
            return std::unexpected(invalid("Pattern must be a string or an object", where));
        }

        if (p.pattern.empty()) {
            return std::unexpected(invalid("Empty pattern not allowed", where));
        }
        out.push_back(std::move(p));
    }
    return out;
}

auto parse_policy(const json& j) -> Result<PolicyConfig> {
    PolicyConfig policy;

    auto commands = require_string_list(j, "allowed_commands");
    if (!commands) return std::unexpected(commands.error());
    policy.allowed_commands = std::move(*commands);

    auto directories = require_string_list(j, "allowed_directories");
    if (!directories) return std::unexpected(directories.error());
    policy.allowed_directories = std::move(*directories);

    auto patterns = parse_blocked_patterns(j);
    if (!patterns) return std::unexpected(patterns.error());
    policy.blocked_patterns = std::move(*patterns);

    auto max_len = require_positive_int(j, "max_command_length");
    if (!max_len) return std::unexpected(max_len.error());
    policy.max_command_length = *max_len;

    auto timeout = require_positive_int(j, "timeout_seconds");
    if (!timeout) return std::unexpected(timeout.error());
    policy.timeout_seconds = *timeout;

    return policy;
}

} // anonymous namespace

void to_json(json& j, const BlockedPatternConfig& p) {
    if (p.label) {
        j = json{{"pattern", p.pattern}, {"label", *p.label}};
    } else {
        j = p.pattern;
    }
}

void to_json(json& j, const Config& c) {
    j = json{
        {"allowed_commands", c.policy.allowed_commands},
        {"allowed_directories", c.policy.allowed_directories},
        {"blocked_patterns", c.policy.blocked_patterns},
        {"max_command_length", c.policy.max_command_length},
        {"timeout_seconds", c.policy.timeout_seconds},
        {"shell", c.shell},
        {"logging", c.logging},
    };
}

auto parse_config(const json& j) -> Result<Config> {
    if (!j.is_object()) {
        return std::unexpected(invalid("Config must be a JSON object"));
    }

    auto policy = parse_policy(j);
    if (!policy) return std::unexpected(policy.error());

    Config config;
    config.policy = std::move(*policy);
    config.shell = default_shell_config();

    try {
        if (j.contains("shell")) {
            const auto& shell = j.at("shell");
            if (!shell.is_object()) {
                return std::unexpected(invalid("Field must be an object", "shell"));
            }
            auto parsed = shell.get<ShellConfig>();
            if (!parsed.program.empty()) {
                config.shell.program = std::move(parsed.program);
            }
            if (shell.contains("arguments")) {
                config.shell.arguments = std::move(parsed.arguments);
            }
        }
        if (j.contains("logging")) {
            if (!j.at("logging").is_object()) {
                return std::unexpected(invalid("Field must be an object", "logging"));
            }
            config.logging = j.at("logging").get<LoggingConfig>();
        }
    } catch (const json::exception& e) {
        return std::unexpected(invalid("Malformed optional section", e.what()));
    }

    return config;
}

auto load_config(const std::filesystem::path& path) -> Result<Config> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(invalid("Config file not found", path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(invalid("Cannot open config file", path.string()));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        return std::unexpected(invalid("Failed to parse config file",
            path.string() + ": " + e.what()));
    }

    auto config = parse_config(j);
    if (!config) {
        LOG_ERROR("Rejected config {}: {}", path.string(), config.error().what());
        return config;
    }
    LOG_DEBUG("Loaded config from {}", path.string());
    return config;
}

auto save_config(const Config& config, const std::filesystem::path& path) -> VoidResult {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Cannot create config directory", ec.message()));
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Cannot write config file", path.string()));
    }

    json j = config;
    out << j.dump(2) << "\n";
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed writing config file", path.string()));
    }
    LOG_INFO("Configuration saved to {}", path.string());
    return {};
}

auto default_shell_config() -> ShellConfig {
    return ShellConfig{
#ifdef _WIN32
        .program = "powershell.exe",
#else
        .program = "pwsh",
#endif
        .arguments = {"-NoProfile", "-NonInteractive",
                      "-ExecutionPolicy", "Restricted", "-Command"},
    };
}

auto default_policy_config() -> PolicyConfig {
    PolicyConfig policy;
    policy.allowed_commands = {
        "Get-ChildItem", "Get-Item", "Get-Content", "Get-Location",
        "Set-Location", "Test-Path", "Get-Process", "Get-Service",
        "Get-Date", "Get-Host", "Write-Output", "Write-Host",
        "Select-Object", "Where-Object", "Sort-Object", "Measure-Object",
    };
#ifdef _WIN32
    policy.allowed_directories = {
        "C:\\Users\\Public*",
        "C:\\temp*",
    };
#else
    policy.allowed_directories = {
        "/tmp*",
    };
#endif
    policy.blocked_patterns = {
        {R"([;&|`])", "command separator"},
        {"Invoke-Expression", std::nullopt},
        {"Invoke-Command", std::nullopt},
        {"Invoke-WebRequest", std::nullopt},
        {"Invoke-RestMethod", std::nullopt},
        {R"(iex\s)", std::nullopt},
        {R"(icm\s)", std::nullopt},
        {"Start-Process", std::nullopt},
        {R"(sps\s)", std::nullopt},
        {"Remove-Item", std::nullopt},
        {R"(rm\s)", std::nullopt},
        {R"(del\s)", std::nullopt},
        {R"(rmdir\s)", std::nullopt},
        {R"(\.ps1)", std::nullopt},
        {R"(\.bat)", std::nullopt},
        {R"(\.cmd)", std::nullopt},
        {R"(\.exe)", std::nullopt},
        {R"(powershell\.exe)", std::nullopt},
        {R"(cmd\.exe)", std::nullopt},
    };
    policy.max_command_length = 200;
    policy.timeout_seconds = 30;
    return policy;
}

auto default_config() -> Config {
    return Config{
        .policy = default_policy_config(),
        .shell = default_shell_config(),
        .logging = LoggingConfig{},
    };
}

} // namespace execbox
