#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "execbox/core/error.hpp"

// std::optional serializer for nlohmann/json, enables NLOHMANN_DEFINE macros
// to work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace execbox {

using json = nlohmann::json;

/// A blocked-pattern entry as written in the config file. Either a bare
/// regex string or {"pattern": ..., "label": ...}.
struct BlockedPatternConfig {
    std::string pattern;
    std::optional<std::string> label;
};

void to_json(json& j, const BlockedPatternConfig& p);

/// The security policy section, exactly as read from disk. Every field is
/// required; see parse_config() for the validation rules.
struct PolicyConfig {
    std::vector<std::string> allowed_commands;
    std::vector<std::string> allowed_directories;
    std::vector<BlockedPatternConfig> blocked_patterns;
    int64_t max_command_length = 0;
    int64_t timeout_seconds = 0;
};

/// Interpreter invocation used for every command. The command string is
/// appended after `arguments`.
struct ShellConfig {
    std::string program;
    std::vector<std::string> arguments;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ShellConfig, program, arguments)

struct LoggingConfig {
    std::string level = "info";
    std::optional<std::string> file;
    std::size_t max_size_mb = 10;
    std::size_t max_files = 3;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(LoggingConfig, level, file, max_size_mb, max_files)

struct Config {
    PolicyConfig policy;
    ShellConfig shell;
    LoggingConfig logging;
};

void to_json(json& j, const Config& c);

/// Parses a config document. The policy keys live at the top level and are
/// validated strictly; `shell` and `logging` fall back to defaults when absent.
auto parse_config(const json& j) -> Result<Config>;

/// Reads and parses a config file. A missing or unreadable file is an error.
auto load_config(const std::filesystem::path& path) -> Result<Config>;

/// Writes `config` as pretty-printed JSON, creating parent directories.
auto save_config(const Config& config, const std::filesystem::path& path) -> VoidResult;

auto default_shell_config() -> ShellConfig;
auto default_policy_config() -> PolicyConfig;
auto default_config() -> Config;

} // namespace execbox
