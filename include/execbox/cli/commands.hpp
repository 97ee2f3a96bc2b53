#pragma once

#include <CLI/CLI.hpp>

#include "execbox/cli/app.hpp"
#include "execbox/core/config.hpp"
#include "execbox/core/error.hpp"

namespace execbox::cli {

/// Exit code when a command is denied or fails.
inline constexpr int kExitDenied = 1;
/// Exit code when the configuration cannot be loaded.
inline constexpr int kExitConfigError = 2;

/// Initializes logging from the context and loads the config it names.
/// Applies the config's logging section unless --log-level was given.
auto load_context_config(const Context& ctx) -> Result<Config>;

/// Register the `serve` subcommand.
/// Serves the gatekeeper tools over MCP on stdin/stdout until EOF or a
/// termination signal. SIGHUP reloads the policy.
void register_serve_command(CLI::App& app, Context& ctx);

/// Register the `check` subcommand.
/// Validates one command and prints the verdict as JSON.
void register_check_command(CLI::App& app, Context& ctx);

/// Register the `run` subcommand.
/// Validates and executes one command, printing the result as JSON.
void register_run_command(CLI::App& app, Context& ctx);

/// Register the `policy` subcommand.
/// Prints the active rules, or only confirms they load.
void register_policy_command(CLI::App& app, Context& ctx);

/// Register the `init` subcommand.
/// Writes the default configuration to the config path.
void register_init_command(CLI::App& app, Context& ctx);

/// Register the `version` subcommand.
void register_version_command(CLI::App& app);

} // namespace execbox::cli
