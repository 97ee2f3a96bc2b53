#include "execbox/cli/app.hpp"
#include "execbox/cli/commands.hpp"
#include "execbox/core/logger.hpp"

// Version string; injected by CMake via -DEXECBOX_VERSION_STRING=...
#ifndef EXECBOX_VERSION_STRING
#define EXECBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace execbox::cli {

App::App()
    : cli_("PowerShell command gatekeeper served over MCP", "execbox")
{
    cli_.set_version_flag("--version", EXECBOX_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("EXECBOX_CONFIG")
        ->capture_default_str();

    // Global option: log level override.
    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical)")
        ->envname("EXECBOX_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical"}));

    // Global options may also follow the subcommand.
    cli_.fallthrough();
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    }

    // The selected subcommand's callback ran inside parse() and left its
    // exit code in the context.
    Logger::flush();
    return context_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> Context& {
    return context_;
}

void App::setup_commands() {
    register_serve_command(cli_, context_);
    register_check_command(cli_, context_);
    register_run_command(cli_, context_);
    register_policy_command(cli_, context_);
    register_init_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace execbox::cli
