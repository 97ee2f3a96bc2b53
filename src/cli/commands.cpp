#include "execbox/cli/commands.hpp"

#include <algorithm>
#include <csignal>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <thread>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <nlohmann/json.hpp>

#include "execbox/core/logger.hpp"
#include "execbox/exec/executor.hpp"
#include "execbox/mcp/handlers.hpp"
#include "execbox/mcp/protocol.hpp"
#include "execbox/mcp/server.hpp"
#include "execbox/security/policy.hpp"
#include "execbox/security/policy_store.hpp"
#include "execbox/security/validator.hpp"
#include "execbox/tools/powershell_tools.hpp"
#include "execbox/tools/tool_registry.hpp"
#include "execbox/tools/tool_surface.hpp"

// Version string; injected by CMake via -DEXECBOX_VERSION_STRING=...
#ifndef EXECBOX_VERSION_STRING
#define EXECBOX_VERSION_STRING "0.1.0-dev"
#endif

namespace execbox::cli {

using json = nlohmann::json;

namespace {

/// Config plus the policy built from it, or the exit code to fail with.
struct Loaded {
    Config config;
    std::shared_ptr<const security::SecurityPolicy> policy;
};

auto load_policy_or_report(Context& ctx) -> std::optional<Loaded> {
    auto config = load_context_config(ctx);
    if (!config) {
        LOG_FATAL("Cannot load configuration: {}", config.error().what());
        ctx.exit_code = kExitConfigError;
        return std::nullopt;
    }

    auto policy = security::SecurityPolicy::create(config->policy);
    if (!policy) {
        LOG_FATAL("Invalid security policy in {}: {}", ctx.config_path, policy.error().what());
        ctx.exit_code = kExitConfigError;
        return std::nullopt;
    }

    return Loaded{
        .config = std::move(*config),
        .policy = std::make_shared<const security::SecurityPolicy>(std::move(*policy)),
    };
}

/// Command lines may carry arbitrary bytes; invalid UTF-8 is replaced.
void print_json(const json& j) {
    std::cout << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
}

auto optional_directory(const std::string& dir) -> std::optional<std::string> {
    if (dir.empty()) return std::nullopt;
    return dir;
}

} // anonymous namespace

auto load_context_config(const Context& ctx) -> Result<Config> {
    Logger::init("execbox", ctx.log_level.empty() ? "info" : ctx.log_level);

    auto config = load_config(std::filesystem::path(ctx.config_path));
    if (!config) return config;

    if (ctx.log_level.empty()) {
        Logger::set_level(config->logging.level);
    }
    if (config->logging.file) {
        Logger::add_rotating_file(*config->logging.file,
                                  config->logging.max_size_mb * 1024 * 1024,
                                  config->logging.max_files);
    }
    return config;
}

// ---------------------------------------------------------------------------
// serve command
// ---------------------------------------------------------------------------

void register_serve_command(CLI::App& app, Context& ctx) {
    auto* sub = app.add_subcommand("serve", "Serve the gatekeeper tools over MCP (stdio)");

    auto workers = std::make_shared<unsigned>(std::max(2u, std::thread::hardware_concurrency()));
    sub->add_option("--workers", *workers, "Threads available for running commands")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();

    sub->callback([&ctx, workers]() {
        auto loaded = load_policy_or_report(ctx);
        if (!loaded) return;

        security::PolicyStore policies(loaded->policy);
        exec::Executor executor(loaded->config.shell);
        tools::ToolSurface surface(policies, executor);

        boost::asio::thread_pool pool(*workers);
        tools::ToolRegistry registry;
        tools::register_builtin_tools(registry, surface, pool);

        mcp::Protocol protocol;
        mcp::register_mcp_handlers(protocol, registry,
            mcp::ServerInfo{.name = mcp::kServerName, .version = EXECBOX_VERSION_STRING});

        mcp::StdioServer server(protocol);

        boost::asio::io_context ioc(1);
        boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
#ifdef SIGHUP
        signals.add(SIGHUP);
#endif

        std::function<void()> wait_for_signal;
        wait_for_signal = [&]() {
            signals.async_wait([&](const boost::system::error_code& ec, int sig) {
                if (ec) return;
#ifdef SIGHUP
                if (sig == SIGHUP) {
                    LOG_INFO("Received SIGHUP, reloading policy from {}", ctx.config_path);
                    // A failed reload keeps the current policy and is logged
                    // by the store.
                    [[maybe_unused]] auto reloaded = policies.reload(ctx.config_path);
                    wait_for_signal();
                    return;
                }
#endif
                LOG_INFO("Received signal {}, shutting down", sig);
                ioc.stop();
            });
        };
        wait_for_signal();

        boost::asio::co_spawn(ioc, server.run(),
            [&](std::exception_ptr e) {
                if (e) {
                    try {
                        std::rethrow_exception(e);
                    } catch (const std::exception& ex) {
                        LOG_ERROR("MCP server stopped: {}", ex.what());
                        ctx.exit_code = kExitDenied;
                    }
                }
                boost::system::error_code ignored;
                signals.cancel(ignored);
            });

        LOG_INFO("execbox {} ready: {} allowed commands, {} directory rules, timeout {}s",
                 EXECBOX_VERSION_STRING, loaded->policy->allowed_commands().size(),
                 loaded->policy->directory_rules().size(),
                 loaded->policy->timeout_seconds());

        ioc.run();

        // Running commands finish (or hit their deadline) before teardown.
        pool.join();
        LOG_INFO("Server stopped");
    });
}

// ---------------------------------------------------------------------------
// check command
// ---------------------------------------------------------------------------

void register_check_command(CLI::App& app, Context& ctx) {
    auto* sub = app.add_subcommand("check", "Validate a command without running it");

    auto command = std::make_shared<std::string>();
    auto directory = std::make_shared<std::string>();
    sub->add_option("command", *command, "PowerShell command to validate")->required();
    sub->add_option("-d,--directory", *directory, "Working directory to validate as well");

    sub->callback([&ctx, command, directory]() {
        auto loaded = load_policy_or_report(ctx);
        if (!loaded) return;

        auto verdict = security::Validator(*loaded->policy)
                           .validate(*command, optional_directory(*directory));
        print_json(json(verdict));
        ctx.exit_code = verdict.is_allowed ? 0 : kExitDenied;
    });
}

// ---------------------------------------------------------------------------
// run command
// ---------------------------------------------------------------------------

void register_run_command(CLI::App& app, Context& ctx) {
    auto* sub = app.add_subcommand("run", "Validate and execute a command");

    auto command = std::make_shared<std::string>();
    auto directory = std::make_shared<std::string>();
    sub->add_option("command", *command, "PowerShell command to execute")->required();
    sub->add_option("-d,--directory", *directory, "Working directory for the command");

    sub->callback([&ctx, command, directory]() {
        auto loaded = load_policy_or_report(ctx);
        if (!loaded) return;

        security::PolicyStore policies(loaded->policy);
        exec::Executor executor(loaded->config.shell);
        tools::ToolSurface surface(policies, executor);

        auto result = surface.execute_powershell(*command, optional_directory(*directory));
        print_json(json(result));
        ctx.exit_code = result.success ? 0 : kExitDenied;
    });
}

// ---------------------------------------------------------------------------
// policy command
// ---------------------------------------------------------------------------

void register_policy_command(CLI::App& app, Context& ctx) {
    auto* sub = app.add_subcommand("policy", "Show or validate the security policy");

    auto validate_only = std::make_shared<bool>(false);
    sub->add_flag("--validate", *validate_only,
                  "Validate configuration without printing");

    sub->callback([&ctx, validate_only]() {
        auto loaded = load_policy_or_report(ctx);
        if (!loaded) return;

        if (*validate_only) {
            std::cout << "Configuration is valid: " << ctx.config_path << "\n";
            return;
        }

        const auto& policy = *loaded->policy;
        json patterns = json::array();
        for (const auto& p : policy.blocked_patterns()) {
            patterns.push_back(json{{"pattern", p.source}, {"label", p.label}});
        }

        json j{
            {"allowed_commands", policy.allowed_commands()},
            {"allowed_directories", policy.allowed_directories()},
            {"blocked_patterns", patterns},
            {"max_command_length", policy.max_command_length()},
            {"timeout_seconds", policy.timeout_seconds()},
            {"shell", loaded->config.shell},
        };
        print_json(j);
    });
}

// ---------------------------------------------------------------------------
// init command
// ---------------------------------------------------------------------------

void register_init_command(CLI::App& app, Context& ctx) {
    auto* sub = app.add_subcommand("init", "Write the default configuration file");

    auto force = std::make_shared<bool>(false);
    sub->add_flag("-f,--force", *force, "Overwrite an existing file");

    sub->callback([&ctx, force]() {
        Logger::init("execbox", ctx.log_level.empty() ? "info" : ctx.log_level);

        std::filesystem::path path(ctx.config_path);
        std::error_code ec;
        if (std::filesystem::exists(path, ec) && !*force) {
            LOG_ERROR("{} already exists; use --force to overwrite", path.string());
            ctx.exit_code = kExitDenied;
            return;
        }

        auto saved = save_config(default_config(), path);
        if (!saved) {
            LOG_ERROR("Cannot write configuration: {}", saved.error().what());
            ctx.exit_code = kExitDenied;
            return;
        }
        std::cout << "Wrote default configuration to " << path.string() << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "execbox " << EXECBOX_VERSION_STRING << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#elif defined(_MSC_VER)
        std::cout << "Compiler: msvc " << _MSC_VER << "\n";
#endif
    });
}

} // namespace execbox::cli
