#pragma once

#include <string>

#include <CLI/CLI.hpp>

namespace execbox::cli {

/// Options shared by every subcommand, plus the exit code the selected
/// subcommand leaves behind.
struct Context {
    std::string config_path = "config.json";
    std::string log_level;   // empty: use the config file's logging.level
    int exit_code = 0;
};

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (serve, check, run, policy, init, version).
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    [[nodiscard]] auto cli() -> CLI::App&;
    [[nodiscard]] auto context() -> Context&;

private:
    void setup_commands();

    CLI::App cli_;
    Context context_;
};

} // namespace execbox::cli
