#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "execbox/core/error.hpp"

namespace execbox::exec {

struct ProcessSpec {
    /// argv[0] is looked up on PATH.
    std::vector<std::string> argv;
    std::optional<std::filesystem::path> working_directory;
};

struct ProcessOutcome {
    /// Empty when the process was killed on timeout.
    std::optional<int> exit_code;
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out = false;
};

/// A running child process together with every process it starts.
///
/// On POSIX the child leads its own process group; on Windows it is placed
/// in a job object. terminate_tree() kills the whole group/job, and the
/// destructor does the same for a child that is still running, so a
/// ChildProcess never leaves work behind once it goes out of scope.
class ChildProcess {
public:
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// Starts the process with stdin closed and stdout/stderr captured.
    /// Fails with ErrorCode::SpawnFailed if the program cannot be started or
    /// the working directory cannot be entered.
    static auto spawn(const ProcessSpec& spec) -> Result<std::unique_ptr<ChildProcess>>;

    /// Collects output until the child exits or `deadline` passes.
    /// Returns true if the child exited. Descendants still alive after the
    /// child exits are killed.
    auto wait_until(std::chrono::steady_clock::time_point deadline) -> bool;

    /// Kills the child and all of its descendants, then reaps the child.
    void terminate_tree();

    [[nodiscard]] auto pid() const noexcept -> int64_t;
    [[nodiscard]] auto exit_code() const noexcept -> std::optional<int>;
    [[nodiscard]] auto has_exited() const noexcept -> bool;

    auto take_stdout() -> std::string;
    auto take_stderr() -> std::string;

private:
    struct Impl;
    explicit ChildProcess(std::unique_ptr<Impl> impl);

    std::unique_ptr<Impl> impl_;
};

/// Spawns `spec`, waits up to `timeout`, and kills the process tree if the
/// deadline passes. Only a spawn failure is reported as an error.
auto run_process(const ProcessSpec& spec, std::chrono::milliseconds timeout)
    -> Result<ProcessOutcome>;

} // namespace execbox::exec
