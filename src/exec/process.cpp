#include "execbox/exec/process.hpp"

#include "execbox/core/logger.hpp"
#include "execbox/core/utils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#include <thread>
#else
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace execbox::exec {

using Clock = std::chrono::steady_clock;

#ifdef _WIN32

// ---------------------------------------------------------------------------
// Windows: CreateProcess inside a kill-on-close job object
// ---------------------------------------------------------------------------

namespace {

auto last_error_message(DWORD code) -> std::string {
    char* buffer = nullptr;
    auto len = ::FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM |
            FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string msg = len > 0 ? std::string(buffer, len) : "error " + std::to_string(code);
    if (buffer) ::LocalFree(buffer);
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();
    return msg;
}

/// Quotes one argument following the CommandLineToArgvW rules.
auto quote_argument(const std::string& arg) -> std::string {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }
    std::string out = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            out.append(backslashes * 2 + 1, '\\');
        } else {
            out.append(backslashes, '\\');
        }
        backslashes = 0;
        out += c;
    }
    out.append(backslashes * 2, '\\');
    out += '"';
    return out;
}

void read_pipe(HANDLE pipe, std::string& sink) {
    char buf[4096];
    DWORD n = 0;
    while (::ReadFile(pipe, buf, sizeof(buf), &n, nullptr) && n > 0) {
        sink.append(buf, n);
    }
}

} // anonymous namespace

struct ChildProcess::Impl {
    HANDLE process = nullptr;
    HANDLE job = nullptr;
    DWORD pid = 0;
    bool exited = false;
    std::optional<int> exit_code;
    std::string out;
    std::string err;
    std::thread out_reader;
    std::thread err_reader;

    void join_readers() {
        if (out_reader.joinable()) out_reader.join();
        if (err_reader.joinable()) err_reader.join();
    }

    ~Impl() {
        join_readers();
        if (process) ::CloseHandle(process);
        if (job) ::CloseHandle(job);
    }
};

ChildProcess::ChildProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ChildProcess::~ChildProcess() {
    if (impl_ && !impl_->exited) {
        terminate_tree();
    }
}

auto ChildProcess::spawn(const ProcessSpec& spec) -> Result<std::unique_ptr<ChildProcess>> {
    if (spec.argv.empty()) {
        return std::unexpected(make_error(ErrorCode::SpawnFailed, "Empty argument vector"));
    }

    std::string cmd_line;
    for (const auto& arg : spec.argv) {
        if (!cmd_line.empty()) cmd_line += ' ';
        cmd_line += quote_argument(arg);
    }

    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE out_read = nullptr, out_write = nullptr;
    HANDLE err_read = nullptr, err_write = nullptr;
    if (!::CreatePipe(&out_read, &out_write, &sa, 0) ||
        !::CreatePipe(&err_read, &err_write, &sa, 0)) {
        auto code = ::GetLastError();
        for (HANDLE h : {out_read, out_write, err_read, err_write}) {
            if (h) ::CloseHandle(h);
        }
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to create pipes", last_error_message(code)));
    }
    ::SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
    ::SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);

    auto impl = std::make_unique<Impl>();
    impl->job = ::CreateJobObjectA(nullptr, nullptr);
    if (impl->job) {
        JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits{};
        limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
        ::SetInformationJobObject(impl->job, JobObjectExtendedLimitInformation,
                                  &limits, sizeof(limits));
    }

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdInput = nullptr;
    si.hStdOutput = out_write;
    si.hStdError = err_write;

    PROCESS_INFORMATION pi{};
    std::string cwd = spec.working_directory ? spec.working_directory->string() : "";

    BOOL created = ::CreateProcessA(
        nullptr, cmd_line.data(), nullptr, nullptr, TRUE,
        CREATE_NO_WINDOW | CREATE_SUSPENDED, nullptr,
        cwd.empty() ? nullptr : cwd.c_str(), &si, &pi);
    auto create_error = ::GetLastError();

    ::CloseHandle(out_write);
    ::CloseHandle(err_write);

    if (!created) {
        ::CloseHandle(out_read);
        ::CloseHandle(err_read);
        auto what = (create_error == ERROR_DIRECTORY && !cwd.empty())
            ? "Cannot enter working directory '" + cwd + "'"
            : "Failed to start '" + spec.argv.front() + "'";
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            what, last_error_message(create_error)));
    }

    if (impl->job && !::AssignProcessToJobObject(impl->job, pi.hProcess)) {
        LOG_WARN("Could not place pid {} in a job object; descendants may outlive a timeout",
                 pi.dwProcessId);
    }
    ::ResumeThread(pi.hThread);
    ::CloseHandle(pi.hThread);

    impl->process = pi.hProcess;
    impl->pid = pi.dwProcessId;
    auto* raw = impl.get();
    impl->out_reader = std::thread([raw, out_read] {
        read_pipe(out_read, raw->out);
        ::CloseHandle(out_read);
    });
    impl->err_reader = std::thread([raw, err_read] {
        read_pipe(err_read, raw->err);
        ::CloseHandle(err_read);
    });

    LOG_DEBUG("Spawned pid {}: {}", impl->pid, cmd_line);
    return std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl)));
}

auto ChildProcess::wait_until(Clock::time_point deadline) -> bool {
    if (impl_->exited) return true;

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now());
    auto wait_ms = static_cast<DWORD>(std::max<int64_t>(remaining.count(), 0));
    if (::WaitForSingleObject(impl_->process, wait_ms) != WAIT_OBJECT_0) {
        return false;
    }

    DWORD code = 0;
    ::GetExitCodeProcess(impl_->process, &code);
    impl_->exit_code = static_cast<int>(code);
    impl_->exited = true;

    // Anything the child left running goes with the job.
    if (impl_->job) ::TerminateJobObject(impl_->job, 1);
    impl_->join_readers();
    return true;
}

void ChildProcess::terminate_tree() {
    if (impl_->exited) return;

    if (impl_->job) {
        ::TerminateJobObject(impl_->job, 1);
    } else {
        ::TerminateProcess(impl_->process, 1);
    }
    ::WaitForSingleObject(impl_->process, INFINITE);
    impl_->exited = true;
    impl_->exit_code.reset();
    impl_->join_readers();
}

auto ChildProcess::pid() const noexcept -> int64_t {
    return static_cast<int64_t>(impl_->pid);
}

#else

// ---------------------------------------------------------------------------
// POSIX: fork/exec with the child leading its own process group
// ---------------------------------------------------------------------------

namespace {

enum class SpawnStage : int {
    Chdir = 1,
    Exec = 2,
};

struct SpawnReport {
    SpawnStage stage;
    int error;
};

// Held from pipe creation until fork returns, so no concurrent spawn can
// fork while another spawn's pipes are still inheritable.
std::mutex g_spawn_mutex;

auto open_pipe(int fds[2]) -> bool {
#if defined(__linux__) || defined(__FreeBSD__) || defined(__NetBSD__) || defined(__OpenBSD__)
    return ::pipe2(fds, O_CLOEXEC) == 0;
#else
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

/// Resolves a bare program name against PATH, the way execvp would. Names
/// containing a slash are used as given.
auto resolve_program(const std::string& name) -> std::optional<std::string> {
    if (name.find('/') != std::string::npos) return name;

    const char* path_env = std::getenv("PATH");
    auto dirs = utils::split(path_env ? path_env : "/usr/bin:/bin", ':');
    for (const auto& dir : dirs) {
        auto full = std::filesystem::path(dir.empty() ? "." : dir) / name;
        std::error_code ec;
        if (std::filesystem::is_regular_file(full, ec) &&
            ::access(full.c_str(), X_OK) == 0) {
            return full.string();
        }
    }
    return std::nullopt;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// Only async-signal-safe calls below: this runs between fork and exec.
[[noreturn]] void exec_child(int out_fd, int err_fd, int report_fd,
                             const char* cwd, const char* program, char* const* argv) {
    ::setpgid(0, 0);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
    }
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);

    SpawnReport report{};
    if (cwd != nullptr && ::chdir(cwd) != 0) {
        report = {SpawnStage::Chdir, errno};
        [[maybe_unused]] auto n = ::write(report_fd, &report, sizeof(report));
        ::_exit(127);
    }

    ::execv(program, argv);

    report = {SpawnStage::Exec, errno};
    [[maybe_unused]] auto n = ::write(report_fd, &report, sizeof(report));
    ::_exit(127);
}

auto decode_status(int status) -> int {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // anonymous namespace

struct ChildProcess::Impl {
    pid_t pid = -1;
    int out_fd = -1;
    int err_fd = -1;
    bool exited = false;
    std::optional<int> exit_code;
    std::string out;
    std::string err;

    ~Impl() {
        close_fd(out_fd);
        close_fd(err_fd);
    }

    /// Reads whatever is available on `fd`; closes it on EOF or error.
    void drain(int& fd, std::string& sink) {
        char buf[4096];
        while (fd >= 0) {
            auto n = ::read(fd, buf, sizeof(buf));
            if (n > 0) {
                sink.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
            close_fd(fd);
        }
    }

    /// Polls the open pipes for at most `timeout_ms` and reads what arrives.
    void pump(int timeout_ms) {
        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd >= 0) fds[count++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[count++] = {err_fd, POLLIN, 0};
        if (count == 0) {
            if (timeout_ms > 0) ::poll(nullptr, 0, timeout_ms);
            return;
        }

        int rc = ::poll(fds, count, timeout_ms);
        if (rc <= 0) return;

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out_fd) drain(out_fd, out);
            else if (fds[i].fd == err_fd) drain(err_fd, err);
        }
    }

    /// True once the child has terminated. The zombie is left in place so
    /// the process group id stays reserved until the group is killed.
    auto child_terminated() -> bool {
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc != 0) return errno == ECHILD;
        return info.si_pid == pid;
    }

    void kill_group() {
        if (::killpg(pid, SIGKILL) != 0 && errno != ESRCH) {
            LOG_WARN("killpg({}) failed: {}", pid, std::strerror(errno));
        }
        ::kill(pid, SIGKILL);
    }

    auto reap() -> int {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) return -1;
        }
        return status;
    }

    /// Drains pipes until EOF or until `grace_ms` passes.
    void finish_output(int grace_ms) {
        auto until = Clock::now() + std::chrono::milliseconds(grace_ms);
        while ((out_fd >= 0 || err_fd >= 0) && Clock::now() < until) {
            pump(10);
        }
        close_fd(out_fd);
        close_fd(err_fd);
    }
};

ChildProcess::ChildProcess(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

ChildProcess::~ChildProcess() {
    if (impl_ && !impl_->exited) {
        terminate_tree();
    }
}

auto ChildProcess::spawn(const ProcessSpec& spec) -> Result<std::unique_ptr<ChildProcess>> {
    if (spec.argv.empty()) {
        return std::unexpected(make_error(ErrorCode::SpawnFailed, "Empty argument vector"));
    }

    // Everything the child needs is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::string cwd = spec.working_directory ? spec.working_directory->string() : "";

    auto program = resolve_program(spec.argv.front());
    if (!program) {
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to start '" + spec.argv.front() + "'", std::strerror(ENOENT)));
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int report_pipe[2] = {-1, -1};
    auto close_all = [&] {
        for (int* fds : {out_pipe, err_pipe, report_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
    };

    pid_t pid = -1;
    {
        std::lock_guard lock(g_spawn_mutex);

        if (!open_pipe(out_pipe) || !open_pipe(err_pipe) || !open_pipe(report_pipe)) {
            auto err = errno;
            close_all();
            return std::unexpected(make_error(ErrorCode::SpawnFailed,
                "Failed to create pipes", std::strerror(err)));
        }

        pid = ::fork();
        if (pid < 0) {
            auto err = errno;
            close_all();
            return std::unexpected(make_error(ErrorCode::SpawnFailed,
                "Failed to fork", std::strerror(err)));
        }

        if (pid == 0) {
            exec_child(out_pipe[1], err_pipe[1], report_pipe[1],
                       cwd.empty() ? nullptr : cwd.c_str(), program->c_str(), argv.data());
        }

        // Our write ends must be gone before another spawn may fork.
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(report_pipe[1]);
    }

    // Also set from the parent so the group exists before we might signal it.
    // EACCES here means the child already exec'ed, having set it itself.
    ::setpgid(pid, pid);

    // The report pipe is close-on-exec and no other child holds its write
    // end, so EOF arrives as soon as exec succeeds.
    SpawnReport report{};
    ssize_t n = 0;
    do {
        n = ::read(report_pipe[0], &report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(report_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);

        if (report.stage == SpawnStage::Chdir) {
            return std::unexpected(make_error(ErrorCode::SpawnFailed,
                "Cannot enter working directory '" + cwd + "'",
                std::strerror(report.error)));
        }
        return std::unexpected(make_error(ErrorCode::SpawnFailed,
            "Failed to start '" + spec.argv.front() + "'",
            std::strerror(report.error)));
    }

    ::fcntl(out_pipe[0], F_SETFL, ::fcntl(out_pipe[0], F_GETFL) | O_NONBLOCK);
    ::fcntl(err_pipe[0], F_SETFL, ::fcntl(err_pipe[0], F_GETFL) | O_NONBLOCK);

    auto impl = std::make_unique<Impl>();
    impl->pid = pid;
    impl->out_fd = out_pipe[0];
    impl->err_fd = err_pipe[0];

    LOG_DEBUG("Spawned pid {}: {}", pid, spec.argv.front());
    return std::unique_ptr<ChildProcess>(new ChildProcess(std::move(impl)));
}

auto ChildProcess::wait_until(Clock::time_point deadline) -> bool {
    auto& p = *impl_;
    if (p.exited) return true;

    while (true) {
        if (p.child_terminated()) {
            // Leftover descendants would hold the pipes open; kill them
            // while the zombie leader still reserves the group id.
            p.drain(p.out_fd, p.out);
            p.drain(p.err_fd, p.err);
            p.kill_group();
            int status = p.reap();
            p.exited = true;
            p.exit_code = status >= 0 ? std::optional<int>(decode_status(status)) : std::nullopt;
            p.finish_output(200);
            return true;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) {
            return false;
        }
        p.pump(static_cast<int>(std::min<int64_t>(remaining, 50)));
    }
}

void ChildProcess::terminate_tree() {
    auto& p = *impl_;
    if (p.exited) return;

    LOG_DEBUG("Killing process group {}", p.pid);
    p.kill_group();
    p.reap();
    p.exited = true;
    p.exit_code.reset();
    p.finish_output(200);
}

auto ChildProcess::pid() const noexcept -> int64_t {
    return static_cast<int64_t>(impl_->pid);
}

#endif

auto ChildProcess::exit_code() const noexcept -> std::optional<int> {
    return impl_->exit_code;
}

auto ChildProcess::has_exited() const noexcept -> bool {
    return impl_->exited;
}

auto ChildProcess::take_stdout() -> std::string {
    return std::exchange(impl_->out, {});
}

auto ChildProcess::take_stderr() -> std::string {
    return std::exchange(impl_->err, {});
}

auto run_process(const ProcessSpec& spec, std::chrono::milliseconds timeout)
    -> Result<ProcessOutcome> {
    auto deadline = Clock::now() + timeout;

    auto child = ChildProcess::spawn(spec);
    if (!child) return std::unexpected(child.error());

    auto& proc = **child;
    ProcessOutcome outcome;

    if (!proc.wait_until(deadline)) {
        LOG_WARN("pid {} exceeded {} ms, terminating process tree",
                 proc.pid(), timeout.count());
        proc.terminate_tree();
        outcome.timed_out = true;
    }

    outcome.exit_code = outcome.timed_out ? std::nullopt : proc.exit_code();
    outcome.stdout_text = proc.take_stdout();
    outcome.stderr_text = proc.take_stderr();
    return outcome;
}

} // namespace execbox::exec
