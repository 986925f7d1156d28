//! # Subprocess Invoker
//!
//! Runs the compiler under test as a child process:
//!
//! 1. fork; the child becomes a process group leader, binds stdin/stdout to
//!    /dev/null and stderr to a pipe, then execvp's the command
//! 2. a close-on-exec "exec pipe" tells the parent whether execvp failed,
//!    so a missing binary is a spawn failure rather than exit code 127
//! 3. the parent polls waitpid(WNOHANG) while draining stderr, and sends
//!    SIGKILL to the whole group on timeout or interrupt
//!
//! Elapsed time runs from just before fork() to the moment the child is
//! reaped.

#include "bench/interrupt.hpp"
#include "bench/invoker.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace compbench::bench {

// ============================================================================
// CompilerCommand
// ============================================================================

std::vector<std::string> CompilerCommand::argv_for(const fs::path& input) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 3);
    argv.push_back(executable);
    argv.insert(argv.end(), args.begin(), args.end());
    if (!input_flag.empty()) {
        argv.push_back(input_flag);
    }
    argv.push_back(input.string());
    return argv;
}

std::string CompilerCommand::describe() const {
    std::ostringstream oss;
    oss << executable;
    for (const auto& a : args) {
        oss << ' ' << a;
    }
    if (!input_flag.empty()) {
        oss << ' ' << input_flag;
    }
    oss << " <input>";
    return oss.str();
}

// ============================================================================
// Executable Lookup
// ============================================================================

std::optional<fs::path> resolve_executable(const std::string& name) {
    auto is_executable_file = [](const fs::path& p) {
        struct stat st {};
        return ::stat(p.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name))
            return fs::path(name);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    std::string_view search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t pos = 0;
    while (pos <= search.size()) {
        size_t colon = search.find(':', pos);
        if (colon == std::string_view::npos)
            colon = search.size();

        // An empty PATH entry means the current directory
        std::string_view dir = search.substr(pos, colon - pos);
        fs::path candidate = dir.empty() ? fs::path(".") / name : fs::path(dir) / name;
        if (is_executable_file(candidate))
            return candidate;

        pos = colon + 1;
    }
    return std::nullopt;
}

// ============================================================================
// Child Process Plumbing
// ============================================================================

namespace {

using Clock = std::chrono::steady_clock;

constexpr int POLL_INTERVAL_MS = 1;

/// Closes the descriptors it holds when it goes out of scope.
struct FdPair {
    int fds[2] = {-1, -1};

    ~FdPair() {
        close_read();
        close_write();
    }
    int read_end() const {
        return fds[0];
    }
    int write_end() const {
        return fds[1];
    }
    void close_read() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }
    void close_write() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};

/// Reads whatever is available on a non-blocking fd.
/// Returns false once the write end is closed (EOF) or reading fails.
bool drain_pipe(int fd, std::string& out) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = SubprocessInvoker::MAX_STDERR_BYTES - std::min(out.size(),
                                                               SubprocessInvoker::MAX_STDERR_BYTES);
            out.append(buf, std::min(static_cast<size_t>(n), room));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void kill_process_group(pid_t pid) {
    if (::kill(-pid, SIGKILL) != 0) {
        // Group not formed yet (child still before setpgid); hit the child itself
        ::kill(pid, SIGKILL);
    }
}

/// Blocking reap that survives EINTR.
pid_t reap(pid_t pid, int* status) {
    pid_t ret;
    do {
        ret = ::waitpid(pid, status, 0);
    } while (ret < 0 && errno == EINTR);
    return ret;
}

void record_exit_status(int status, InvocationOutcome& outcome) {
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = -1;
        outcome.term_signal = WTERMSIG(status);
    }
}

[[noreturn]] void exec_child(const std::vector<char*>& c_args, int stderr_fd, int exec_fd) {
    ::setpgid(0, 0);

    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(devnull, STDOUT_FILENO);
    }
    ::dup2(stderr_fd, STDERR_FILENO);

    ::execvp(c_args[0], c_args.data());

    int err = errno;
    ssize_t written = ::write(exec_fd, &err, sizeof(err));
    (void)written;
    ::_exit(127);
}

} // namespace

// ============================================================================
// SubprocessInvoker
// ============================================================================

InvocationOutcome SubprocessInvoker::invoke(const fs::path& input,
                                            std::chrono::milliseconds timeout) {
    InvocationOutcome outcome;

    const std::vector<std::string> argv = command_.argv_for(input);
    std::vector<char*> c_args;
    c_args.reserve(argv.size() + 1);
    for (const auto& a : argv) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    FdPair stderr_pipe;
    FdPair exec_pipe;
    if (::pipe2(stderr_pipe.fds, O_CLOEXEC) != 0 || ::pipe2(exec_pipe.fds, O_CLOEXEC) != 0) {
        outcome.stderr_output = std::string("failed to create pipes: ") + std::strerror(errno);
        return outcome;
    }

    const auto start = Clock::now();

    pid_t pid = ::fork();
    if (pid < 0) {
        outcome.stderr_output = std::string("failed to fork: ") + std::strerror(errno);
        return outcome;
    }
    if (pid == 0) {
        exec_child(c_args, stderr_pipe.write_end(), exec_pipe.write_end());
    }

    // Also set the group from the parent so a kill(-pid) right away works.
    // EACCES here just means the child already exec'd after its own setpgid.
    ::setpgid(pid, pid);
    set_active_process_group(pid);
    outcome.pid = pid;

    stderr_pipe.close_write();
    exec_pipe.close_write();

    // EOF = exec succeeded (close-on-exec); an int = errno of the failed execvp
    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe.read_end(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    exec_pipe.close_read();

    int status = 0;
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        reap(pid, &status);
        set_active_process_group(0);
        outcome.elapsed = Clock::now() - start;
        outcome.stderr_output =
            "failed to launch '" + command_.executable + "': " + std::strerror(exec_errno);
        COMPBENCH_LOG_DEBUG("invoke", outcome.stderr_output);
        return outcome;
    }

    outcome.launched = true;
    COMPBENCH_LOG_TRACE("invoke", "Spawned pid " << pid << " for " << input);

    int err_fd = stderr_pipe.read_end();
    if (::fcntl(err_fd, F_SETFL, O_NONBLOCK) != 0) {
        COMPBENCH_LOG_WARN("invoke", "Cannot make stderr pipe non-blocking: "
                                         << std::strerror(errno));
    }
    bool stderr_open = true;
    bool wait_failed = false;

    const auto deadline = start + timeout;

    while (true) {
        pid_t ret = ::waitpid(pid, &status, WNOHANG);
        if (ret == pid) {
            break;
        }
        if (ret < 0 && errno != EINTR) {
            // e.g. ECHILD under an inherited SIGCHLD=SIG_IGN: the status is lost
            outcome.stderr_output += std::string("waitpid failed: ") + std::strerror(errno);
            COMPBENCH_LOG_WARN("invoke", "Cannot wait for pid " << pid << ": " << std::strerror(errno));
            kill_process_group(pid);
            reap(pid, &status);
            wait_failed = true;
            break;
        }

        if (interrupt_requested()) {
            kill_process_group(pid);
            reap(pid, &status);
            outcome.interrupted = true;
            break;
        }

        auto now = Clock::now();
        if (now >= deadline) {
            kill_process_group(pid);
            reap(pid, &status);
            outcome.timed_out = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(std::clamp<int64_t>(remaining.count(), 0, POLL_INTERVAL_MS));

        if (stderr_open) {
            struct pollfd pfd {};
            pfd.fd = err_fd;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, wait_ms) > 0) {
                stderr_open = drain_pipe(err_fd, outcome.stderr_output);
            }
        } else {
            ::poll(nullptr, 0, wait_ms);
        }
    }

    outcome.elapsed = Clock::now() - start;
    set_active_process_group(0);

    // The signal handler kills the group itself, so the child can be reaped
    // before the loop ever sees the flag
    if (!outcome.timed_out && interrupt_requested()) {
        outcome.interrupted = true;
    }

    if (stderr_open) {
        drain_pipe(err_fd, outcome.stderr_output);
    }

    if (outcome.timed_out || outcome.interrupted || wait_failed) {
        outcome.exit_code = -1;
    } else {
        record_exit_status(status, outcome);
    }

    COMPBENCH_LOG_TRACE("invoke", "pid " << pid << " finished: exit=" << outcome.exit_code
                                         << " signal=" << outcome.term_signal
                                         << " timed_out=" << outcome.timed_out << " elapsed_us="
                                         << std::chrono::duration_cast<std::chrono::microseconds>(
                                                outcome.elapsed)
                                                .count());
    return outcome;
}

} // namespace compbench::bench
