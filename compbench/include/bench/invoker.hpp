//! # Process Invoker
//!
//! The narrow seam between the harness and the compiler under test:
//! `invoke(input, timeout)` runs the compiler once on one input file and
//! reports how it ended and how long it took.
//!
//! | Type                | Description                                  |
//! |---------------------|----------------------------------------------|
//! | `CompilerCommand`   | Executable, fixed flags and the input flag   |
//! | `InvocationOutcome` | Exit status, captured stderr, elapsed time   |
//! | `ProcessInvoker`    | Abstract seam (faked in tests)               |
//! | `SubprocessInvoker` | fork + execvp implementation                 |
//!
//! ## Child Process Contract
//!
//! ```text
//! <executable> <args...> <input_flag> <input_path>
//! ```
//!
//! stdin and stdout are bound to /dev/null, stderr is captured. The child
//! leads its own process group so a timeout can take down everything it
//! spawned (e.g. the compiler started by `cargo run`).

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace compbench::bench {

/// How the compiler under test is launched.
///
/// The default mirrors `cargo run --release --bin react-compiler-rust -- --input <file>`.
struct CompilerCommand {
    std::string executable = "cargo";
    std::vector<std::string> args = default_args();
    std::string input_flag = "--input"; ///< Empty = pass the path bare

    static std::vector<std::string> default_args() {
        return {"run", "--release", "--bin", "react-compiler-rust", "--"};
    }

    /// Full argv (argv[0] = executable) for one invocation on `input`.
    std::vector<std::string> argv_for(const std::filesystem::path& input) const;

    /// Shell-like rendering for logs and the report header.
    std::string describe() const;
};

struct InvocationOutcome {
    bool launched = false;    ///< false: spawn failed, nothing ran
    int exit_code = -1;       ///< valid when the process exited normally
    int term_signal = 0;      ///< non-zero when killed by a signal
    bool timed_out = false;   ///< killed by the harness after the timeout
    bool interrupted = false; ///< killed because the harness was interrupted
    std::string stderr_output;
    std::chrono::nanoseconds elapsed{0};
    long pid = -1;

    bool succeeded() const {
        return launched && !timed_out && !interrupted && term_signal == 0 && exit_code == 0;
    }
};

class ProcessInvoker {
public:
    virtual ~ProcessInvoker() = default;

    /// Runs the target once on `input`, waiting at most `timeout`.
    /// Never throws; every failure is described by the outcome.
    virtual InvocationOutcome invoke(const std::filesystem::path& input,
                                     std::chrono::milliseconds timeout) = 0;
};

class SubprocessInvoker : public ProcessInvoker {
public:
    explicit SubprocessInvoker(CompilerCommand command) : command_(std::move(command)) {}

    InvocationOutcome invoke(const std::filesystem::path& input,
                             std::chrono::milliseconds timeout) override;

    const CompilerCommand& command() const {
        return command_;
    }

    /// Upper bound on captured stderr per invocation; the rest is dropped.
    static constexpr size_t MAX_STDERR_BYTES = 64 * 1024;

private:
    CompilerCommand command_;
};

/// Looks `name` up the way execvp does: paths containing '/' are taken as
/// is, bare names are searched on PATH. Returns the executable's path, or
/// nullopt when nothing executable is found.
std::optional<std::filesystem::path> resolve_executable(const std::string& name);

} // namespace compbench::bench
