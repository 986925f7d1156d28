//! # Subprocess Invoker Tests
//!
//! Real child processes via /bin/sh: exit status, stderr capture, timeout
//! kills, launch failures, and end-to-end measurement through TimedInvoker.

#include "bench/interrupt.hpp"
#include "bench/invoker.hpp"
#include "bench/temp_file.hpp"
#include "bench/timed_invoker.hpp"

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <signal.h>
#include <thread>
#include <unistd.h>

using namespace compbench;
using namespace compbench::bench;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

/// `sh -c <script> sh <input>`: the input path arrives as $1.
CompilerCommand shell(const std::string& script) {
    return CompilerCommand{"/bin/sh", {"-c", script, "sh"}, ""};
}

/// True once `pid` has exited: no /proc entry, or a zombie awaiting its
/// new parent. Polls for up to two seconds since SIGKILL lands asynchronously.
bool process_gone(pid_t pid) {
    const fs::path stat_path = fs::path("/proc") / std::to_string(pid) / "stat";
    for (int attempt = 0; attempt < 200; ++attempt) {
        std::ifstream in(stat_path);
        if (!in) {
            return true;
        }
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        // "pid (comm) S ...": the state follows the last ')'
        size_t paren = contents.rfind(')');
        if (paren != std::string::npos && paren + 2 < contents.size() &&
            contents[paren + 2] == 'Z') {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

void restore_default(int signo) {
    struct sigaction action {};
    action.sa_handler = SIG_DFL;
    sigemptyset(&action.sa_mask);
    sigaction(signo, &action, nullptr);
}

} // namespace

class SubprocessInvokerTest : public ::testing::Test {
protected:
    void SetUp() override {
        reset_interrupt();
        auto file = ScopedTempFile::create("switch (x) { case 1: break; }\n");
        ASSERT_TRUE(is_ok(file));
        input_ = std::make_unique<ScopedTempFile>(std::move(unwrap(file)));
    }

    void TearDown() override {
        reset_interrupt();
    }

    const fs::path& input() const {
        return input_->path();
    }

    std::unique_ptr<ScopedTempFile> input_;
};

// ============================================================================
// Command Line
// ============================================================================

TEST(CompilerCommandTest, DefaultIsCargoRun) {
    CompilerCommand command;
    auto argv = command.argv_for("/tmp/in.js");

    std::vector<std::string> expected = {"cargo", "run",     "--release", "--bin",
                                         "react-compiler-rust", "--", "--input", "/tmp/in.js"};
    EXPECT_EQ(argv, expected);
    EXPECT_EQ(command.describe(),
              "cargo run --release --bin react-compiler-rust -- --input <input>");
}

TEST(CompilerCommandTest, EmptyInputFlagPassesPathBare) {
    CompilerCommand command{"swc", {"compile"}, ""};
    std::vector<std::string> expected = {"swc", "compile", "/tmp/a.js"};
    EXPECT_EQ(command.argv_for("/tmp/a.js"), expected);
}

TEST(ResolveExecutableTest, FindsShellOnPath) {
    auto found = resolve_executable("sh");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->filename(), "sh");
}

TEST(ResolveExecutableTest, AbsolutePath) {
    EXPECT_TRUE(resolve_executable("/bin/sh").has_value());
    EXPECT_FALSE(resolve_executable("/nonexistent/compbench-no-such-binary").has_value());
}

TEST(ResolveExecutableTest, MissingName) {
    EXPECT_FALSE(resolve_executable("compbench-no-such-binary-xyz").has_value());
    EXPECT_FALSE(resolve_executable("").has_value());
}

// ============================================================================
// Single Invocation
// ============================================================================

TEST_F(SubprocessInvokerTest, SuccessfulRun) {
    SubprocessInvoker invoker(shell("exit 0"));
    auto outcome = invoker.invoke(input(), 5000ms);

    EXPECT_TRUE(outcome.launched);
    EXPECT_TRUE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_GT(outcome.elapsed.count(), 0);
}

TEST_F(SubprocessInvokerTest, ChildReadsInputFile) {
    SubprocessInvoker invoker(shell("grep -q 'case 1' \"$1\""));
    auto outcome = invoker.invoke(input(), 5000ms);

    EXPECT_TRUE(outcome.succeeded()) << outcome.stderr_output;
}

TEST_F(SubprocessInvokerTest, NonZeroExitCapturesStderr) {
    SubprocessInvoker invoker(shell("echo boom >&2; echo ignored; exit 3"));
    auto outcome = invoker.invoke(input(), 5000ms);

    EXPECT_TRUE(outcome.launched);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_NE(outcome.stderr_output.find("boom"), std::string::npos);
    // stdout goes to /dev/null
    EXPECT_EQ(outcome.stderr_output.find("ignored"), std::string::npos);
}

TEST_F(SubprocessInvokerTest, KilledBySignal) {
    SubprocessInvoker invoker(shell("kill -KILL $$"));
    auto outcome = invoker.invoke(input(), 5000ms);

    EXPECT_TRUE(outcome.launched);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_EQ(outcome.term_signal, SIGKILL);
}

TEST_F(SubprocessInvokerTest, LargeStderrIsCapped) {
    // ~200 KiB of stderr must neither deadlock the child nor be kept whole
    SubprocessInvoker invoker(
        shell("i=0; while [ $i -lt 4000 ]; do echo "
              "'xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx' >&2; i=$((i+1)); done; exit 1"));
    auto outcome = invoker.invoke(input(), 30000ms);

    EXPECT_FALSE(outcome.timed_out);
    EXPECT_EQ(outcome.exit_code, 1);
    EXPECT_EQ(outcome.stderr_output.size(), SubprocessInvoker::MAX_STDERR_BYTES);
}

TEST_F(SubprocessInvokerTest, TimeoutKillsChild) {
    SubprocessInvoker invoker(shell("echo partial >&2; sleep 10"));

    auto started = std::chrono::steady_clock::now();
    auto outcome = invoker.invoke(input(), 200ms);
    auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(outcome.launched);
    EXPECT_TRUE(outcome.timed_out);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_LT(waited, 5s);
    EXPECT_GE(outcome.elapsed, 200ms);
    EXPECT_NE(outcome.stderr_output.find("partial"), std::string::npos);

    // Reaped: the pid no longer exists
    ASSERT_GT(outcome.pid, 0);
    errno = 0;
    EXPECT_EQ(::kill(static_cast<pid_t>(outcome.pid), 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(SubprocessInvokerTest, TimeoutKillsGrandchildren) {
    fs::path pid_file = fs::temp_directory_path() /
                        ("compbench-grandchild-" + std::to_string(::getpid()));
    fs::remove(pid_file);

    // The background sleep holds stderr open; it must die with the group
    SubprocessInvoker invoker(shell("sleep 10 & echo $! > '" + pid_file.string() + "'; wait"));

    auto started = std::chrono::steady_clock::now();
    auto outcome = invoker.invoke(input(), 200ms);
    auto waited = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(outcome.timed_out);
    EXPECT_LT(waited, 5s);

    pid_t grandchild = 0;
    {
        std::ifstream in(pid_file);
        in >> grandchild;
    }
    fs::remove(pid_file);
    ASSERT_GT(grandchild, 0);
    EXPECT_NE(grandchild, static_cast<pid_t>(outcome.pid));
    EXPECT_TRUE(process_gone(grandchild)) << "grandchild " << grandchild << " still running";
}

TEST_F(SubprocessInvokerTest, MissingExecutableIsSpawnFailure) {
    SubprocessInvoker invoker(CompilerCommand{"/nonexistent/compbench-no-such-binary", {}, ""});
    auto outcome = invoker.invoke(input(), 5000ms);

    EXPECT_FALSE(outcome.launched);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_NE(outcome.stderr_output.find("failed to launch"), std::string::npos);
}

TEST_F(SubprocessInvokerTest, InterruptKillsChild) {
    SubprocessInvoker invoker(shell("sleep 10"));

    std::thread interrupter([] {
        std::this_thread::sleep_for(100ms);
        request_interrupt();
    });
    auto outcome = invoker.invoke(input(), 10000ms);
    interrupter.join();

    EXPECT_TRUE(outcome.interrupted);
    EXPECT_FALSE(outcome.timed_out);
    EXPECT_LT(outcome.elapsed, 5s);
}

TEST_F(SubprocessInvokerTest, IgnoredSigchldIsNotSuccess) {
    // waitpid() cannot report the status, so the exit code must stay unknown
    std::signal(SIGCHLD, SIG_IGN);
    SubprocessInvoker invoker(shell("echo boom >&2; exit 1"));
    auto outcome = invoker.invoke(input(), 5000ms);
    restore_default(SIGCHLD);

    EXPECT_TRUE(outcome.launched);
    EXPECT_FALSE(outcome.succeeded());
    EXPECT_NE(outcome.exit_code, 0);
}

TEST_F(SubprocessInvokerTest, InstallingHandlersRestoresSigchld) {
    std::signal(SIGCHLD, SIG_IGN);
    install_interrupt_handlers();

    struct sigaction current {};
    ASSERT_EQ(sigaction(SIGCHLD, nullptr, &current), 0);
    EXPECT_EQ(current.sa_handler, SIG_DFL);

    SubprocessInvoker invoker(shell("exit 1"));
    auto outcome = invoker.invoke(input(), 5000ms);
    EXPECT_EQ(outcome.exit_code, 1);

    restore_default(SIGINT);
    restore_default(SIGTERM);
}

// ============================================================================
// End to End through TimedInvoker
// ============================================================================

TEST_F(SubprocessInvokerTest, MeasuresRealInvocations) {
    SubprocessInvoker process(shell("sleep 0.01"));
    TimedInvoker invoker(process);

    auto result = invoker.measure("function f() {}", 10, 5000ms);

    ASSERT_TRUE(is_ok(result));
    const auto& samples = unwrap(result);
    ASSERT_EQ(samples.size(), 10u);
    for (double s : samples) {
        EXPECT_GE(s, 0.005);
        EXPECT_LT(s, 5.0);
    }

    auto stats = summarize(samples);
    ASSERT_TRUE(is_ok(stats));
    EXPECT_LE(unwrap(stats).min, unwrap(stats).mean);
    EXPECT_LE(unwrap(stats).mean, unwrap(stats).max);
}

TEST_F(SubprocessInvokerTest, ThirdRunFailsWithItsStderr) {
    fs::path counter = fs::temp_directory_path() /
                       ("compbench-counter-" + std::to_string(::getpid()));
    fs::remove(counter);

    const std::string c = "'" + counter.string() + "'";
    SubprocessInvoker process(shell("n=$(cat " + c + " 2>/dev/null || echo 0); n=$((n+1)); "
                                    "echo $n > " + c + "; "
                                    "if [ $n -eq 3 ]; then echo \"Error: unsupported syntax\" >&2; "
                                    "exit 1; fi"));
    TimedInvoker invoker(process);

    auto result = invoker.measure("switch (x) {}", 10, 5000ms);
    fs::remove(counter);

    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.kind, InvocationErrorKind::ExecutionFailure);
    EXPECT_EQ(error.iteration, 3);
    EXPECT_EQ(error.exit_code, 1);
    EXPECT_NE(error.diagnostic.find("Error: unsupported syntax"), std::string::npos);
}

TEST_F(SubprocessInvokerTest, SigintDuringRunIsInterrupted) {
    install_interrupt_handlers();
    SubprocessInvoker process(shell("sleep 10"));
    TimedInvoker invoker(process);

    std::thread interrupter([] {
        std::this_thread::sleep_for(200ms);
        ::kill(::getpid(), SIGINT);
    });
    auto started = std::chrono::steady_clock::now();
    auto result = invoker.measure("abc", 3, 20000ms);
    auto waited = std::chrono::steady_clock::now() - started;
    interrupter.join();

    restore_default(SIGINT);
    restore_default(SIGTERM);

    EXPECT_TRUE(interrupt_requested());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, InvocationErrorKind::Interrupted);
    EXPECT_EQ(unwrap_err(result).iteration, 1);
    EXPECT_LT(waited, 5s);
}

TEST_F(SubprocessInvokerTest, NextMeasurementRunsAfterTimeout) {
    SubprocessInvoker slow(shell("sleep 10"));
    SubprocessInvoker fast(shell("exit 0"));

    auto timed_out = TimedInvoker(slow).measure("a", 3, 200ms);
    ASSERT_TRUE(is_err(timed_out));
    EXPECT_EQ(unwrap_err(timed_out).kind, InvocationErrorKind::TimeoutFailure);
    EXPECT_EQ(unwrap_err(timed_out).iteration, 1);

    auto ok = TimedInvoker(fast).measure("b", 3, 5000ms);
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).size(), 3u);
}
