// CLI driver tests: exit codes and end-to-end runs against /bin/sh

#include "bench/interrupt.hpp"
#include "cli/driver.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace compbench::cli;
namespace fs = std::filesystem;

class DriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        compbench::bench::reset_interrupt();
    }

    void TearDown() override {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
        compbench::bench::reset_interrupt();
    }

    int run(std::vector<std::string> args) {
        args.insert(args.begin(), "compbench");
        storage_ = std::move(args);
        argv_.clear();
        for (auto& a : storage_) {
            argv_.push_back(a.data());
        }
        argv_.push_back(nullptr);

        ::testing::internal::CaptureStdout();
        int code = compbench_main(static_cast<int>(storage_.size()), argv_.data());
        stdout_ = ::testing::internal::GetCapturedStdout();
        return code;
    }

    // Stand-in compiler: `sh -c <script> sh <input>`
    static std::vector<std::string> shell_compiler(const std::string& script) {
        return {"--compiler=/bin/sh", "--arg=-c", "--arg=" + script, "--arg=sh", "--input-flag=",
                "--no-color", "-q"};
    }

    std::string stdout_;

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

TEST_F(DriverTest, ListPrintsBuiltInNames) {
    EXPECT_EQ(run({"--list"}), EXIT_OK);
    EXPECT_NE(stdout_.find("Basic Switch (3 cases)\n"), std::string::npos);
    EXPECT_NE(stdout_.find("Complex switch with nested control flow\n"), std::string::npos);
}

TEST_F(DriverTest, VersionAndHelp) {
    EXPECT_EQ(run({"--version"}), EXIT_OK);
    EXPECT_EQ(stdout_, "compbench 0.1.0\n");

    EXPECT_EQ(run({"--help"}), EXIT_OK);
    EXPECT_NE(stdout_.find("Usage: compbench"), std::string::npos);
}

TEST_F(DriverTest, BadOptionIsHarnessFault) {
    EXPECT_EQ(run({"--iterations=0"}), EXIT_HARNESS_FAULT);
    EXPECT_EQ(run({"--bogus"}), EXIT_HARNESS_FAULT);
}

TEST_F(DriverTest, BadOptionUsageGoesToStderr) {
    ::testing::internal::CaptureStderr();
    int code = run({"--bogus"});
    std::string err = ::testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, EXIT_HARNESS_FAULT);
    EXPECT_NE(err.find("error: "), std::string::npos);
    EXPECT_NE(err.find("Usage: compbench"), std::string::npos);
    EXPECT_EQ(stdout_.find("Usage: compbench"), std::string::npos);
}

TEST_F(DriverTest, MissingCompilerIsHarnessFault) {
    EXPECT_EQ(run({"--compiler=/nonexistent/compbench-no-such-binary", "-q"}),
              EXIT_HARNESS_FAULT);
    EXPECT_EQ(stdout_.find("Benchmark: "), std::string::npos);
}

TEST_F(DriverTest, NoMatchingPatternRunsNothing) {
    EXPECT_EQ(run({"no benchmark is called this"}), EXIT_OK);
    EXPECT_NE(stdout_.find("No benchmarks matched"), std::string::npos);
}

TEST_F(DriverTest, RunsEveryBenchmark) {
    auto args = shell_compiler("test -s \"$1\"");
    args.push_back("--iterations=2");

    EXPECT_EQ(run(args), EXIT_OK);
    size_t blocks = 0;
    for (size_t pos = stdout_.find("Benchmark: "); pos != std::string::npos;
         pos = stdout_.find("Benchmark: ", pos + 1)) {
        ++blocks;
    }
    EXPECT_EQ(blocks, 4u);
    EXPECT_NE(stdout_.find("4 benchmarks: 4 passed, 0 failed"), std::string::npos);
}

TEST_F(DriverTest, FailingCompilerStillExitsZero) {
    auto args = shell_compiler("echo 'unsupported' >&2; exit 1");
    args.push_back("--iterations=2");
    args.push_back("fallthrough");

    EXPECT_EQ(run(args), EXIT_OK);
    EXPECT_NE(stdout_.find("Failed: execution failure (exit code 1) on iteration 1"),
              std::string::npos);
    EXPECT_NE(stdout_.find("    unsupported"), std::string::npos);
}

TEST_F(DriverTest, SigintExitsWithInterruptedCode) {
    // Handlers go in before the signal can possibly arrive
    compbench::bench::install_interrupt_handlers();

    auto args = shell_compiler("sleep 10");
    args.push_back("--iterations=3");
    args.push_back("Complex");

    std::thread interrupter([] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        ::kill(::getpid(), SIGINT);
    });
    int code = run(args);
    interrupter.join();

    EXPECT_EQ(code, EXIT_INTERRUPTED);
    EXPECT_EQ(stdout_.find("killed by signal"), std::string::npos);
    EXPECT_NE(stdout_.find("Interrupted, remaining benchmarks skipped"), std::string::npos);
}

TEST_F(DriverTest, WritesJsonSummary) {
    fs::path json = fs::temp_directory_path() / "compbench_driver_test.json";
    fs::remove(json);

    auto args = shell_compiler("exit 0");
    args.push_back("--iterations=1");
    args.push_back("--json=" + json.string());
    args.push_back("Basic");

    EXPECT_EQ(run(args), EXIT_OK);

    std::ifstream in(json);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("\"name\": \"Basic Switch (3 cases)\""), std::string::npos);
    EXPECT_NE(content.str().find("\"passed\": 1"), std::string::npos);
    fs::remove(json);
}

TEST_F(DriverTest, UnwritableJsonIsHarnessFault) {
    auto args = shell_compiler("exit 0");
    args.push_back("--iterations=1");
    args.push_back("--json=/nonexistent-compbench-dir/out.json");
    args.push_back("Basic");

    EXPECT_EQ(run(args), EXIT_HARNESS_FAULT);
    // The report itself is still printed
    EXPECT_NE(stdout_.find("Benchmark: Basic Switch"), std::string::npos);
}
