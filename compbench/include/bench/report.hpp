//! # Report Printer
//!
//! Drives a benchmark run: walks the registry in order, measures each case,
//! summarizes the samples and prints one block per case.
//!
//! ## Output Format
//!
//! ```text
//! Benchmark: Basic Switch (3 cases)
//! --------------------------------------------------
//!   Average time: 12.34 ms
//!   Min time: 11.02 ms
//!   Max time: 15.90 ms
//!   Std dev: 0.88 ms
//!   Throughput: 81.04 compiles/sec
//! ```
//!
//! A failing case prints its failure and captured stderr instead, and the
//! run moves on to the next case.

#pragma once

#include "bench/statistics.hpp"
#include "bench/test_case.hpp"
#include "bench/timed_invoker.hpp"
#include "common.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace compbench::bench {

// ANSI color codes for terminal output
namespace colors {
inline const char* reset = "\033[0m";
inline const char* bold = "\033[1m";
inline const char* dim = "\033[2m";
inline const char* red = "\033[31m";
inline const char* green = "\033[32m";
inline const char* yellow = "\033[33m";
inline const char* cyan = "\033[36m";
} // namespace colors

// Color helper that respects --no-color
struct ColorOutput {
    bool enabled;

    explicit ColorOutput(bool use_color) : enabled(use_color) {}

    const char* reset() const {
        return enabled ? colors::reset : "";
    }
    const char* bold() const {
        return enabled ? colors::bold : "";
    }
    const char* dim() const {
        return enabled ? colors::dim : "";
    }
    const char* red() const {
        return enabled ? colors::red : "";
    }
    const char* green() const {
        return enabled ? colors::green : "";
    }
    const char* yellow() const {
        return enabled ? colors::yellow : "";
    }
    const char* cyan() const {
        return enabled ? colors::cyan : "";
    }
};

struct ReportOptions {
    int iterations = 50;
    std::chrono::milliseconds timeout{30000};
    bool colors = false;
    std::string title = "Compiler Benchmark Results";
};

/// Why a case produced no statistics.
struct CaseFailure {
    std::string kind;     ///< "execution failure", "aggregation violation", ...
    std::string headline; ///< e.g. "execution failure (exit code 1) on iteration 3"
    std::string diagnostic;
    bool interrupted = false; ///< the run was cancelled during this case
};

struct CaseReport {
    std::string name;
    int iterations = 0;
    Result<Statistics, CaseFailure> result = CaseFailure{};
};

struct ReportSummary {
    std::vector<CaseReport> cases;
    int passed = 0;
    int failed = 0;
    bool interrupted = false;
    int64_t duration_ms = 0;
};

class ReportPrinter {
public:
    ReportPrinter(TestCaseRegistry registry, TimedInvoker& invoker, ReportOptions options,
                  std::ostream& out)
        : registry_(std::move(registry)), invoker_(invoker), options_(std::move(options)),
          out_(out) {}

    /// Measures and prints every case in registry order. Stops early only
    /// when the harness is interrupted.
    ReportSummary run();

private:
    CaseReport measure_case(const TestCase& test_case);
    void print_header(const ColorOutput& c);
    void print_case(const CaseReport& report, const ColorOutput& c);
    void print_summary(const ReportSummary& summary, const ColorOutput& c);

    TestCaseRegistry registry_;
    TimedInvoker& invoker_;
    ReportOptions options_;
    std::ostream& out_;
};

/// Human-readable duration: "850ms", "12.34s", "2m 5s".
std::string format_duration(int64_t ms);

/// One-line description of an invocation error.
std::string describe_failure(const InvocationError& error);

// ============================================================================
// JSON Summary
// ============================================================================

/// Writes the machine-readable summary of a run.
void write_json_report(const ReportSummary& summary, std::ostream& out);

/// Writes the JSON summary to `path`. Returns false if the file could not
/// be written.
bool save_json_report(const std::string& path, const ReportSummary& summary);

} // namespace compbench::bench
