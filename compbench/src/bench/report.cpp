#include "bench/report.hpp"

#include "bench/interrupt.hpp"
#include "log/log.hpp"

#include <iomanip>
#include <sstream>

namespace compbench::bench {

// ============================================================================
// Formatting Helpers
// ============================================================================

std::string format_duration(int64_t ms) {
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else if (ms < 60000) {
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        int64_t minutes = ms / 60000;
        int64_t seconds = (ms % 60000) / 1000;
        oss << minutes << "m " << seconds << "s";
    }
    return oss.str();
}

std::string describe_failure(const InvocationError& error) {
    std::ostringstream oss;
    oss << error_kind_name(error.kind);
    if (error.kind == InvocationErrorKind::ExecutionFailure) {
        if (error.term_signal != 0) {
            oss << " (killed by signal " << error.term_signal << ")";
        } else {
            oss << " (exit code " << error.exit_code << ")";
        }
    }
    if (error.iteration > 0) {
        oss << " on iteration " << error.iteration;
    }
    return oss.str();
}

namespace {

std::string format_ms(double seconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << seconds * 1000.0 << " ms";
    return oss.str();
}

std::string format_throughput(double throughput) {
    if (throughput == kUndefinedThroughput) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << throughput << " compiles/sec";
    return oss.str();
}

} // namespace

// ============================================================================
// ReportPrinter
// ============================================================================

ReportSummary ReportPrinter::run() {
    ColorOutput c(options_.colors);
    ReportSummary summary;

    auto start_time = std::chrono::steady_clock::now();
    print_header(c);

    for (const auto& test_case : registry_) {
        if (interrupt_requested()) {
            summary.interrupted = true;
            break;
        }

        CaseReport report = measure_case(test_case);
        print_case(report, c);

        if (is_ok(report.result)) {
            summary.passed++;
        } else {
            summary.failed++;
            if (unwrap_err(report.result).interrupted) {
                summary.interrupted = true;
                summary.cases.push_back(std::move(report));
                break;
            }
        }
        summary.cases.push_back(std::move(report));
    }
    if (interrupt_requested()) {
        summary.interrupted = true;
    }

    auto end_time = std::chrono::steady_clock::now();
    summary.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();

    print_summary(summary, c);
    return summary;
}

CaseReport ReportPrinter::measure_case(const TestCase& test_case) {
    CaseReport report;
    report.name = test_case.name;
    report.iterations = options_.iterations;

    COMPBENCH_LOG_INFO("report", "Benchmarking '" << test_case.name << "' ("
                                                  << options_.iterations << " iterations)");

    auto samples = invoker_.measure(test_case.source, options_.iterations, options_.timeout);
    if (is_err(samples)) {
        const auto& error = unwrap_err(samples);
        COMPBENCH_LOG_WARN("report", "'" << test_case.name << "' failed: " << describe_failure(error));
        CaseFailure failure{error_kind_name(error.kind), describe_failure(error), error.diagnostic};
        failure.interrupted = error.kind == InvocationErrorKind::Interrupted;
        report.result = std::move(failure);
        return report;
    }

    auto stats = summarize(unwrap(samples));
    if (is_err(stats)) {
        report.result =
            CaseFailure{"aggregation violation", "aggregation violation", unwrap_err(stats).message};
        return report;
    }

    report.result = unwrap(stats);
    return report;
}

void ReportPrinter::print_header(const ColorOutput& c) {
    out_ << c.cyan() << c.bold() << options_.title << c.reset() << "\n"
         << std::string(options_.title.size(), '=') << "\n";
    out_.flush();
}

void ReportPrinter::print_case(const CaseReport& report, const ColorOutput& c) {
    std::ostringstream block;
    block << "\n" << c.bold() << "Benchmark: " << report.name << c.reset() << "\n"
          << std::string(50, '-') << "\n";

    if (is_ok(report.result)) {
        const auto& stats = unwrap(report.result);
        block << "  Average time: " << format_ms(stats.mean) << "\n"
              << "  Min time: " << format_ms(stats.min) << "\n"
              << "  Max time: " << format_ms(stats.max) << "\n"
              << "  Std dev: " << format_ms(stats.stddev) << "\n"
              << "  Throughput: " << format_throughput(stats.throughput) << "\n";
    } else {
        const auto& failure = unwrap_err(report.result);
        block << "  " << c.red() << "Failed: " << failure.headline << c.reset() << "\n";

        std::istringstream lines(failure.diagnostic);
        std::string line;
        bool any = false;
        while (std::getline(lines, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            block << "    " << c.dim() << line << c.reset() << "\n";
            any = true;
        }
        if (!any) {
            block << "    " << c.dim() << "(no diagnostic output)" << c.reset() << "\n";
        }
    }

    // One write per case keeps blocks whole
    out_ << block.str();
    out_.flush();
}

void ReportPrinter::print_summary(const ReportSummary& summary, const ColorOutput& c) {
    const size_t total = summary.cases.size();
    out_ << "\n" << c.bold() << total << " benchmark" << (total != 1 ? "s" : "") << ": "
         << c.reset() << c.green() << summary.passed << " passed" << c.reset() << ", "
         << (summary.failed > 0 ? c.red() : "") << summary.failed << " failed" << c.reset() << " "
         << c.dim() << "(" << format_duration(summary.duration_ms) << ")" << c.reset() << "\n";
    if (summary.interrupted) {
        out_ << c.yellow() << "Interrupted, remaining benchmarks skipped" << c.reset() << "\n";
    }
    out_.flush();
}

} // namespace compbench::bench
