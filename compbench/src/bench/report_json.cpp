//! # JSON Benchmark Summary
//!
//! `--json=<path>` output, one object per benchmark in report order:
//!
//! ```json
//! {
//!   "benchmarks": [
//!     {"name": "Basic Switch (3 cases)", "status": "ok", "iterations": 50,
//!      "mean_ms": 12.34, "min_ms": 11.02, "max_ms": 15.90, "stddev_ms": 0.88,
//!      "throughput": 81.04},
//!     {"name": "Switch with 50 cases", "status": "failed", "kind": "execution failure",
//!      "error": "execution failure (exit code 1) on iteration 3", "diagnostic": "..."}
//!   ],
//!   "passed": 1,
//!   "failed": 1,
//!   "interrupted": false,
//!   "duration_ms": 1234
//! }
//! ```
//!
//! An undefined throughput (zero mean) is written as `null`.

#include "bench/report.hpp"
#include "log/log.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace compbench::bench {

namespace {

std::string json_string(std::string_view text) {
    std::ostringstream oss;
    oss << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec << std::setfill(' ');
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
    return oss.str();
}

} // namespace

void write_json_report(const ReportSummary& summary, std::ostream& out) {
    out << "{\n  \"benchmarks\": [\n";

    for (size_t i = 0; i < summary.cases.size(); ++i) {
        const auto& r = summary.cases[i];
        out << "    {\n";
        out << "      \"name\": " << json_string(r.name) << ",\n";

        if (is_ok(r.result)) {
            const auto& stats = unwrap(r.result);
            out << std::fixed << std::setprecision(6);
            out << "      \"status\": \"ok\",\n";
            out << "      \"iterations\": " << r.iterations << ",\n";
            out << "      \"mean_ms\": " << stats.mean * 1000.0 << ",\n";
            out << "      \"min_ms\": " << stats.min * 1000.0 << ",\n";
            out << "      \"max_ms\": " << stats.max * 1000.0 << ",\n";
            out << "      \"stddev_ms\": " << stats.stddev * 1000.0 << ",\n";
            out << "      \"throughput\": ";
            if (stats.throughput == kUndefinedThroughput) {
                out << "null\n";
            } else {
                out << stats.throughput << "\n";
            }
            out.unsetf(std::ios::floatfield);
        } else {
            const auto& failure = unwrap_err(r.result);
            out << "      \"status\": \"failed\",\n";
            out << "      \"kind\": " << json_string(failure.kind) << ",\n";
            out << "      \"error\": " << json_string(failure.headline) << ",\n";
            out << "      \"diagnostic\": " << json_string(failure.diagnostic) << "\n";
        }

        out << "    }";
        if (i + 1 < summary.cases.size())
            out << ",";
        out << "\n";
    }

    out << "  ],\n";
    out << "  \"passed\": " << summary.passed << ",\n";
    out << "  \"failed\": " << summary.failed << ",\n";
    out << "  \"interrupted\": " << (summary.interrupted ? "true" : "false") << ",\n";
    out << "  \"duration_ms\": " << summary.duration_ms << "\n";
    out << "}\n";
}

bool save_json_report(const std::string& path, const ReportSummary& summary) {
    std::ofstream out(path);
    if (!out) {
        COMPBENCH_LOG_ERROR("report", "Cannot open " << path << " for writing");
        return false;
    }

    write_json_report(summary, out);
    out.flush();
    if (!out) {
        COMPBENCH_LOG_ERROR("report", "Failed while writing " << path);
        return false;
    }

    COMPBENCH_LOG_INFO("report", "Wrote JSON summary to " << path);
    return true;
}

} // namespace compbench::bench
