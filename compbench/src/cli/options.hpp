//! # Benchmark Options
//!
//! Command-line configuration of a `compbench` run.
//!
//! | Flag                | Default | Meaning                               |
//! |---------------------|---------|---------------------------------------|
//! | `--iterations=N`    | 50      | measured invocations per benchmark    |
//! | `--warmup=N`        | 0       | unrecorded invocations first          |
//! | `--timeout=SECONDS` | 30      | per-invocation timeout                |
//! | `--compiler=PATH`   | cargo   | compiler executable                   |
//! | `--arg=VALUE`       |         | extra fixed argument (repeatable)     |
//! | `--input-flag=FLAG` | --input | flag placed before the input path     |
//! | `--suffix=EXT`      | .js     | extension of the temp input file      |
//! | `--json=PATH`       |         | also write a JSON summary             |
//! | `--list`            |         | list benchmark names and exit         |
//! | `--no-color`        |         | plain output                          |
//!
//! Positional arguments are name patterns; logging flags are left to
//! `log::parse_log_options()`.

#pragma once

#include "bench/invoker.hpp"
#include "common.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace compbench::cli {

struct BenchOptions {
    int iterations = 50;
    int warmup = 0;
    int timeout_seconds = 30;
    bench::CompilerCommand command;
    std::string temp_suffix = ".js";
    std::string json_output;
    std::vector<std::string> patterns;
    bool list = false;
    bool no_color = false;
    bool show_help = false;
    bool show_version = false;
};

/// Parses argv[start_index..]. Returns an error message for unknown flags
/// and malformed or out-of-range values.
Result<BenchOptions, std::string> parse_bench_args(int argc, char* argv[], int start_index = 1);

/// Help text; the driver sends it to stderr after an option error.
void print_usage(std::ostream& os = std::cout);
void print_version();

} // namespace compbench::cli
