//! # compbench Entry Point
//!
//! Benchmarks an external compiler by invoking it repeatedly on built-in
//! inputs and reporting latency statistics.
//!
//! ```bash
//! compbench                                  # all benchmarks, cargo-built compiler
//! compbench --iterations=100 fallthrough     # one benchmark, 100 runs
//! compbench --compiler=./target/release/react-compiler-rust --json=out.json
//! ```
//!
//! All work happens in `cli::compbench_main()` (see `cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return compbench::cli::compbench_main(argc, argv);
}
