//! # CLI Driver
//!
//! Entry point behind `main()`: parses options, configures logging, runs the
//! report and maps the outcome to a process exit code.
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                                         |
//! |------|-----------------------------------------------------------------|
//! | 0    | report completed (individual benchmarks may have failed)        |
//! | 2    | harness fault: bad options, compiler not found, JSON not written |
//! | 130  | interrupted by SIGINT/SIGTERM                                   |

#pragma once

namespace compbench::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_HARNESS_FAULT = 2;
constexpr int EXIT_INTERRUPTED = 130;

int compbench_main(int argc, char* argv[]);

} // namespace compbench::cli
