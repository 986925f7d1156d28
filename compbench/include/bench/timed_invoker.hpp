//! # Timed Invoker
//!
//! Measures one benchmark: materializes the source once, runs the compiler
//! on it `iterations` times in sequence and returns one sample per run.
//!
//! The result is all-or-nothing. The first failing run (non-zero exit,
//! timeout, launch failure, interrupt) discards every sample gathered so far
//! and becomes the error. There are no retries.

#pragma once

#include "bench/invoker.hpp"
#include "bench/statistics.hpp"
#include "common.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace compbench::bench {

enum class InvocationErrorKind {
    InvalidRequest,   ///< iterations <= 0 or empty source
    SpawnFailure,     ///< compiler could not be launched
    ExecutionFailure, ///< compiler exited non-zero or died from a signal
    TimeoutFailure,   ///< compiler exceeded the per-invocation timeout
    Interrupted       ///< harness received SIGINT/SIGTERM
};

/// Lower-case name, e.g. "execution failure".
const char* error_kind_name(InvocationErrorKind kind);

struct InvocationError {
    InvocationErrorKind kind = InvocationErrorKind::SpawnFailure;
    int iteration = 0;   ///< 1-based round that failed, warm-up rounds first; 0 if none ran
    int exit_code = -1;  ///< ExecutionFailure only
    int term_signal = 0; ///< ExecutionFailure by signal only
    std::string diagnostic;
};

struct TimedInvokerOptions {
    int warmup = 0;                  ///< unrecorded rounds before measuring
    std::string temp_suffix = ".js"; ///< extension of the materialized source
};

class TimedInvoker {
public:
    explicit TimedInvoker(ProcessInvoker& invoker, TimedInvokerOptions options = {})
        : invoker_(invoker), options_(std::move(options)) {}

    /// Runs the compiler `iterations` times on `source`.
    /// On success the SampleSet holds exactly `iterations` non-negative
    /// durations in seconds. Exactly one temp file is created and removed
    /// per call, whatever the outcome.
    Result<SampleSet, InvocationError> measure(std::string_view source, int iterations,
                                               std::chrono::milliseconds timeout);

    const TimedInvokerOptions& options() const {
        return options_;
    }

private:
    ProcessInvoker& invoker_;
    TimedInvokerOptions options_;
};

} // namespace compbench::bench
