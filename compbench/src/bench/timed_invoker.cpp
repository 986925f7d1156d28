#include "bench/timed_invoker.hpp"

#include "bench/interrupt.hpp"
#include "bench/temp_file.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace compbench::bench {

const char* error_kind_name(InvocationErrorKind kind) {
    switch (kind) {
    case InvocationErrorKind::InvalidRequest:
        return "invalid request";
    case InvocationErrorKind::SpawnFailure:
        return "spawn failure";
    case InvocationErrorKind::ExecutionFailure:
        return "execution failure";
    case InvocationErrorKind::TimeoutFailure:
        return "timeout";
    case InvocationErrorKind::Interrupted:
        return "interrupted";
    }
    return "unknown failure";
}

namespace {

/// Maps a failed outcome to the error that voids the measurement.
InvocationError classify_failure(const InvocationOutcome& outcome, int iteration,
                                 std::chrono::milliseconds timeout) {
    InvocationError error;
    error.iteration = iteration;

    if (!outcome.launched) {
        error.kind = InvocationErrorKind::SpawnFailure;
        error.diagnostic = outcome.stderr_output;
    } else if (outcome.interrupted) {
        error.kind = InvocationErrorKind::Interrupted;
        error.diagnostic = "interrupted while waiting for the compiler";
    } else if (outcome.timed_out) {
        error.kind = InvocationErrorKind::TimeoutFailure;
        error.diagnostic = "timed out after " + std::to_string(timeout.count()) + " ms";
        if (!outcome.stderr_output.empty()) {
            error.diagnostic += "\n" + outcome.stderr_output;
        }
    } else {
        error.kind = InvocationErrorKind::ExecutionFailure;
        error.exit_code = outcome.exit_code;
        error.term_signal = outcome.term_signal;
        error.diagnostic = outcome.stderr_output;
    }
    return error;
}

} // namespace

Result<SampleSet, InvocationError> TimedInvoker::measure(std::string_view source, int iterations,
                                                         std::chrono::milliseconds timeout) {
    if (iterations <= 0) {
        return InvocationError{InvocationErrorKind::InvalidRequest, 0, -1, 0,
                               "iterations must be positive, got " + std::to_string(iterations)};
    }
    if (source.empty()) {
        return InvocationError{InvocationErrorKind::InvalidRequest, 0, -1, 0,
                               "source text is empty"};
    }

    auto temp = ScopedTempFile::create(source, options_.temp_suffix);
    if (is_err(temp)) {
        return InvocationError{InvocationErrorKind::SpawnFailure, 0, -1, 0,
                               "cannot materialize input: " + unwrap_err(temp)};
    }
    const auto& input = unwrap(temp).path();

    const int warmup = std::max(0, options_.warmup);
    const int total_rounds = warmup + iterations;

    SampleSet samples;
    samples.reserve(static_cast<size_t>(iterations));

    for (int round = 1; round <= total_rounds; ++round) {
        if (interrupt_requested()) {
            return InvocationError{InvocationErrorKind::Interrupted, round, -1, 0,
                                   "interrupted before invocation"};
        }

        InvocationOutcome outcome = invoker_.invoke(input, timeout);
        if (!outcome.succeeded()) {
            InvocationError error = classify_failure(outcome, round, timeout);
            COMPBENCH_LOG_DEBUG("bench", error_kind_name(error.kind)
                                             << " on round " << round << "/" << total_rounds
                                             << ", discarding " << samples.size() << " samples");
            return error;
        }

        if (round <= warmup) {
            continue;
        }

        double seconds = std::chrono::duration<double>(outcome.elapsed).count();
        samples.push_back(std::max(0.0, seconds));
    }

    return samples;
}

} // namespace compbench::bench
