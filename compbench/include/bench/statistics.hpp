//! # Statistics Aggregator
//!
//! Reduces the samples of one benchmark to descriptive statistics.
//!
//! `stddev` is the population standard deviation (divides by N, not N-1).
//! Reported numbers depend on this; do not switch to the sample formula.

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace compbench::bench {

/// One wall-clock duration in seconds.
using Sample = double;

/// Complete, ordered samples of one benchmark.
using SampleSet = std::vector<Sample>;

/// Throughput reported when the mean latency is zero.
constexpr double kUndefinedThroughput = 0.0;

struct Statistics {
    double mean = 0.0;       ///< seconds
    double min = 0.0;        ///< seconds
    double max = 0.0;        ///< seconds
    double stddev = 0.0;     ///< seconds, population
    double throughput = 0.0; ///< invocations per second, or kUndefinedThroughput
    size_t count = 0;
};

/// Raised when summarize() is handed an empty sample sequence.
struct AggregationError {
    std::string message;
};

/// Computes mean, min, max, population stddev and throughput.
/// An empty `samples` is a contract violation and yields an AggregationError.
Result<Statistics, AggregationError> summarize(const SampleSet& samples);

} // namespace compbench::bench
