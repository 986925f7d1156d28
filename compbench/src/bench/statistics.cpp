#include "bench/statistics.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cmath>

namespace compbench::bench {

Result<Statistics, AggregationError> summarize(const SampleSet& samples) {
    if (samples.empty()) {
        COMPBENCH_LOG_ERROR("bench", "summarize() called with no samples");
        return AggregationError{"aggregation violation: empty sample set"};
    }

    Statistics stats;
    stats.count = samples.size();
    stats.min = samples.front();
    stats.max = samples.front();

    double sum = 0.0;
    for (Sample s : samples) {
        sum += s;
        if (s < stats.min)
            stats.min = s;
        if (s > stats.max)
            stats.max = s;
    }
    const double n = static_cast<double>(samples.size());

    if (stats.min == stats.max) {
        // Rounding in `sum` must not leak into a constant series.
        stats.mean = stats.min;
        stats.stddev = 0.0;
        stats.throughput = stats.mean > 0.0 ? 1.0 / stats.mean : kUndefinedThroughput;
        return stats;
    }
    stats.mean = std::clamp(sum / n, stats.min, stats.max);

    double squared_deviations = 0.0;
    for (Sample s : samples) {
        const double d = s - stats.mean;
        squared_deviations += d * d;
    }
    stats.stddev = std::sqrt(squared_deviations / n);

    stats.throughput = stats.mean > 0.0 ? 1.0 / stats.mean : kUndefinedThroughput;

    return stats;
}

} // namespace compbench::bench
