#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace uberping {

/**
 * Jitter magnitude bands.
 *
 *   jitter <= 2        Low
 *   2 < jitter <= 10   Moderate
 *   jitter > 10        High
 */
enum class JitterQuality {
    Low,
    Moderate,
    High
};

/**
 * Snapshot over a sequence of latencies.
 *
 * jitter (population standard deviation) is empty when only one
 * sample exists; callers must branch on it.
 */
struct Statistics {
    std::size_t count{0};
    double min_ms{0.0};
    double max_ms{0.0};
    double mean_ms{0.0};
    std::optional<double> jitter_ms;
};

/**
 * min / max / mean / population stddev.
 *
 * Returns std::nullopt for an empty sequence. Pure: same input,
 * same output, no state.
 */
std::optional<Statistics> compute_statistics(const std::vector<double>& samples);

JitterQuality classify_jitter(double jitter_ms);

// "Low" / "Moderate" / "High"
const char* to_string(JitterQuality q);

/**
 * Outlier-resistant view of the latency history.
 */
struct BaselineEstimate {
    double trimmed_mean_ms{0.0};
    double trimmed_jitter_ms{0.0};
    double baseline_ms{0.0};        // trimmed mean + trimmed jitter
    std::size_t kept{0};            // samples left after trimming
};

/**
 * Sort, drop floor(n * 0.15) values from each end (skipped for n <= 4),
 * then take mean and population stddev of what is left.
 *
 * trimmed_jitter_ms is 0 when fewer than two samples survive.
 */
BaselineEstimate estimate_baseline(const std::vector<double>& samples);

} // namespace uberping
