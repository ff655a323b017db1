#pragma once
#include <chrono>
#include <cstddef>
#include <vector>

namespace uberping {

/**
 * One successful latency observation.
 */
struct Sample {
    std::size_t seq{0};                              // 1-based arrival index
    double latency_ms{0.0};
    std::chrono::system_clock::time_point taken_at;  // wall clock
};

/**
 * Append-only record of every successful observation in a session.
 *
 * Insertion order is arrival order; nothing is ever removed or
 * reordered, so indices handed out by append() stay valid.
 */
class SampleStore {
public:
    const Sample& append(double latency_ms,
                         std::chrono::system_clock::time_point taken_at);

    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    const std::vector<Sample>& samples() const { return samples_; }
    const Sample& back() const { return samples_.back(); }

    // Latencies only, in arrival order.
    std::vector<double> latencies() const;

private:
    std::vector<Sample> samples_;
};

} // namespace uberping
