#pragma once
#include <cstddef>
#include <optional>

namespace uberping {

class SampleStore;

/**
 * Tuning knobs for the adaptive spike threshold.
 */
struct ThresholdConfig {
    double initial_ms{20.0};        // value used while cold
    double min_ms{20.0};            // clamp floor
    double max_ms{500.0};           // clamp ceiling
    int multiplier_pct{200};        // 200 = 2x baseline
    int recompute_interval{10};     // successes between recomputes
    std::size_t warmup_samples{15}; // samples before the threshold adapts
};

/**
 * Intermediate values of one recompute, kept for debug output.
 */
struct ThresholdUpdate {
    std::size_t sample_count{0};
    double trimmed_mean_ms{0.0};
    double trimmed_jitter_ms{0.0};
    double baseline_ms{0.0};
    double raw_threshold_ms{0.0};   // before clamping
    double threshold_ms{0.0};       // after clamping
};

/**
 * Owns the current spike threshold.
 *
 * Cold until warmup_samples successes have been recorded, the threshold
 * then stays at initial_ms. Afterwards, every recompute_interval-th
 * success re-estimates the baseline over the whole history and sets
 * threshold = clamp(baseline * multiplier / 100, min, max).
 */
class ThresholdController {
public:
    explicit ThresholdController(const ThresholdConfig& cfg = {});

    /**
     * Recompute if the store has reached a recompute point that has not
     * been handled yet. Returns the update when one happened.
     */
    std::optional<ThresholdUpdate> on_sample(const SampleStore& store);

    /**
     * Unconditional recompute over the given store; ignores the cadence.
     */
    ThresholdUpdate recompute(const SampleStore& store);

    double current() const { return current_ms_; }
    bool adaptive(std::size_t sample_count) const { return sample_count >= cfg_.warmup_samples; }
    const ThresholdConfig& config() const { return cfg_; }

private:
    ThresholdConfig cfg_;
    double current_ms_;
    std::size_t last_recompute_count_{0};
};

/**
 * Spike test for the sample just recorded.
 *
 * Never fires while history_len < warmup_samples; otherwise a sample is a
 * spike only when strictly above the threshold.
 */
bool is_spike(double latency_ms,
                           std::size_t history_len,
                           double threshold_ms,
                           std::size_t warmup_samples = 15);

} // namespace uberping
