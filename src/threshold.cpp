#include "uberping/threshold.hpp"
#include "uberping/samples.hpp"
#include "uberping/stats.hpp"

#include <algorithm>

namespace uberping {

ThresholdController::ThresholdController(const ThresholdConfig& cfg)
    : cfg_(cfg), current_ms_(cfg.initial_ms) {}

std::optional<ThresholdUpdate> ThresholdController::on_sample(const SampleStore& store) {
    const std::size_t n = store.size();

    if (n < cfg_.warmup_samples) return std::nullopt;
    if (cfg_.recompute_interval < 1) return std::nullopt;
    if (n % static_cast<std::size_t>(cfg_.recompute_interval) != 0) return std::nullopt;
    if (n == last_recompute_count_) return std::nullopt;

    return recompute(store);
}

ThresholdUpdate ThresholdController::recompute(const SampleStore& store) {
    const BaselineEstimate est = estimate_baseline(store.latencies());

    ThresholdUpdate u;
    u.sample_count = store.size();
    u.trimmed_mean_ms = est.trimmed_mean_ms;
    u.trimmed_jitter_ms = est.trimmed_jitter_ms;
    u.baseline_ms = est.baseline_ms;
    u.raw_threshold_ms = est.baseline_ms * (static_cast<double>(cfg_.multiplier_pct) / 100.0);
    u.threshold_ms = std::min(std::max(u.raw_threshold_ms, cfg_.min_ms), cfg_.max_ms);

    current_ms_ = u.threshold_ms;
    last_recompute_count_ = store.size();
    return u;
}

bool is_spike(double latency_ms,
              std::size_t history_len,
              double threshold_ms,
              std::size_t warmup_samples) {
    if (history_len < warmup_samples) return false;
    return latency_ms > threshold_ms;
}

} // namespace uberping
