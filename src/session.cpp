/**
 * SessionCoordinator: the probe loop.
 *
 * Each tick:
 *   - probe the destination (blocking, one in flight)
 *   - on success: store, maybe recompute threshold, classify, emit
 *   - on failure: count and emit
 *
 * Stops on the time limit or a cancel request; either way the summary
 * is built from whatever was collected and emitted to the sink.
 */

#include "uberping/session.hpp"
#include "uberping/util.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>
#include <utility>

namespace uberping {

using std::chrono::milliseconds;
using std::chrono::steady_clock;

// Longest single sleep between cancel checks
static constexpr milliseconds kWaitSlice{100};

void validate(const SessionConfig& cfg) {
    if (cfg.destination.empty())
        throw std::invalid_argument("Destination parameter is required");
    if (cfg.time_limit_s < 0)
        throw std::invalid_argument("Time limit must be >= 0 seconds");
    if (cfg.interval_ms < 0)
        throw std::invalid_argument("Interval must be >= 0 ms");
    if (cfg.probe_timeout_ms < 1)
        throw std::invalid_argument("Probe timeout must be >= 1 ms");

    const ThresholdConfig& t = cfg.threshold;
    if (t.multiplier_pct <= 0)
        throw std::invalid_argument("Spike multiplier must be > 0 percent");
    if (t.recompute_interval < 1)
        throw std::invalid_argument("Recompute interval must be >= 1 sample");
    if (t.min_ms < 0.0)
        throw std::invalid_argument("Minimum threshold must be >= 0 ms");
    if (t.min_ms > t.max_ms)
        throw std::invalid_argument("Minimum threshold exceeds maximum threshold");
    if (t.initial_ms < 0.0)
        throw std::invalid_argument("Initial threshold must be >= 0 ms");
}

double success_rate(int successes, int attempts) {
    if (attempts <= 0) return 0.0;
    return round2(static_cast<double>(successes) * 100.0 / static_cast<double>(attempts));
}

steady_clock::time_point SteadySessionClock::now() {
    return steady_clock::now();
}

void SteadySessionClock::sleep_for(milliseconds d) {
    std::this_thread::sleep_for(d);
}

SessionCoordinator::SessionCoordinator(SessionConfig cfg,
                                       Prober& prober,
                                       OutputSink& sink,
                                       SessionClock& clock)
    : cfg_(std::move(cfg)),
      prober_(prober),
      sink_(sink),
      clock_(clock),
      threshold_(cfg_.threshold)
{
    validate(cfg_);
}

void SessionCoordinator::record(const ProbeResult& result) {
    ++attempts_;

    if (!result.success || result.latency_ms < 0.0) {
        ++failures_;
        sink_.emit(Tone::Failure, result.raw_message.empty()
                                      ? std::string("Request timed out or failed")
                                      : result.raw_message);
        return;
    }

    ++successes_;
    const auto now = std::chrono::system_clock::now();
    store_.append(result.latency_ms, now);

    if (auto update = threshold_.on_sample(store_)) {
        if (cfg_.debug) emit_debug(*update);
    }

    const std::string msg = result.raw_message.empty()
        ? "Reply from " + cfg_.destination + ": time=" + format_ms(result.latency_ms) + " ms"
        : result.raw_message;

    const double thr = threshold_.current();
    if (is_spike(result.latency_ms, store_.size(), thr, cfg_.threshold.warmup_samples)) {
        SpikeRecord rec;
        rec.taken_at = now;
        rec.latency_ms = result.latency_ms;
        rec.threshold_ms = thr;
        rec.raw_message = msg;
        spikes_.push_back(std::move(rec));
        sink_.emit(Tone::Spike, msg);
    } else {
        sink_.emit(Tone::Reply, msg);
    }
}

void SessionCoordinator::emit_debug(const ThresholdUpdate& u) {
    sink_.emit(Tone::Debug, "Adaptive threshold updated: " + format_ms(u.threshold_ms)
                            + "ms (after " + std::to_string(u.sample_count) + " pings)");
    sink_.emit(Tone::Debug, "  -> Trimmed mean: " + format_ms(u.trimmed_mean_ms)
                            + "ms, Jitter: " + format_ms(u.trimmed_jitter_ms)
                            + "ms, Baseline: " + format_ms(u.baseline_ms) + "ms");
    sink_.emit(Tone::Debug, "  -> Pre-constraint: " + format_ms(u.raw_threshold_ms)
                            + "ms, Final: " + format_ms(u.threshold_ms) + "ms");
}

bool SessionCoordinator::wait_until(steady_clock::time_point deadline,
                                    const CancelToken& cancel) {
    for (;;) {
        if (cancel.requested()) return false;
        const auto now = clock_.now();
        if (now >= deadline) return true;
        const auto left = std::chrono::duration_cast<milliseconds>(deadline - now);
        clock_.sleep_for(std::max(milliseconds(1), std::min(left, kWaitSlice)));
    }
}

SessionSummary SessionCoordinator::run(const CancelToken& cancel) {
    const auto start = clock_.now();
    const auto interval = milliseconds(cfg_.interval_ms);
    const bool bounded = cfg_.time_limit_s > 0;
    const auto limit_at = start + std::chrono::seconds(cfg_.time_limit_s);

    auto next_tick = start;
    StopReason reason = StopReason::Cancelled;

    for (;;) {
        if (cancel.requested()) break;

        if (bounded && clock_.now() >= limit_at) {
            sink_.emit(Tone::Banner, "Time limit of " + std::to_string(cfg_.time_limit_s)
                                     + " seconds reached. Stopping ping.");
            reason = StopReason::TimeLimit;
            break;
        }

        record(prober_.probe(cfg_.destination, cfg_.probe_timeout_ms));
        if (cancel.requested()) break;

        // Fixed schedule; a probe that overran its slot starts the next
        // tick immediately without trying to catch up.
        next_tick += interval;
        const auto now = clock_.now();
        if (next_tick < now) next_tick = now;

        const auto wake = bounded ? std::min(next_tick, limit_at) : next_tick;
        if (!wait_until(wake, cancel)) break;
    }

    if (reason == StopReason::Cancelled)
        sink_.emit(Tone::Warning, "Interrupted by user. Generating final statistics...");

    const double elapsed =
        std::chrono::duration<double>(clock_.now() - start).count();

    SessionSummary summary = summarize(reason, elapsed);
    for (const auto& line : format_summary(summary))
        sink_.emit(Tone::Plain, line);

    return summary;
}

SessionSummary SessionCoordinator::summarize(StopReason reason, double elapsed_s) const {
    SessionSummary s;
    s.destination = cfg_.destination;
    s.attempts = attempts_;
    s.successes = successes_;
    s.failures = failures_;
    s.success_rate_pct = success_rate(successes_, attempts_);
    s.stats = compute_statistics(store_.latencies());
    s.final_threshold_ms = threshold_.current();
    s.multiplier_pct = cfg_.threshold.multiplier_pct;
    s.elapsed_s = elapsed_s;
    s.reason = reason;
    s.spikes = spikes_;
    return s;
}

} // namespace uberping
