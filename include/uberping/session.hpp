#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "uberping/ping.hpp"
#include "uberping/output.hpp"
#include "uberping/samples.hpp"
#include "uberping/stats.hpp"
#include "uberping/threshold.hpp"

namespace uberping {

/**
 * Everything one monitoring session needs to know.
 */
struct SessionConfig {
    std::string destination;        // Probe target (mandatory)
    int time_limit_s{0};            // 0 = run until cancelled
    int interval_ms{1000};          // Tick spacing
    int probe_timeout_ms{5000};     // Per-probe wait
    bool debug{false};              // Emit threshold internals on recompute
    ThresholdConfig threshold;
};

/**
 * Throws std::invalid_argument describing the first bad field.
 */
void validate(const SessionConfig& cfg);

/**
 * Cooperative stop request.
 *
 * request() is async-signal-safe (lock-free atomic store), so it may be
 * called straight from a SIGINT handler.
 */
class CancelToken {
public:
    void request() noexcept { flag_.store(true, std::memory_order_relaxed); }
    bool requested() const noexcept { return flag_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> flag_{false};
};

/**
 * Time source and waiting for the tick loop. Replaced in tests.
 */
class SessionClock {
public:
    virtual ~SessionClock() = default;
    virtual std::chrono::steady_clock::time_point now() = 0;
    virtual void sleep_for(std::chrono::milliseconds d) = 0;
};

class SteadySessionClock : public SessionClock {
public:
    std::chrono::steady_clock::time_point now() override;
    void sleep_for(std::chrono::milliseconds d) override;
};

struct SpikeRecord {
    std::chrono::system_clock::time_point taken_at;
    double latency_ms{0.0};
    double threshold_ms{0.0};       // threshold in force when classified
    std::string raw_message;
};

enum class StopReason {
    TimeLimit,
    Cancelled
};

struct SessionSummary {
    std::string destination;
    int attempts{0};
    int successes{0};
    int failures{0};
    double success_rate_pct{0.0};   // rounded to 2 decimals
    std::optional<Statistics> stats;
    double final_threshold_ms{0.0};
    int multiplier_pct{0};
    double elapsed_s{0.0};
    StopReason reason{StopReason::Cancelled};
    std::vector<SpikeRecord> spikes;
};

/**
 * successes / attempts * 100, rounded to 2 decimals; 0 when nothing
 * was attempted.
 */
double success_rate(int successes, int attempts);

/**
 * Owns all state of one session and drives the probe loop.
 *
 *   probe -> SampleStore -> threshold recompute -> spike check -> sink
 *
 * One probe is in flight at a time. The cancel token is checked before
 * each tick, after each probe and while waiting for the next tick.
 */
class SessionCoordinator {
public:
    SessionCoordinator(SessionConfig cfg,
                       Prober& prober,
                       OutputSink& sink,
                       SessionClock& clock);

    /**
     * Run until the time limit or a cancel request, then return the
     * summary. The summary lines are emitted to the sink before returning.
     */
    SessionSummary run(const CancelToken& cancel);

    /**
     * Process one probe outcome. Exposed so the loop body can be driven
     * without a clock.
     */
    void record(const ProbeResult& result);

    SessionSummary summarize(StopReason reason, double elapsed_s) const;

    const SampleStore& store() const { return store_; }
    const ThresholdController& threshold() const { return threshold_; }
    const std::vector<SpikeRecord>& spikes() const { return spikes_; }
    int attempts() const { return attempts_; }
    int successes() const { return successes_; }
    int failures() const { return failures_; }

private:
    void emit_debug(const ThresholdUpdate& u);
    bool wait_until(std::chrono::steady_clock::time_point deadline,
                    const CancelToken& cancel);

    SessionConfig cfg_;
    Prober& prober_;
    OutputSink& sink_;
    SessionClock& clock_;

    SampleStore store_;
    ThresholdController threshold_;
    std::vector<SpikeRecord> spikes_;

    int attempts_{0};
    int successes_{0};
    int failures_{0};
};

/**
 * Human-readable summary block, one entry per line, without timestamps.
 */
std::vector<std::string> format_summary(const SessionSummary& s);

} // namespace uberping
