#include "uberping/session.hpp"
#include "test_harness.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

using namespace uberping;

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

// Replays a fixed list of latencies (negative = failure), then asks the
// session to stop.
class ScriptedProber : public Prober {
public:
    ScriptedProber(std::vector<double> script, CancelToken* cancel)
        : script_(std::move(script)), cancel_(cancel) {}

    ProbeResult probe(const std::string&, int) override {
        ProbeResult r{};
        if (pos_ < script_.size()) {
            const double v = script_[pos_++];
            if (v >= 0.0) {
                r.success = true;
                r.latency_ms = v;
                r.raw_message = "reply " + std::to_string(pos_);
            } else {
                r.raw_message = "Request timed out";
            }
        }
        if (pos_ >= script_.size() && cancel_) cancel_->request();
        return r;
    }

    std::size_t calls() const { return pos_; }

private:
    std::vector<double> script_;
    std::size_t pos_{0};
    CancelToken* cancel_;
};

class FixedProber : public Prober {
public:
    ProbeResult probe(const std::string&, int) override {
        ProbeResult r{};
        r.success = true;
        r.latency_ms = 12.0;
        return r;
    }
};

class FakeClock : public SessionClock {
public:
    std::chrono::steady_clock::time_point now() override { return t_; }
    void sleep_for(std::chrono::milliseconds d) override { t_ += d; }

private:
    std::chrono::steady_clock::time_point t_{};
};

class RecordingSink : public OutputSink {
public:
    void emit(Tone tone, const std::string& text) override {
        lines.emplace_back(tone, text);
    }

    int count(Tone tone) const {
        int n = 0;
        for (const auto& l : lines) n += (l.first == tone);
        return n;
    }

    bool contains(const std::string& needle) const {
        for (const auto& l : lines)
            if (l.second.find(needle) != std::string::npos) return true;
        return false;
    }

    std::vector<std::pair<Tone, std::string>> lines;
};

static SessionConfig base_config() {
    SessionConfig cfg;
    cfg.destination = "192.0.2.1";
    cfg.interval_ms = 1000;
    return cfg;
}

static ProbeResult ok(double ms) {
    ProbeResult r{};
    r.success = true;
    r.latency_ms = ms;
    r.raw_message = "Reply time=" + std::to_string(ms);
    return r;
}

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

bool test_threshold_trajectory() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    for (int i = 1; i <= 19; ++i) {
        s.record(ok(12.0));
        if (s.threshold().current() != 20.0) return false;
    }
    s.record(ok(12.0));                        // 20th: recompute
    if (!near(s.threshold().current(), 24.0)) return false;

    s.record(ok(500.0));                       // 21st: spike
    if (s.spikes().size() != 1) return false;
    if (!near(s.spikes()[0].threshold_ms, 24.0)) return false;
    if (s.spikes()[0].latency_ms != 500.0) return false;

    for (int i = 0; i < 5; ++i) s.record(ok(12.0));
    return s.spikes().size() == 1 && sink.count(Tone::Spike) == 1;
}

bool test_end_to_end_spike_scenario() {
    std::vector<double> script(20, 12.0);
    script.push_back(500.0);
    for (int i = 0; i < 9; ++i) script.push_back(12.0);

    CancelToken cancel;
    ScriptedProber prober(script, &cancel);
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    if (sum.attempts != 30 || sum.successes != 30 || sum.failures != 0) return false;
    if (sum.spikes.size() != 1 || sum.spikes[0].raw_message != "reply 21") return false;
    if (sum.reason != StopReason::Cancelled) return false;
    // recomputed again at 30 with the 500 trimmed away
    if (!near(sum.final_threshold_ms, 24.0)) return false;
    if (!sum.stats || sum.stats->max_ms != 500.0 || sum.stats->min_ms != 12.0) return false;
    return sink.contains("Anomalous Spikes (adaptive threshold: 24ms @ 200%):")
        && sink.contains("1 - ");
}

bool test_no_spike_during_warmup() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    for (int i = 0; i < 4; ++i) s.record(ok(12.0));
    s.record(ok(9999.0));
    for (int i = 0; i < 9; ++i) s.record(ok(12.0));
    return s.spikes().empty() && s.store().size() == 14;
}

bool test_failures_do_not_abort() {
    std::vector<double> script = {10, -1, -1, 11, -1, 12};
    CancelToken cancel;
    ScriptedProber prober(script, &cancel);
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    return sum.attempts == 6 && sum.successes == 3 && sum.failures == 3
        && s.store().size() == 3 && sink.count(Tone::Failure) == 3
        && near(sum.success_rate_pct, 50.0);
}

bool test_success_rate_rounding() {
    std::vector<double> script(29, 15.0);
    script.push_back(-1.0);
    CancelToken cancel;
    ScriptedProber prober(script, &cancel);
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    return sum.attempts == 30 && near(sum.success_rate_pct, 96.67)
        && sink.contains("Success rate: 96.67%")
        && near(success_rate(0, 0), 0.0) && near(success_rate(1, 3), 33.33);
}

bool test_cancel_still_summarizes() {
    std::vector<double> script = {20, 21, 22};
    CancelToken cancel;
    ScriptedProber prober(script, &cancel);
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    return sum.reason == StopReason::Cancelled && sum.attempts == 3
        && sink.contains("Interrupted by user")
        && sink.contains("Ping Statistics Summary:")
        && sink.contains("Response time - Min: 20ms, Max: 22ms, Avg: 21ms");
}

bool test_cancel_before_first_tick() {
    CancelToken cancel;
    cancel.request();
    ScriptedProber prober({1, 2, 3}, nullptr);
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    return prober.calls() == 0 && sum.attempts == 0 && !sum.stats
        && sink.contains("Response time - no data")
        && sink.contains("Success rate: 0.00%");
}

bool test_time_limit_stops_session() {
    SessionConfig cfg = base_config();
    cfg.time_limit_s = 3;
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    CancelToken cancel;
    SessionCoordinator s(cfg, prober, sink, clock);

    SessionSummary sum = s.run(cancel);
    // ticks at 0s, 1s, 2s; the 3s check ends the session
    return sum.reason == StopReason::TimeLimit && sum.attempts == 3
        && near(sum.elapsed_s, 3.0)
        && sink.contains("Time limit of 3 seconds reached. Stopping ping.")
        && !sink.contains("Interrupted by user");
}

bool test_debug_emits_recompute_details() {
    SessionConfig cfg = base_config();
    cfg.debug = true;
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(cfg, prober, sink, clock);

    for (int i = 0; i < 20; ++i) s.record(ok(12.0));
    return sink.count(Tone::Debug) == 3
        && sink.contains("Adaptive threshold updated: 24ms (after 20 pings)")
        && sink.contains("Trimmed mean: 12ms, Jitter: 0ms, Baseline: 12ms")
        && sink.contains("Pre-constraint: 24ms, Final: 24ms");
}

bool test_no_debug_by_default() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);

    for (int i = 0; i < 20; ++i) s.record(ok(12.0));
    return sink.count(Tone::Debug) == 0 && sink.count(Tone::Reply) == 20;
}

bool test_single_sample_summary() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);
    s.record(ok(33.0));

    const auto lines = format_summary(s.summarize(StopReason::Cancelled, 1.0));
    bool jitter_line = false;
    for (const auto& l : lines)
        if (l == "Jitter (std dev): insufficient data") jitter_line = true;
    return jitter_line;
}

bool test_summary_jitter_label() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;
    SessionCoordinator s(base_config(), prober, sink, clock);
    s.record(ok(10.0));
    s.record(ok(30.0));

    const auto lines = format_summary(s.summarize(StopReason::TimeLimit, 2.0));
    bool jitter_line = false, runtime_line = false;
    for (const auto& l : lines) {
        if (l == "Jitter (std dev): 10ms - Moderate jitter") jitter_line = true;
        if (l == "Total runtime: 2.0 seconds") runtime_line = true;
    }
    return jitter_line && runtime_line;
}

bool test_invalid_config_rejected() {
    FixedProber prober;
    RecordingSink sink;
    FakeClock clock;

    auto rejects = [&](const SessionConfig& cfg) {
        try {
            SessionCoordinator s(cfg, prober, sink, clock);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };

    SessionConfig no_dest = base_config();
    no_dest.destination.clear();

    SessionConfig bad_bounds = base_config();
    bad_bounds.threshold.min_ms = 600;

    SessionConfig bad_cadence = base_config();
    bad_cadence.threshold.recompute_interval = 0;

    SessionConfig bad_mult = base_config();
    bad_mult.threshold.multiplier_pct = 0;

    SessionConfig bad_interval = base_config();
    bad_interval.interval_ms = -5;

    return rejects(no_dest) && rejects(bad_bounds) && rejects(bad_cadence)
        && rejects(bad_mult) && rejects(bad_interval) && !rejects(base_config());
}

int main() {
    std::cout << "Running session tests...\n";

    run_test("Threshold trajectory", test_threshold_trajectory);
    run_test("End-to-end spike scenario", test_end_to_end_spike_scenario);
    run_test("No spike during warmup", test_no_spike_during_warmup);
    run_test("Failures do not abort", test_failures_do_not_abort);
    run_test("Success rate rounding", test_success_rate_rounding);
    run_test("Cancel still summarizes", test_cancel_still_summarizes);
    run_test("Cancel before first tick", test_cancel_before_first_tick);
    run_test("Time limit stops session", test_time_limit_stops_session);
    run_test("Debug emits recompute details", test_debug_emits_recompute_details);
    run_test("No debug by default", test_no_debug_by_default);
    run_test("Single sample summary", test_single_sample_summary);
    run_test("Summary jitter label", test_summary_jitter_label);
    run_test("Invalid config rejected", test_invalid_config_rejected);

    return finish("Session tests");
}
