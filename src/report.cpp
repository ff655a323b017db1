#include "uberping/session.hpp"
#include "uberping/util.hpp"

#include <cstdio>

namespace uberping {

static const char* kRule = "----------------------------------------";

static std::string fixed(double v, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, v);
    return buf;
}

std::vector<std::string> format_summary(const SessionSummary& s) {
    std::vector<std::string> out;

    out.push_back(kRule);
    out.push_back("Ping Statistics Summary:");
    out.push_back("Total pings sent: " + std::to_string(s.attempts));
    out.push_back("Successful pings: " + std::to_string(s.successes));
    out.push_back("Failed pings: " + std::to_string(s.failures));
    out.push_back("Success rate: " + fixed(s.success_rate_pct, 2) + "%");

    if (!s.stats) {
        out.push_back("Response time - no data");
        out.push_back("Jitter (std dev): no data");
    } else {
        out.push_back("Response time - Min: " + format_ms(s.stats->min_ms)
                      + "ms, Max: " + format_ms(s.stats->max_ms)
                      + "ms, Avg: " + format_ms(s.stats->mean_ms) + "ms");
        if (s.stats->jitter_ms) {
            const double j = *s.stats->jitter_ms;
            out.push_back("Jitter (std dev): " + format_ms(j) + "ms - "
                          + to_string(classify_jitter(j)) + " jitter");
        } else {
            out.push_back("Jitter (std dev): insufficient data");
        }
    }

    out.push_back("Total runtime: " + fixed(s.elapsed_s, 1) + " seconds");

    if (!s.spikes.empty()) {
        out.push_back(kRule);
        out.push_back("Anomalous Spikes (adaptive threshold: " + format_ms(s.final_threshold_ms)
                      + "ms @ " + std::to_string(s.multiplier_pct) + "%):");
        int n = 1;
        for (const auto& sp : s.spikes) {
            out.push_back(std::to_string(n++) + " - " + format_timestamp(sp.taken_at)
                          + " - " + sp.raw_message
                          + " (latency " + format_ms(sp.latency_ms)
                          + "ms > threshold " + format_ms(sp.threshold_ms) + "ms)");
        }
    }

    return out;
}

} // namespace uberping
