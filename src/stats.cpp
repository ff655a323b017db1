/**
 * Latency statistics.
 *
 * Jitter here is the population standard deviation (divide by n),
 * not the mean consecutive difference.
 */

#include "uberping/stats.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace uberping {

static double mean_of(std::vector<double>::const_iterator first,
                      std::vector<double>::const_iterator last) {
    double sum = 0.0;
    std::size_t n = 0;
    for (auto it = first; it != last; ++it) {
        sum += *it;
        ++n;
    }
    return n ? sum / static_cast<double>(n) : 0.0;
}

static double pstddev_of(std::vector<double>::const_iterator first,
                         std::vector<double>::const_iterator last,
                         double mean) {
    double var = 0.0;
    std::size_t n = 0;
    for (auto it = first; it != last; ++it) {
        var += (*it - mean) * (*it - mean);
        ++n;
    }
    if (n == 0) return 0.0;
    return std::sqrt(var / static_cast<double>(n));
}

std::optional<Statistics> compute_statistics(const std::vector<double>& samples) {
    if (samples.empty()) return std::nullopt;

    Statistics st;
    st.count = samples.size();

    const auto mm = std::minmax_element(samples.begin(), samples.end());
    st.min_ms = *mm.first;
    st.max_ms = *mm.second;

    if (samples.size() == 1) {
        st.mean_ms = samples.front();
        return st;
    }

    st.mean_ms = mean_of(samples.begin(), samples.end());
    // Keep mean inside [min, max] despite rounding on near-identical input
    st.mean_ms = std::min(std::max(st.mean_ms, st.min_ms), st.max_ms);
    st.jitter_ms = pstddev_of(samples.begin(), samples.end(), st.mean_ms);
    return st;
}

JitterQuality classify_jitter(double jitter_ms) {
    if (jitter_ms > 10.0) return JitterQuality::High;
    if (jitter_ms > 2.0)  return JitterQuality::Moderate;
    return JitterQuality::Low;
}

const char* to_string(JitterQuality q) {
    switch (q) {
        case JitterQuality::Low:      return "Low";
        case JitterQuality::Moderate: return "Moderate";
        case JitterQuality::High:     return "High";
    }
    return "Low";
}

BaselineEstimate estimate_baseline(const std::vector<double>& samples) {
    BaselineEstimate est;
    if (samples.empty()) return est;

    auto sorted = samples;
    std::sort(sorted.begin(), sorted.end());

    const std::size_t n = sorted.size();
    std::size_t trim = 0;
    if (n > 4) {
        trim = static_cast<std::size_t>(std::floor(static_cast<double>(n) * 0.15));
    }

    // Closed range [trim, n - 1 - trim]
    const auto first = sorted.cbegin() + static_cast<std::ptrdiff_t>(trim);
    const auto last  = sorted.cend() - static_cast<std::ptrdiff_t>(trim);

    est.kept = n - 2 * trim;
    est.trimmed_mean_ms = mean_of(first, last);
    est.trimmed_jitter_ms = (est.kept >= 2)
        ? pstddev_of(first, last, est.trimmed_mean_ms)
        : 0.0;
    est.baseline_ms = est.trimmed_mean_ms + est.trimmed_jitter_ms;
    return est;
}

} // namespace uberping
