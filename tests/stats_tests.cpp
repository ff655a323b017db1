#include "uberping/stats.hpp"
#include "test_harness.hpp"

#include <vector>

using namespace uberping;

bool test_empty_has_no_data() {
    return !compute_statistics({}).has_value();
}

bool test_single_sample() {
    auto st = compute_statistics({42.0});
    if (!st) return false;
    if (st->count != 1) return false;
    if (!near(st->min_ms, 42.0) || !near(st->max_ms, 42.0) || !near(st->mean_ms, 42.0))
        return false;
    // Jitter is undefined for one sample
    return !st->jitter_ms.has_value();
}

bool test_known_values() {
    // mean 5, population stddev exactly 2
    auto st = compute_statistics({2, 4, 4, 4, 5, 5, 7, 9});
    if (!st || !st->jitter_ms) return false;
    return near(st->min_ms, 2) && near(st->max_ms, 9)
        && near(st->mean_ms, 5) && near(*st->jitter_ms, 2.0);
}

bool test_population_not_sample_stddev() {
    // n divisor: sqrt(((1-2)^2 + (3-2)^2) / 2) = 1, n-1 would give sqrt(2)
    auto st = compute_statistics({1, 3});
    return st && st->jitter_ms && near(*st->jitter_ms, 1.0);
}

bool test_mean_within_extrema() {
    const std::vector<std::vector<double>> inputs = {
        {0.1, 0.1, 0.1},
        {12.5, 3.25, 900.0, 14.0},
        {1e6, 1e-3},
        {7, 7, 7, 7, 8},
        {0, 0},
    };
    for (const auto& in : inputs) {
        auto st = compute_statistics(in);
        if (!st) return false;
        if (!(st->min_ms <= st->mean_ms && st->mean_ms <= st->max_ms)) return false;
        if (st->jitter_ms && *st->jitter_ms < 0.0) return false;
    }
    return true;
}

bool test_zero_jitter_iff_identical() {
    auto same = compute_statistics({0.1, 0.1, 0.1, 0.1, 0.1, 0.1, 0.1});
    auto diff = compute_statistics({10, 10, 10, 11});
    if (!same || !same->jitter_ms || !diff || !diff->jitter_ms) return false;
    return *same->jitter_ms == 0.0 && *diff->jitter_ms > 0.0;
}

bool test_jitter_quality_bands() {
    return classify_jitter(0.0)   == JitterQuality::Low
        && classify_jitter(2.0)   == JitterQuality::Low
        && classify_jitter(2.01)  == JitterQuality::Moderate
        && classify_jitter(10.0)  == JitterQuality::Moderate
        && classify_jitter(10.01) == JitterQuality::High
        && std::string(to_string(JitterQuality::Moderate)) == "Moderate";
}

bool test_statistics_idempotent() {
    const std::vector<double> in = {15.2, 18.9, 12.0, 44.4, 13.3};
    auto a = compute_statistics(in);
    auto b = compute_statistics(in);
    if (!a || !b || !a->jitter_ms || !b->jitter_ms) return false;
    return a->min_ms == b->min_ms && a->max_ms == b->max_ms
        && a->mean_ms == b->mean_ms && *a->jitter_ms == *b->jitter_ms;
}

bool test_baseline_identical_values() {
    std::vector<double> in(15, 37.0);
    auto est = estimate_baseline(in);
    return near(est.trimmed_mean_ms, 37.0) && near(est.trimmed_jitter_ms, 0.0)
        && near(est.baseline_ms, 37.0);
}

bool test_baseline_trims_outlier() {
    std::vector<double> in(14, 10.0);
    in.push_back(200.0);
    auto est = estimate_baseline(in);
    // floor(15 * 0.15) = 2 dropped per side, the 200 never reaches the mean
    return est.kept == 11 && near(est.trimmed_mean_ms, 10.0)
        && near(est.trimmed_jitter_ms, 0.0) && near(est.baseline_ms, 10.0);
}

bool test_baseline_small_input_untrimmed() {
    // n <= 4: everything is kept
    auto est = estimate_baseline({1, 2, 3, 100});
    return est.kept == 4 && near(est.trimmed_mean_ms, 26.5);
}

bool test_baseline_uses_sorted_window() {
    // n = 20 -> trim 3 each side; unsorted input on purpose
    std::vector<double> in = {50, 1, 2, 3, 10, 10, 10, 10, 10, 10,
                              10, 10, 10, 10, 20, 20, 10, 60, 70, 10};
    auto est = estimate_baseline(in);
    if (est.kept != 14) return false;
    // sorted: 1 2 3 | 10 x 12, 20, 20 | 50 60 70
    const double mean = 160.0 / 14.0;
    if (!near(est.trimmed_mean_ms, mean)) return false;
    auto st = compute_statistics({10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 10, 20, 20});
    return st && st->jitter_ms
        && near(est.trimmed_jitter_ms, *st->jitter_ms)
        && near(est.baseline_ms, mean + *st->jitter_ms);
}

bool test_baseline_empty() {
    auto est = estimate_baseline({});
    return est.kept == 0 && est.baseline_ms == 0.0;
}

int main() {
    std::cout << "Running statistics tests...\n";

    run_test("Empty input has no data", test_empty_has_no_data);
    run_test("Single sample has no jitter", test_single_sample);
    run_test("Known mean and stddev", test_known_values);
    run_test("Population stddev divisor", test_population_not_sample_stddev);
    run_test("Mean within extrema", test_mean_within_extrema);
    run_test("Zero jitter iff identical", test_zero_jitter_iff_identical);
    run_test("Jitter quality bands", test_jitter_quality_bands);
    run_test("Statistics idempotent", test_statistics_idempotent);
    run_test("Baseline of identical values", test_baseline_identical_values);
    run_test("Baseline trims outlier", test_baseline_trims_outlier);
    run_test("Baseline skips trimming for n <= 4", test_baseline_small_input_untrimmed);
    run_test("Baseline uses sorted trimmed window", test_baseline_uses_sorted_window);
    run_test("Baseline of empty input", test_baseline_empty);

    return finish("Statistics tests");
}
