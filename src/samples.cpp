#include "uberping/samples.hpp"

namespace uberping {

const Sample& SampleStore::append(double latency_ms,
                                  std::chrono::system_clock::time_point taken_at) {
    Sample s;
    s.seq = samples_.size() + 1;
    s.latency_ms = latency_ms;
    s.taken_at = taken_at;
    samples_.push_back(s);
    return samples_.back();
}

std::vector<double> SampleStore::latencies() const {
    std::vector<double> out;
    out.reserve(samples_.size());
    for (const auto& s : samples_)
        out.push_back(s.latency_ms);
    return out;
}

} // namespace uberping
