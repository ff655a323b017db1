#pragma once
#include <cstdint>
#include <string>

namespace uberping {

/**
 * Outcome of a single reachability probe.
 */
struct ProbeResult {
    bool success{false};        // Echo reply received in time
    double latency_ms{-1.0};    // Round trip in ms (-1 = invalid)
    int ttl{-1};                // Observed TTL (-1 = unknown)
    std::string raw_message;    // Human-readable reply or error line
};

/**
 * Source of latency observations.
 *
 * One call = one blocking probe; it returns once a reply arrives or
 * the timeout expires. Implementations never throw for network errors,
 * they report them through ProbeResult::raw_message.
 */
class Prober {
public:
    virtual ~Prober() = default;
    virtual ProbeResult probe(const std::string& destination, int timeout_ms) = 0;
};

/**
 * ICMP Echo prober backed by an unprivileged datagram socket
 * (SOCK_DGRAM + IPPROTO_ICMP on Linux).
 *
 * The destination may be an IPv4 literal or a host name; names are
 * resolved on every probe so DNS changes are picked up mid-session.
 */
class IcmpProber : public Prober {
public:
    IcmpProber() = default;

    ProbeResult probe(const std::string& destination, int timeout_ms) override;

private:
    uint16_t next_seq_{1};
};

} // namespace uberping
