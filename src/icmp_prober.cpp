#if !defined(__linux__)
#include "uberping/ping.hpp"

namespace uberping {

// Non-Linux builds have no datagram ICMP sockets
ProbeResult IcmpProber::probe(const std::string&, int) {
    ProbeResult r{};
    r.raw_message = "ICMP probing not supported on this platform";
    return r;
}

} // namespace uberping

#else

/**
 * Linux ICMP Echo prober.
 *
 * Uses an unprivileged DATAGRAM ICMP socket (SOCK_DGRAM + IPPROTO_ICMP),
 * so no CAP_NET_RAW is needed as long as the caller's group is inside
 * net.ipv4.ping_group_range. The kernel owns the echo id; we only set
 * the sequence number and match replies on it.
 */

#include "uberping/ping.hpp"
#include "uberping/util.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <vector>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>

namespace uberping {

namespace {

// Closes the socket on every return path
struct SocketGuard {
    int fd{-1};
    ~SocketGuard() { if (fd >= 0) ::close(fd); }
};

/**
 * Resolve an IPv4 literal or host name. Returns false when nothing
 * usable came back.
 */
bool resolve_ipv4(const std::string& host, sockaddr_in& out, std::string& text) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;

    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        text = host;
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res)
        return false;

    out.sin_addr = reinterpret_cast<const sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);

    char buf[INET_ADDRSTRLEN]{};
    if (!inet_ntop(AF_INET, &out.sin_addr, buf, sizeof(buf)))
        return false;
    text = buf;
    return true;
}

} // namespace


ProbeResult IcmpProber::probe(const std::string& destination, int timeout_ms) {
    ProbeResult result{};
    const uint16_t seq = next_seq_++;

    // ---------------------------------------------------------------------
    // Resolve target
    // ---------------------------------------------------------------------
    sockaddr_in dst{};
    std::string addr;
    if (!resolve_ipv4(destination, dst, addr)) {
        result.raw_message = "Unknown host " + destination;
        return result;
    }

    // ---------------------------------------------------------------------
    // ICMP datagram socket
    // ---------------------------------------------------------------------
    SocketGuard sock;
    sock.fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (sock.fd < 0) {
        result.raw_message = std::string("socket() failed: ") + std::strerror(errno);
        return result;
    }

    if (::connect(sock.fd, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
        result.raw_message = std::string("connect() failed: ") + std::strerror(errno);
        return result;
    }

    int one = 1;
    ::setsockopt(sock.fd, IPPROTO_IP, IP_RECVTTL, &one, sizeof(one));

    timeval tv{};
    tv.tv_sec  = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    ::setsockopt(sock.fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // ---------------------------------------------------------------------
    // Echo Request: header + 8-byte send timestamp
    // ---------------------------------------------------------------------
    std::vector<unsigned char> packet(sizeof(icmphdr) + sizeof(uint64_t), 0);

    auto* hdr = reinterpret_cast<icmphdr*>(packet.data());
    hdr->type = ICMP_ECHO;
    hdr->code = 0;
    hdr->un.echo.id = 0;
    hdr->un.echo.sequence = htons(seq);

    const uint64_t ticks = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    std::memcpy(packet.data() + sizeof(icmphdr), &ticks, sizeof(ticks));

    hdr->checksum = checksum16(packet.data(), packet.size());

    const auto t_send = std::chrono::steady_clock::now();
    if (::send(sock.fd, packet.data(), packet.size(), 0) < 0) {
        result.raw_message = std::string("send() failed: ") + std::strerror(errno);
        return result;
    }

    // ---------------------------------------------------------------------
    // Wait for the matching Echo Reply
    // ---------------------------------------------------------------------
    uint8_t recv_buf[1500];
    char cbuf[256];

    const auto deadline = t_send + std::chrono::milliseconds(std::max(1, timeout_ms));

    while (std::chrono::steady_clock::now() < deadline) {
        iovec iov{ recv_buf, sizeof(recv_buf) };
        sockaddr_in src{};

        msghdr msg{};
        msg.msg_name    = &src;
        msg.msg_namelen = sizeof(src);
        msg.msg_iov     = &iov;
        msg.msg_iovlen  = 1;
        msg.msg_control = cbuf;
        msg.msg_controllen = sizeof(cbuf);

        const ssize_t n = ::recvmsg(sock.fd, &msg, 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            result.raw_message = std::string("recvmsg() failed: ") + std::strerror(errno);
            return result;
        }

        if (n < static_cast<ssize_t>(sizeof(icmphdr)))
            continue;

        const auto* reply = reinterpret_cast<const icmphdr*>(recv_buf);
        if (reply->type != ICMP_ECHOREPLY || ntohs(reply->un.echo.sequence) != seq)
            continue;

        const auto t_recv = std::chrono::steady_clock::now();
        result.latency_ms = std::chrono::duration<double, std::milli>(t_recv - t_send).count();

        int ttl = -1;
        for (cmsghdr* cmsg = CMSG_FIRSTHDR(&msg); cmsg; cmsg = CMSG_NXTHDR(&msg, cmsg)) {
            if (cmsg->cmsg_level == IPPROTO_IP && cmsg->cmsg_type == IP_TTL) {
                std::memcpy(&ttl, CMSG_DATA(cmsg), sizeof(ttl));
                break;
            }
        }
        // Datagram ICMP sockets report TTL one lower than on the wire
        if (ttl >= 0) ttl++;

        result.ttl = ttl;
        result.success = true;
        result.raw_message = "Reply from " + addr + ": icmp_seq=" + std::to_string(seq)
                           + " ttl=" + std::to_string(ttl)
                           + " time=" + format_ms(result.latency_ms) + " ms";
        return result;
    }

    result.raw_message = "Request timed out";
    return result;
}

} // namespace uberping

#endif // __linux__
