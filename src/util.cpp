#include "uberping/util.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace uberping {

/**
 * RFC 1071 one's-complement sum over 16-bit words:
 *   - sum words
 *   - add a trailing odd byte
 *   - fold carries and invert
 */
uint16_t checksum16(const void* data, size_t len) {
    uint32_t sum = 0;
    const uint16_t* p = static_cast<const uint16_t*>(data);

    while (len > 1) {
        sum += *p++;
        len -= 2;
    }

    if (len) {
        sum += *reinterpret_cast<const uint8_t*>(p);
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

static std::tm local_tm(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = local_tm(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::string format_file_stamp(std::chrono::system_clock::time_point tp) {
    std::tm tm = local_tm(tp);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return buf;
}

std::string format_ms(double ms) {
    char buf[64];
    const double r = round2(ms);
    if (r == std::floor(r))
        std::snprintf(buf, sizeof(buf), "%.0f", r);
    else
        std::snprintf(buf, sizeof(buf), "%.2f", r);
    return buf;
}

double round2(double v) {
    return std::round(v * 100.0) / 100.0;
}

} // namespace uberping
