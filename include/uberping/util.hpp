#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uberping {

/**
 * Classic 16-bit Internet checksum (RFC 1071), used for ICMP Echo headers.
 */
uint16_t checksum16(const void* data, size_t len);

/**
 * Local wall-clock time as "YYYY-MM-DD HH:MM:SS" (log line prefix).
 */
std::string format_timestamp(std::chrono::system_clock::time_point tp);

/**
 * Local wall-clock time as "YYYYMMDD_HHMMSS" (log file names).
 */
std::string format_file_stamp(std::chrono::system_clock::time_point tp);

/**
 * Milliseconds for display: integral values print bare ("12"),
 * anything else with two decimals ("12.35").
 */
std::string format_ms(double ms);

/**
 * Round half away from zero to two decimals.
 */
double round2(double v);

} // namespace uberping
