#pragma once

#include <cstdint>
#include <string>

namespace ferry {

/**
 * Format bytes to human readable string (e.g., "1.5 MB")
 */
std::string format_bytes(uint64_t bytes);

/**
 * Format speed to human readable string (e.g., "1.5 MB/s")
 */
std::string format_speed(double bytes_per_second);

/**
 * Format seconds as HH:MM:SS. Negative or non-finite input gives "--:--:--".
 */
std::string format_duration(double seconds);

} // namespace ferry
