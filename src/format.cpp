#include "format.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace ferry {

std::string format_bytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 5) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

std::string format_speed(double bytes_per_second) {
    if (!std::isfinite(bytes_per_second) || bytes_per_second < 0.0) {
        bytes_per_second = 0.0;
    }
    const char* units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    int unit_index = 0;
    double speed = bytes_per_second;

    while (speed >= 1024.0 && unit_index < 3) {
        speed /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << static_cast<int>(speed) << " " << units[unit_index];
    } else {
        oss << std::fixed << std::setprecision(1) << speed << " " << units[unit_index];
    }
    return oss.str();
}

std::string format_duration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return "--:--:--";
    }
    auto total = static_cast<uint64_t>(seconds);
    uint64_t h = total / 3600;
    uint64_t m = (total / 60) % 60;
    uint64_t s = total % 60;

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << h << ":"
        << std::setw(2) << m << ":" << std::setw(2) << s;
    return oss.str();
}

} // namespace ferry
