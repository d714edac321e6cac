#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>
#include <chrono>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(uint64_t value) {
    std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}


// Format a millisecond duration for humans
// Examples:
//   250    -> "250 ms"
//   2000   -> "2.00 s"
//   90000  -> "1.50 min"
inline std::string format_delay(std::chrono::milliseconds delay) {
    const auto ms = delay.count();
    if (ms < 1000) {
        return std::format("{} ms", ms);
    }
    const double s = static_cast<double>(ms) / 1000.0;
    if (s < 60.0) {
        return std::format("{:.2f} s", s);
    }
    return std::format("{:.2f} min", s / 60.0);
}


// Format a payload size
// Example: 1234567 -> "1.18 MB"
inline std::string format_bytes_scaled(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }
    if (unit_index == 0) {
        return std::format("{} B", bytes);
    }

    int precision =
        (value < 10.0)  ? 2 :
        (value < 100.0) ? 1 : 0;

    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}

} // namespace lcr
