#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>


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


// Format a duration given in milliseconds into a human-readable string
// Examples:
//   42        -> "42 ms"
//   1'234     -> "1.23 s"
//   125'000   -> "2.08 min"
inline std::string format_duration_ms(std::uint64_t ms) {
    if (ms < 1'000) {
        return std::format("{} ms", ms);
    }
    double value = static_cast<double>(ms) / 1'000.0;
    const char* unit = "s";
    if (value >= 60.0) {
        value /= 60.0;
        unit = "min";
    }
    const int precision = (value < 10.0) ? 2 : (value < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {}", value, precision, unit);
}


// Format a byte rate (bytes per second), binary units
// Example: 1536.0 -> "1.50 KB/s"
inline std::string format_rate(double bytes_per_second) {
    static const char* units[] = {"B/s", "KB/s", "MB/s"};
    int unit_index = 0;
    while (bytes_per_second >= 1024.0 && unit_index < 2) {
        bytes_per_second /= 1024.0;
        ++unit_index;
    }
    const int precision = (bytes_per_second < 10.0) ? 2 : (bytes_per_second < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {}", bytes_per_second, precision, units[unit_index]);
}


// Format bytes as a scaled human-readable value (binary units)
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
    const int precision = (value < 10.0) ? 2 : (value < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}


// Format a ratio in [0,1] as a percentage
// Example: 0.9876 -> "98.8%"
inline std::string format_percent(double ratio) {
    return std::format("{:.1f}%", ratio * 100.0);
}

} // namespace lcr
