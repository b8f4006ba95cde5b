#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>


namespace lcr {

// 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string digits = std::to_string(value);
    for (std::size_t pos = digits.size(); pos > 3; pos -= 3) {
        digits.insert(pos - 3, 1, ',');
    }
    return digits;
}

// Ratio in [0, 1], one decimal: 0.3125 -> "31.3%"
inline std::string format_percent(double ratio) {
    char out[32];
    std::snprintf(out, sizeof(out), "%.1f%%", ratio * 100.0);
    return std::string(out);
}

// (12.345, 2) -> "12.35"
inline std::string format_fixed(double value, int decimals = 2) {
    char out[64];
    std::snprintf(out, sizeof(out), "%.*f", decimals, value);
    return std::string(out);
}

// 850 ms -> "850 ms", 12.5 s -> "12.5 s", longer -> "1h 02m 00s"
inline std::string format_duration(std::chrono::milliseconds d) {
    const long long ms = static_cast<long long>(d.count());
    char out[48];
    if (ms < 1000) {
        std::snprintf(out, sizeof(out), "%lld ms", ms);
        return std::string(out);
    }
    if (ms < 60'000) {
        std::snprintf(out, sizeof(out), "%.1f s", static_cast<double>(ms) / 1000.0);
        return std::string(out);
    }
    const long long secs = ms / 1000;
    std::snprintf(out, sizeof(out), "%lldh %02lldm %02llds", secs / 3600, (secs / 60) % 60, secs % 60);
    return std::string(out);
}

} // namespace lcr
