#pragma once

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace dxsync {

// Parse a byte count with optional suffix (K, M, G).
// Returns 0 on parse error.
// Examples: "64M" -> 67108864, "4K" -> 4096, "1024" -> 1024
inline uint64_t parse_size_string(const std::string& s) {
    if (s.empty()) return 0;

    char* end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || val < 0) return 0;

    uint64_t multiplier = 1;
    if (*end != '\0') {
        switch (*end) {
            case 'K': case 'k': multiplier = uint64_t(1) << 10; break;
            case 'M': case 'm': multiplier = uint64_t(1) << 20; break;
            case 'G': case 'g': multiplier = uint64_t(1) << 30; break;
            default: return 0;
        }
        if (end[1] != '\0' && !((end[1] == 'B' || end[1] == 'b') && end[2] == '\0')) {
            return 0;
        }
    }
    return static_cast<uint64_t>(val * static_cast<double>(multiplier));
}

// Human-readable byte count ("1.5 MiB").
inline std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 3) {
        v /= 1024.0;
        u++;
    }
    char buf[32];
    if (u == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", v, units[u]);
    }
    return buf;
}

} // namespace dxsync
