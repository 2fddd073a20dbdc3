#pragma once

// ============================================================
// utils.hpp -- Formatting and argument helpers
// ============================================================

#include "platform.hpp"
#include <cstdio>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

namespace utils {

// "512 B", "4.00 KB", "1.23 MB", "2.50 GB"; 'suffix' lets the same scale
// serve rates ("/s").
inline std::string format_scaled(double value, const char* suffix) {
    static const char* UNITS[] = {"B", "KB", "MB", "GB"};
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(UNITS) / sizeof(UNITS[0])) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " " << UNITS[unit]
       << suffix;
    return ss.str();
}

inline std::string format_bytes(u64 bytes) { return format_scaled((double)bytes, ""); }

inline std::string format_speed(double bytes_per_sec) { return format_scaled(bytes_per_sec, "/s"); }

// "45s", "3m 05s", "1h 02m 03s"
inline std::string format_duration_s(u64 seconds) {
    char buf[48];
    if (seconds < 60) {
        std::snprintf(buf, sizeof(buf), "%llus", (unsigned long long)seconds);
    } else if (seconds < 3600) {
        std::snprintf(buf, sizeof(buf), "%llum %02llus",
                      (unsigned long long)(seconds / 60), (unsigned long long)(seconds % 60));
    } else {
        std::snprintf(buf, sizeof(buf), "%lluh %02llum %02llus",
                      (unsigned long long)(seconds / 3600),
                      (unsigned long long)((seconds % 3600) / 60),
                      (unsigned long long)(seconds % 60));
    }
    return buf;
}

// Negative means "no estimate" (nothing transferred yet)
inline std::string format_eta(double seconds) {
    if (seconds < 0) return "--";
    return format_duration_s((u64)seconds);
}

inline std::string format_percent(double pct) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.1f%%", pct);
    return buf;
}

// ---- Hex ----

inline std::string to_hex(const u8* data, size_t len) {
    static const char* HEX = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(HEX[data[i] >> 4]);
        out.push_back(HEX[data[i] & 0x0F]);
    }
    return out;
}

// Exactly 2*len hex digits into 'out'; false on anything else.
inline bool from_hex(const std::string& hex, u8* out, size_t len) {
    if (hex.size() != len * 2) return false;
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (size_t i = 0; i < len; ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = (u8)((hi << 4) | lo);
    }
    return true;
}

// ---- Command line ----

// Dotted IPv4 address, nothing trailing
inline bool validate_ip(const std::string& ip) {
    in_addr addr{};
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

// 1..65535, digits only
inline bool parse_port(const std::string& s, u16& out) {
    if (s.empty() || s.size() > 5) return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v < 1 || v > 65535) return false;
    out = (u16)v;
    return true;
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        size_t pos = s.find(sep, start);
        out.push_back(s.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
        if (pos == std::string::npos) return out;
        start = pos + 1;
    }
}

} // namespace utils
