#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <initializer_list>
#include <iomanip>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace codegraph::core {

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 * Job identities use this; they are never reused across submissions.
 */
inline std::string generateUUID() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng);
    uint64_t b = dist(rng);

    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF), static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0x0000FFFFFFFFFFFFull));
    return std::string(buf);
}

/// FNV-1a 64-bit over a sequence of parts, separated so ("ab","c") != ("a","bc").
inline std::uint64_t fnv1a64(std::initializer_list<std::string_view> parts) {
    std::uint64_t h = 1469598103934665603ull;
    for (auto part : parts) {
        for (unsigned char c : part) {
            h ^= static_cast<std::uint64_t>(c);
            h *= 1099511628211ull;
        }
        h ^= 0x1f;
        h *= 1099511628211ull;
    }
    return h;
}

/**
 * Deterministic identity: prefix + 16 hex digits of the FNV-1a hash of parts.
 * Re-extracting the same file yields the same ids, so store upserts converge.
 */
inline std::string stableId(std::string_view prefix,
                            std::initializer_list<std::string_view> parts) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(parts)));
    std::string out;
    out.reserve(prefix.size() + 17);
    out.append(prefix);
    out.push_back(':');
    out.append(buf);
    return out;
}

/// ISO 8601 UTC timestamp with millisecond precision, e.g. 2025-10-01T14:30:00.123Z
inline std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_tp = std::chrono::system_clock::to_time_t(tp);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm tm_utc;
    gmtime_r(&time_t_tp, &tm_utc);

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis << 'Z';
    return oss.str();
}

} // namespace codegraph::core
