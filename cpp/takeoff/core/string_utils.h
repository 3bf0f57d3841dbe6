#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace takeoff {

// =============================================================================
// Text helpers
// =============================================================================

inline std::string toLowerTrimmed(std::string_view in) {
    std::size_t begin = 0;
    std::size_t end = in.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(in[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    std::string out(in.substr(begin, end - begin));
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

// First `count` characters of an id, used in human readable provenance notes.
inline std::string shortId(const std::string& id, std::size_t count = 8) {
    return id.substr(0, std::min(count, id.size()));
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0ull;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    const std::uint64_t bits = canonicalizeF64(v);
    h = hashU32(h, static_cast<std::uint32_t>(bits & 0xFFFFFFFFull));
    return hashU32(h, static_cast<std::uint32_t>(bits >> 32));
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

} // namespace takeoff
