#ifndef TAKEOFF_CORE_UTIL_H
#define TAKEOFF_CORE_UTIL_H

#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace takeoff {

// Wall-clock milliseconds since the Unix epoch. Draft timestamps and edit stamps use it.
inline double wallClockNowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(system_clock::now().time_since_epoch()).count();
}

static inline std::uint8_t readU8(const std::uint8_t* src, std::size_t offset) noexcept {
    return src[offset];
}

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    double v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace takeoff

#endif // TAKEOFF_CORE_UTIL_H
