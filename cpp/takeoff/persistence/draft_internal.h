#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace takeoff::draft::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t draftMagic = fourCC('T', 'D', 'R', 'F');
constexpr std::uint32_t draftVersion = 1;
constexpr std::size_t draftHeaderBytes = 16;
constexpr std::size_t draftSectionEntryBytes = 16;

constexpr std::uint32_t TAG_META = fourCC('M', 'E', 'T', 'A');
constexpr std::uint32_t TAG_PAGE = fourCC('P', 'A', 'G', 'E');
constexpr std::uint32_t TAG_DETS = fourCC('D', 'E', 'T', 'S');

// Optional-field bits of a detection record.
constexpr std::uint8_t kHasOriginalBounds = 1u << 0;
constexpr std::uint8_t kHasMaterialCost = 1u << 1;
constexpr std::uint8_t kHasLaborCost = 1u << 2;
constexpr std::uint8_t kHasColorOverride = 1u << 3;
constexpr std::uint8_t kMeasured = 1u << 4;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    // Built once; function-local static initialization is thread-safe.
    static const std::array<std::uint32_t, 256> table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

} // namespace takeoff::draft::detail
