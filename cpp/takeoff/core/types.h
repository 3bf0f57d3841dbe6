#ifndef TAKEOFF_CORE_TYPES_H
#define TAKEOFF_CORE_TYPES_H

#include <cstdint>
#include <vector>

namespace takeoff {

// Pixel-space point. Image coordinates: x grows right, y grows down.
struct Point2 {
    double x;
    double y;
};

inline bool operator==(const Point2& a, const Point2& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) noexcept { return !(a == b); }

// Closed ring; the closing edge from back() to front() is implicit.
using Ring = std::vector<Point2>;

// Axis-aligned box stored center-based, matching how detections arrive from extraction.
struct BoundingBox {
    double centerX{0.0};
    double centerY{0.0};
    double width{0.0};
    double height{0.0};

    double minX() const noexcept { return centerX - width * 0.5; }
    double maxX() const noexcept { return centerX + width * 0.5; }
    double minY() const noexcept { return centerY - height * 0.5; }
    double maxY() const noexcept { return centerY + height * 0.5; }
};

inline bool operator==(const BoundingBox& a, const BoundingBox& b) noexcept {
    return a.centerX == b.centerX && a.centerY == b.centerY && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const BoundingBox& a, const BoundingBox& b) noexcept { return !(a == b); }

enum class EngineError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    InvalidOperation = 6,
    NotFound = 7,
    InvalidGeometry = 8,
    IoError = 9,
};

inline const char* engineErrorName(EngineError err) noexcept {
    switch (err) {
        case EngineError::Ok: return "Ok";
        case EngineError::InvalidMagic: return "InvalidMagic";
        case EngineError::UnsupportedVersion: return "UnsupportedVersion";
        case EngineError::BufferTruncated: return "BufferTruncated";
        case EngineError::InvalidPayloadSize: return "InvalidPayloadSize";
        case EngineError::InvalidOperation: return "InvalidOperation";
        case EngineError::NotFound: return "NotFound";
        case EngineError::InvalidGeometry: return "InvalidGeometry";
        case EngineError::IoError: return "IoError";
    }
    return "Unknown";
}

} // namespace takeoff

#endif // TAKEOFF_CORE_TYPES_H
