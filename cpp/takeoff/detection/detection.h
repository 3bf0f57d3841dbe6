#ifndef TAKEOFF_DETECTION_DETECTION_H
#define TAKEOFF_DETECTION_DETECTION_H

#include "takeoff/detection/detection_class.h"
#include "takeoff/detection/detection_geometry.h"
#include <cstdint>
#include <optional>
#include <string>

namespace takeoff {

enum class MarkupType : std::uint8_t {
    Polygon = 0,
    Line = 1,
    Point = 2,
};

enum class DetectionStatus : std::uint8_t {
    Auto = 0,
    Edited = 1,
    Verified = 2,
    Deleted = 3,
};

const char* markupTypeKey(MarkupType type) noexcept;
const char* statusKey(DetectionStatus status) noexcept;

// Cached real-world measurements. A pure function of the geometry and the owning page's scale.
struct DetectionMeasurements {
    double areaSf = 0.0;
    double perimeterLf = 0.0;
    double realWidthFt = 0.0;
    double realHeightFt = 0.0;
    bool measured = false;
};

struct Detection {
    std::string id;
    std::string pageId;
    std::string jobId;
    std::uint32_t detectionIndex = 0;

    DetectionClass detectionClass = DetectionClass::Unclassified;
    MarkupType markupType = MarkupType::Polygon;
    DetectionGeometry geometry;
    DetectionMeasurements measurements;

    DetectionStatus status = DetectionStatus::Auto;
    double confidence = 1.0;
    double createdAtMs = 0.0;
    double editedAtMs = 0.0;

    // Bounds before the first move or resize.
    std::optional<BoundingBox> originalBounds;

    std::string materialId;
    std::optional<double> materialCostOverride;
    std::optional<double> laborCostOverride;
    std::string notes;
    std::optional<std::uint32_t> colorOverrideRGBA;
    std::string markerLabel;
    // Set on pieces produced by a split.
    std::string sourceDetectionId;

    bool isDeleted() const noexcept { return status == DetectionStatus::Deleted; }
};

bool operator==(const DetectionMeasurements& a, const DetectionMeasurements& b) noexcept;
bool operator==(const Detection& a, const Detection& b) noexcept;
inline bool operator!=(const Detection& a, const Detection& b) noexcept { return !(a == b); }

} // namespace takeoff

#endif // TAKEOFF_DETECTION_DETECTION_H
