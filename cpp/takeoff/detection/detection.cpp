#include "takeoff/detection/detection.h"

namespace takeoff {

const char* markupTypeKey(MarkupType type) noexcept {
    switch (type) {
        case MarkupType::Polygon: return "polygon";
        case MarkupType::Line: return "line";
        case MarkupType::Point: return "point";
    }
    return "polygon";
}

const char* statusKey(DetectionStatus status) noexcept {
    switch (status) {
        case DetectionStatus::Auto: return "auto";
        case DetectionStatus::Edited: return "edited";
        case DetectionStatus::Verified: return "verified";
        case DetectionStatus::Deleted: return "deleted";
    }
    return "auto";
}

bool operator==(const DetectionMeasurements& a, const DetectionMeasurements& b) noexcept {
    return a.areaSf == b.areaSf && a.perimeterLf == b.perimeterLf && a.realWidthFt == b.realWidthFt &&
           a.realHeightFt == b.realHeightFt && a.measured == b.measured;
}

bool operator==(const Detection& a, const Detection& b) noexcept {
    return a.id == b.id && a.pageId == b.pageId && a.jobId == b.jobId && a.detectionIndex == b.detectionIndex &&
           a.detectionClass == b.detectionClass && a.markupType == b.markupType && a.geometry == b.geometry &&
           a.measurements == b.measurements && a.status == b.status && a.confidence == b.confidence &&
           a.createdAtMs == b.createdAtMs && a.editedAtMs == b.editedAtMs && a.originalBounds == b.originalBounds &&
           a.materialId == b.materialId && a.materialCostOverride == b.materialCostOverride &&
           a.laborCostOverride == b.laborCostOverride && a.notes == b.notes &&
           a.colorOverrideRGBA == b.colorOverrideRGBA && a.markerLabel == b.markerLabel &&
           a.sourceDetectionId == b.sourceDetectionId;
}

} // namespace takeoff
