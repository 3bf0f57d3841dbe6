#include "takeoff/session/edit_session.h"
#include "takeoff/core/string_utils.h"
#include <algorithm>

namespace takeoff {

namespace {

std::uint64_t hashPoint(std::uint64_t h, const Point2& p) {
    h = hashF64(h, p.x);
    return hashF64(h, p.y);
}

std::uint64_t hashBox(std::uint64_t h, const BoundingBox& box) {
    h = hashF64(h, box.centerX);
    h = hashF64(h, box.centerY);
    h = hashF64(h, box.width);
    return hashF64(h, box.height);
}

std::uint64_t hashRing(std::uint64_t h, const std::vector<Point2>& ring) {
    h = hashU32(h, static_cast<std::uint32_t>(ring.size()));
    for (const auto& p : ring) h = hashPoint(h, p);
    return h;
}

template <typename T, typename Fn>
std::uint64_t hashOptional(std::uint64_t h, const std::optional<T>& value, Fn&& fn) {
    h = hashU32(h, value ? 1u : 0u);
    return value ? fn(h, *value) : h;
}

std::uint64_t hashDetection(std::uint64_t h, const Detection& det) {
    h = hashString(h, det.id);
    h = hashString(h, det.pageId);
    h = hashString(h, det.jobId);
    h = hashU32(h, det.detectionIndex);
    h = hashU32(h, static_cast<std::uint32_t>(det.detectionClass));
    h = hashU32(h, static_cast<std::uint32_t>(det.markupType));
    h = hashU32(h, static_cast<std::uint32_t>(det.status));
    h = hashF64(h, det.confidence);
    h = hashF64(h, det.createdAtMs);
    h = hashF64(h, det.editedAtMs);

    const DetectionGeometry& g = det.geometry;
    h = hashU32(h, static_cast<std::uint32_t>(g.kind()));
    h = hashBox(h, g.bounds());
    h = hashRing(h, g.outer());
    h = hashU32(h, static_cast<std::uint32_t>(g.holes().size()));
    for (const auto& hole : g.holes()) h = hashRing(h, hole);

    const DetectionMeasurements& m = det.measurements;
    h = hashU32(h, m.measured ? 1u : 0u);
    h = hashF64(h, m.areaSf);
    h = hashF64(h, m.perimeterLf);
    h = hashF64(h, m.realWidthFt);
    h = hashF64(h, m.realHeightFt);

    h = hashOptional(h, det.originalBounds, hashBox);
    h = hashOptional(h, det.materialCostOverride, hashF64);
    h = hashOptional(h, det.laborCostOverride, hashF64);
    h = hashOptional(h, det.colorOverrideRGBA, hashU32);
    h = hashString(h, det.materialId);
    h = hashString(h, det.notes);
    h = hashString(h, det.markerLabel);
    return hashString(h, det.sourceDetectionId);
}

} // namespace

std::uint64_t EditSession::digestOf(const std::vector<Detection>& detections,
                                    const std::vector<PageScaleRecord>& scales) const {
    std::vector<const Detection*> ordered;
    ordered.reserve(detections.size());
    for (const auto& det : detections) ordered.push_back(&det);
    std::sort(ordered.begin(), ordered.end(), [](const Detection* a, const Detection* b) {
        return a->id < b->id;
    });

    std::vector<const PageScaleRecord*> pages;
    pages.reserve(scales.size());
    for (const auto& record : scales) pages.push_back(&record);
    std::sort(pages.begin(), pages.end(), [](const PageScaleRecord* a, const PageScaleRecord* b) {
        return a->pageId < b->pageId;
    });

    std::uint64_t h = kDigestOffset;
    h = hashU32(h, static_cast<std::uint32_t>(ordered.size()));
    for (const Detection* det : ordered) h = hashDetection(h, *det);
    h = hashU32(h, static_cast<std::uint32_t>(pages.size()));
    for (const PageScaleRecord* page : pages) {
        h = hashString(h, page->pageId);
        h = hashF64(h, page->scaleRatio);
    }
    return h;
}

std::uint64_t EditSession::digest() const {
    return digestOf(store_.all(), capturePageScales());
}

} // namespace takeoff
