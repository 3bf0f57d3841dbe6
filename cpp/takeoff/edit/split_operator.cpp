#include "takeoff/edit/split_operator.h"
#include "takeoff/core/logging.h"
#include "takeoff/core/string_utils.h"
#include "takeoff/geometry/polygon_boolean.h"
#include "takeoff/measure/measurement.h"
#include <cmath>
#include <utility>

namespace takeoff {

namespace {

static bool makePiece(const Detection& original, PolygonWithHoles poly, const std::string& notes,
                      double scaleRatio, double nowMs, Detection& out) {
    DetectionGeometry geometry;
    if (!DetectionGeometry::fromPolygonWithHoles(std::move(poly.outer), std::move(poly.holes), geometry)) {
        return false;
    }
    Detection piece{};
    piece.pageId = original.pageId;
    piece.jobId = original.jobId;
    piece.detectionClass = original.detectionClass;
    piece.markupType = MarkupType::Polygon;
    piece.geometry = std::move(geometry);
    piece.status = DetectionStatus::Edited;
    piece.confidence = 1.0;
    piece.createdAtMs = nowMs;
    piece.editedAtMs = nowMs;
    piece.materialId = original.materialId;
    piece.colorOverrideRGBA = original.colorOverrideRGBA;
    piece.notes = notes;
    piece.sourceDetectionId = original.id;
    refreshDerived(piece, scaleRatio);
    out = std::move(piece);
    return true;
}

} // namespace

const char* splitStatusName(SplitStatus status) noexcept {
    switch (status) {
        case SplitStatus::Split: return "Split";
        case SplitStatus::NothingToSplit: return "NothingToSplit";
        case SplitStatus::InvalidCut: return "InvalidCut";
        case SplitStatus::DegenerateTarget: return "DegenerateTarget";
        case SplitStatus::UnsupportedTarget: return "UnsupportedTarget";
        case SplitStatus::AreaMismatch: return "AreaMismatch";
        case SplitStatus::NotFound: return "NotFound";
    }
    return "Unknown";
}

double filledArea(const PolygonWithHoles& poly, const BooleanOptions& options) {
    return totalArea(computeBoolean(BooleanOp::Union, poly, PolygonWithHoles{}, options));
}

bool isValidCut(const Ring& cut, const BooleanOptions& options) {
    if (cut.size() < 3) return false;
    for (const auto& p : cut) {
        if (!isFinitePoint(p)) return false;
    }
    PolygonWithHoles cutter{};
    cutter.outer = cut;
    return filledArea(cutter, options) > 0.0;
}

SplitResult splitDetection(
    const Detection& original,
    const Ring& cut,
    double scaleRatio,
    double nowMs,
    const BooleanOptions& options) {
    SplitResult result{};

    if (!isValidCut(cut, options)) {
        TAKEOFF_LOG_WARN("split %s: cut rejected (%zu vertices)", original.id.c_str(), cut.size());
        result.status = SplitStatus::InvalidCut;
        return result;
    }
    if (original.markupType != MarkupType::Polygon || !original.geometry.isArea()) {
        result.status = SplitStatus::UnsupportedTarget;
        return result;
    }

    // Pieces partition the filled region, so a self-crossing outline is measured the same way.
    const PolygonWithHoles target = original.geometry.asPolygon();
    result.originalAreaPx = filledArea(target, options);
    if (!(result.originalAreaPx > 0.0)) {
        result.status = SplitStatus::DegenerateTarget;
        return result;
    }

    PolygonWithHoles cutter{};
    cutter.outer = cut;

    std::vector<PolygonWithHoles> carved = computeBoolean(BooleanOp::Intersection, target, cutter, options);
    if (carved.empty()) {
        TAKEOFF_LOG_DEBUG("split %s: no intersection found", original.id.c_str());
        result.status = SplitStatus::NothingToSplit;
        return result;
    }
    std::vector<PolygonWithHoles> remaining = computeBoolean(BooleanOp::Difference, target, cutter, options);

    result.piecesAreaPx = totalArea(carved) + totalArea(remaining);
    if (std::abs(result.piecesAreaPx - result.originalAreaPx) > kSplitAreaTolerance * result.originalAreaPx) {
        TAKEOFF_LOG_WARN("split %s: area mismatch original=%f pieces=%f",
                         original.id.c_str(), result.originalAreaPx, result.piecesAreaPx);
        result.status = SplitStatus::AreaMismatch;
        return result;
    }

    const std::string tag = shortId(original.id);
    for (auto& poly : carved) {
        Detection piece;
        if (!makePiece(original, std::move(poly), "Carved from " + tag, scaleRatio, nowMs, piece)) {
            result.status = SplitStatus::AreaMismatch;
            result.pieces.clear();
            return result;
        }
        result.pieces.push_back(std::move(piece));
    }
    result.carvedCount = result.pieces.size();
    for (auto& poly : remaining) {
        std::string notes = "Remaining from " + tag;
        if (!poly.holes.empty()) notes += " (with hole)";
        Detection piece;
        if (!makePiece(original, std::move(poly), notes, scaleRatio, nowMs, piece)) {
            result.status = SplitStatus::AreaMismatch;
            result.pieces.clear();
            return result;
        }
        result.pieces.push_back(std::move(piece));
    }

    result.retired = original;
    result.retired.status = DetectionStatus::Deleted;
    result.retired.editedAtMs = nowMs;
    result.status = SplitStatus::Split;
    return result;
}

} // namespace takeoff
