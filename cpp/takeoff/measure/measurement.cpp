#include "takeoff/measure/measurement.h"
#include "takeoff/geometry/polygon.h"
#include <algorithm>
#include <cmath>

namespace takeoff {

namespace {

constexpr double kPi = 3.14159265358979323846;

static const std::vector<Point2>& outlineOf(const DetectionGeometry& geometry, Ring& scratch) {
    if (geometry.kind() == GeometryKind::BoundingBoxOnly) {
        scratch = rectToRing(geometry.bounds());
        return scratch;
    }
    return geometry.outer();
}

} // namespace

double pixelsToFeet(double pixels, double scaleRatio) noexcept {
    if (!isUsableScale(scaleRatio)) return 0.0;
    return pixels / scaleRatio;
}

double pixelAreaToSquareFeet(double areaPx, double scaleRatio) noexcept {
    if (!isUsableScale(scaleRatio)) return 0.0;
    return areaPx / (scaleRatio * scaleRatio);
}

double levelStarterPx(const Ring& ring, double tolerancePx) {
    if (ring.empty()) return 0.0;
    double baseline = ring[0].y;
    for (const auto& p : ring) baseline = std::max(baseline, p.y);

    std::size_t onBaseline = 0;
    double minX = 0.0;
    double maxX = 0.0;
    for (const auto& p : ring) {
        if (p.y < baseline - tolerancePx) continue;
        if (onBaseline == 0) {
            minX = p.x;
            maxX = p.x;
        } else {
            minX = std::min(minX, p.x);
            maxX = std::max(maxX, p.x);
        }
        ++onBaseline;
    }
    if (onBaseline < 2) return boundingBoxOf(ring).width;
    return maxX - minX;
}

double slopedEdgeLengthPx(const Ring& ring, double toleranceDeg) {
    const std::size_t n = ring.size();
    if (n < 2) return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];
        const double dx = std::abs(b.x - a.x);
        const double dy = std::abs(b.y - a.y);
        if (dx == 0.0 && dy == 0.0) continue;
        const double angle = std::atan2(dy, dx) * 180.0 / kPi;
        if (angle > toleranceDeg && angle < 90.0 - toleranceDeg) {
            sum += std::hypot(dx, dy);
        }
    }
    return sum;
}

double gableRakePx(const DetectionGeometry& geometry) {
    if (!geometry.isArea()) return 0.0;
    Ring scratch;
    const double sloped = slopedEdgeLengthPx(outlineOf(geometry, scratch));
    if (sloped > 0.0) return sloped;
    const BoundingBox& box = geometry.bounds();
    return 2.0 * std::hypot(box.width * 0.5, box.height);
}

double linearLengthPx(const DetectionGeometry& geometry) {
    switch (geometry.kind()) {
        case GeometryKind::Polyline:
            return pathLength(geometry.outer());
        case GeometryKind::Point:
            return 0.0;
        case GeometryKind::BoundingBoxOnly:
        case GeometryKind::Polygon:
        case GeometryKind::PolygonWithHoles:
            return std::max(geometry.bounds().width, geometry.bounds().height);
    }
    return 0.0;
}

DetectionMeasurements deriveMeasurements(const DetectionGeometry& geometry, double scaleRatio) {
    DetectionMeasurements m{};
    if (!isUsableScale(scaleRatio)) return m;
    m.measured = true;
    m.realWidthFt = pixelsToFeet(geometry.bounds().width, scaleRatio);
    m.realHeightFt = pixelsToFeet(geometry.bounds().height, scaleRatio);
    switch (geometry.kind()) {
        case GeometryKind::BoundingBoxOnly:
        case GeometryKind::Polygon:
        case GeometryKind::PolygonWithHoles: {
            const PolygonWithHoles poly = geometry.asPolygon();
            m.areaSf = pixelAreaToSquareFeet(polygonArea(poly), scaleRatio);
            m.perimeterLf = pixelsToFeet(polygonPerimeter(poly), scaleRatio);
            break;
        }
        case GeometryKind::Polyline:
            m.perimeterLf = pixelsToFeet(pathLength(geometry.outer()), scaleRatio);
            break;
        case GeometryKind::Point:
            break;
    }
    return m;
}

QuantityBreakdown measureDetection(const Detection& detection, double scaleRatio) {
    QuantityBreakdown q{};
    const ClassPolicy& policy = classPolicy(detection.detectionClass);
    q.kind = policy.kind;
    if (!isUsableScale(scaleRatio)) return q;

    q.measured = true;
    q.count = 1;
    const DetectionGeometry& geometry = detection.geometry;
    if (detection.markupType == MarkupType::Point || geometry.kind() == GeometryKind::Point) {
        q.kind = MeasurementKind::Count;
        return q;
    }
    // Count classes contribute their count only, whatever shape they were drawn as.
    if (policy.kind == MeasurementKind::Count) return q;

    const DetectionMeasurements base = deriveMeasurements(geometry, scaleRatio);
    q.realWidthFt = base.realWidthFt;
    q.realHeightFt = base.realHeightFt;
    const bool isLine = geometry.kind() == GeometryKind::Polyline;
    if (isLine) {
        q.lengthLf = base.perimeterLf;
    } else {
        q.areaSf = base.areaSf;
        q.perimeterLf = base.perimeterLf;
    }

    const BoundingBox& box = geometry.bounds();
    switch (policy.group) {
        case ClassGroup::Facade:
            if (!isLine) {
                Ring scratch;
                q.levelStarterLf = pixelsToFeet(levelStarterPx(outlineOf(geometry, scratch)), scaleRatio);
            }
            break;
        case ClassGroup::Opening:
            q.headLf = pixelsToFeet(box.width, scaleRatio);
            q.jambLf = pixelsToFeet(2.0 * box.height, scaleRatio);
            if (detection.detectionClass == DetectionClass::Window) {
                q.sillLf = pixelsToFeet(box.width, scaleRatio);
            }
            break;
        case ClassGroup::Gable:
            q.rakeLf = pixelsToFeet(gableRakePx(geometry), scaleRatio);
            break;
        case ClassGroup::Corner:
            q.lengthLf = isLine ? base.perimeterLf : pixelsToFeet(box.height, scaleRatio);
            break;
        case ClassGroup::Linear:
            q.lengthLf = pixelsToFeet(linearLengthPx(geometry), scaleRatio);
            break;
        case ClassGroup::Soffit:
        case ClassGroup::Roof:
        case ClassGroup::Count:
        case ClassGroup::Other:
            break;
    }
    return q;
}

void refreshDerived(Detection& detection, double scaleRatio) {
    detection.measurements = deriveMeasurements(detection.geometry, scaleRatio);
}

double netSidingSf(double facadeSf, double openingsSf) noexcept {
    return std::max(0.0, facadeSf - openingsSf);
}

} // namespace takeoff
