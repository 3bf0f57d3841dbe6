#include "takeoff/detection/detection_geometry.h"
#include <cmath>
#include <utility>

namespace takeoff {

namespace {

static bool allFinite(const std::vector<Point2>& points) {
    for (const auto& p : points) {
        if (!isFinitePoint(p)) return false;
    }
    return true;
}

static bool boxIsFinite(const BoundingBox& box) {
    return std::isfinite(box.centerX) && std::isfinite(box.centerY)
        && std::isfinite(box.width) && std::isfinite(box.height);
}

static Point2 remap(Point2 p, const BoundingBox& from, const BoundingBox& to) {
    const double sx = from.width > 0.0 ? to.width / from.width : 1.0;
    const double sy = from.height > 0.0 ? to.height / from.height : 1.0;
    return Point2{to.minX() + (p.x - from.minX()) * sx, to.minY() + (p.y - from.minY()) * sy};
}

} // namespace

bool DetectionGeometry::fromBoundingBox(const BoundingBox& box, DetectionGeometry& out) {
    if (!boxIsFinite(box) || box.width <= 0.0 || box.height <= 0.0) return false;
    out = DetectionGeometry{};
    out.kind_ = GeometryKind::BoundingBoxOnly;
    out.bounds_ = box;
    return true;
}

bool DetectionGeometry::fromPolygon(Ring ring, DetectionGeometry& out) {
    if (!isValidRing(ring)) return false;
    out = DetectionGeometry{};
    out.kind_ = GeometryKind::Polygon;
    out.bounds_ = boundingBoxOf(ring);
    out.outer_ = std::move(ring);
    return true;
}

bool DetectionGeometry::fromPolygonWithHoles(Ring outer, std::vector<Ring> holes, DetectionGeometry& out) {
    if (holes.empty()) return fromPolygon(std::move(outer), out);
    if (!isValidRing(outer)) return false;
    for (const auto& hole : holes) {
        if (!isValidRing(hole)) return false;
    }
    PolygonWithHoles poly{outer, holes};
    if (!(polygonArea(poly) > 0.0)) return false;
    out = DetectionGeometry{};
    out.kind_ = GeometryKind::PolygonWithHoles;
    out.bounds_ = boundingBoxOf(outer);
    out.outer_ = std::move(outer);
    out.holes_ = std::move(holes);
    return true;
}

bool DetectionGeometry::fromPolyline(std::vector<Point2> path, DetectionGeometry& out) {
    if (path.size() < 2 || !allFinite(path)) return false;
    if (!(pathLength(path) > 0.0)) return false;
    out = DetectionGeometry{};
    out.kind_ = GeometryKind::Polyline;
    out.bounds_ = boundingBoxOf(path);
    out.outer_ = std::move(path);
    return true;
}

bool DetectionGeometry::fromPoint(Point2 p, DetectionGeometry& out) {
    if (!isFinitePoint(p)) return false;
    out = DetectionGeometry{};
    out.kind_ = GeometryKind::Point;
    out.bounds_ = BoundingBox{p.x, p.y, 0.0, 0.0};
    out.outer_.push_back(p);
    return true;
}

const std::vector<Point2>* DetectionGeometry::ring(std::size_t index) const noexcept {
    if (outer_.empty()) return nullptr;
    if (index == 0) return &outer_;
    if (index - 1 < holes_.size()) return &holes_[index - 1];
    return nullptr;
}

bool DetectionGeometry::isArea() const noexcept {
    return kind_ == GeometryKind::BoundingBoxOnly
        || kind_ == GeometryKind::Polygon
        || kind_ == GeometryKind::PolygonWithHoles;
}

PolygonWithHoles DetectionGeometry::asPolygon() const {
    PolygonWithHoles poly{};
    switch (kind_) {
        case GeometryKind::BoundingBoxOnly:
            poly.outer = rectToRing(bounds_);
            break;
        case GeometryKind::Polygon:
            poly.outer = outer_;
            break;
        case GeometryKind::PolygonWithHoles:
            poly.outer = outer_;
            poly.holes = holes_;
            break;
        case GeometryKind::Polyline:
        case GeometryKind::Point:
            break;
    }
    return poly;
}

bool DetectionGeometry::rebuildWithRings(std::vector<Point2> outer, std::vector<Ring> holes, DetectionGeometry& out) const {
    switch (kind_) {
        case GeometryKind::BoundingBoxOnly:
            return false;
        case GeometryKind::Polygon:
            return fromPolygon(std::move(outer), out);
        case GeometryKind::PolygonWithHoles:
            return fromPolygonWithHoles(std::move(outer), std::move(holes), out);
        case GeometryKind::Polyline:
            return fromPolyline(std::move(outer), out);
        case GeometryKind::Point:
            if (outer.size() != 1) return false;
            return fromPoint(outer[0], out);
    }
    return false;
}

bool DetectionGeometry::translated(double dx, double dy, DetectionGeometry& out) const {
    if (!std::isfinite(dx) || !std::isfinite(dy)) return false;
    if (kind_ == GeometryKind::BoundingBoxOnly) {
        BoundingBox box = bounds_;
        box.centerX += dx;
        box.centerY += dy;
        return fromBoundingBox(box, out);
    }
    std::vector<Point2> outer = outer_;
    for (auto& p : outer) {
        p.x += dx;
        p.y += dy;
    }
    std::vector<Ring> holes = holes_;
    for (auto& hole : holes) {
        for (auto& p : hole) {
            p.x += dx;
            p.y += dy;
        }
    }
    return rebuildWithRings(std::move(outer), std::move(holes), out);
}

bool DetectionGeometry::resized(const BoundingBox& box, DetectionGeometry& out) const {
    if (!boxIsFinite(box) || box.width < 0.0 || box.height < 0.0) return false;
    if (kind_ == GeometryKind::BoundingBoxOnly) return fromBoundingBox(box, out);
    if (kind_ == GeometryKind::Point) return fromPoint(Point2{box.centerX, box.centerY}, out);

    std::vector<Point2> outer = outer_;
    for (auto& p : outer) p = remap(p, bounds_, box);
    std::vector<Ring> holes = holes_;
    for (auto& hole : holes) {
        for (auto& p : hole) p = remap(p, bounds_, box);
    }
    return rebuildWithRings(std::move(outer), std::move(holes), out);
}

bool DetectionGeometry::withVertexMoved(std::size_t ringIndex, std::size_t vertex, Point2 p, DetectionGeometry& out) const {
    const std::vector<Point2>* target = ring(ringIndex);
    if (!target || vertex >= target->size() || !isFinitePoint(p)) return false;
    std::vector<Point2> outer = outer_;
    std::vector<Ring> holes = holes_;
    std::vector<Point2>& edit = ringIndex == 0 ? outer : holes[ringIndex - 1];
    edit[vertex] = p;
    return rebuildWithRings(std::move(outer), std::move(holes), out);
}

bool DetectionGeometry::withVertexInserted(std::size_t ringIndex, std::size_t afterVertex, Point2 p, DetectionGeometry& out) const {
    if (kind_ == GeometryKind::Point) return false;
    const std::vector<Point2>* target = ring(ringIndex);
    if (!target || afterVertex >= target->size() || !isFinitePoint(p)) return false;
    std::vector<Point2> outer = outer_;
    std::vector<Ring> holes = holes_;
    std::vector<Point2>& edit = ringIndex == 0 ? outer : holes[ringIndex - 1];
    edit.insert(edit.begin() + static_cast<std::ptrdiff_t>(afterVertex + 1), p);
    return rebuildWithRings(std::move(outer), std::move(holes), out);
}

bool DetectionGeometry::withVertexRemoved(std::size_t ringIndex, std::size_t vertex, DetectionGeometry& out) const {
    const std::vector<Point2>* target = ring(ringIndex);
    if (!target || vertex >= target->size()) return false;
    if (kind_ == GeometryKind::Polyline) {
        if (target->size() <= 2) return false;
    } else if (!canRemoveVertex(*target)) {
        return false;
    }
    std::vector<Point2> outer = outer_;
    std::vector<Ring> holes = holes_;
    std::vector<Point2>& edit = ringIndex == 0 ? outer : holes[ringIndex - 1];
    edit.erase(edit.begin() + static_cast<std::ptrdiff_t>(vertex));
    return rebuildWithRings(std::move(outer), std::move(holes), out);
}

bool operator==(const DetectionGeometry& a, const DetectionGeometry& b) noexcept {
    if (a.kind() != b.kind() || a.bounds() != b.bounds()) return false;
    if (a.outer() != b.outer()) return false;
    return a.holes() == b.holes();
}

} // namespace takeoff
