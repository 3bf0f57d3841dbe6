#ifndef TAKEOFF_DETECTION_DETECTION_GEOMETRY_H
#define TAKEOFF_DETECTION_DETECTION_GEOMETRY_H

#include "takeoff/core/types.h"
#include "takeoff/geometry/polygon.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace takeoff {

enum class GeometryKind : std::uint8_t {
    BoundingBoxOnly = 0,
    Polygon = 1,
    PolygonWithHoles = 2,
    Polyline = 3,
    Point = 4,
};

// Tagged geometry of a detection. Instances are only produced by the factories
// and edit helpers below, which reject degenerate input, so the bounding box is
// always the one derived from the vertices.
//
// Ring index 0 is the outer ring (or the polyline path); 1..n are holes.
class DetectionGeometry {
public:
    DetectionGeometry() = default;

    static bool fromBoundingBox(const BoundingBox& box, DetectionGeometry& out);
    static bool fromPolygon(Ring ring, DetectionGeometry& out);
    // Degrades to Polygon when `holes` is empty.
    static bool fromPolygonWithHoles(Ring outer, std::vector<Ring> holes, DetectionGeometry& out);
    static bool fromPolyline(std::vector<Point2> path, DetectionGeometry& out);
    static bool fromPoint(Point2 p, DetectionGeometry& out);

    GeometryKind kind() const noexcept { return kind_; }
    const BoundingBox& bounds() const noexcept { return bounds_; }
    const std::vector<Point2>& outer() const noexcept { return outer_; }
    const std::vector<Ring>& holes() const noexcept { return holes_; }
    std::size_t ringCount() const noexcept { return outer_.empty() ? 0 : 1 + holes_.size(); }
    const std::vector<Point2>* ring(std::size_t index) const noexcept;

    bool isArea() const noexcept;

    // Area geometries as a polygon (the box as its 4-corner rectangle); empty otherwise.
    PolygonWithHoles asPolygon() const;

    bool translated(double dx, double dy, DetectionGeometry& out) const;
    // Maps every vertex from the current bounds onto `box`.
    bool resized(const BoundingBox& box, DetectionGeometry& out) const;
    bool withVertexMoved(std::size_t ringIndex, std::size_t vertex, Point2 p, DetectionGeometry& out) const;
    bool withVertexInserted(std::size_t ringIndex, std::size_t afterVertex, Point2 p, DetectionGeometry& out) const;
    bool withVertexRemoved(std::size_t ringIndex, std::size_t vertex, DetectionGeometry& out) const;

private:
    bool rebuildWithRings(std::vector<Point2> outer, std::vector<Ring> holes, DetectionGeometry& out) const;

    GeometryKind kind_ = GeometryKind::BoundingBoxOnly;
    BoundingBox bounds_{};
    std::vector<Point2> outer_;
    std::vector<Ring> holes_;
};

bool operator==(const DetectionGeometry& a, const DetectionGeometry& b) noexcept;
inline bool operator!=(const DetectionGeometry& a, const DetectionGeometry& b) noexcept { return !(a == b); }

} // namespace takeoff

#endif // TAKEOFF_DETECTION_DETECTION_GEOMETRY_H
