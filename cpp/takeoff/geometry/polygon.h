#ifndef TAKEOFF_GEOMETRY_POLYGON_H
#define TAKEOFF_GEOMETRY_POLYGON_H

#include "takeoff/core/types.h"
#include <cstddef>
#include <vector>

namespace takeoff {

struct PolygonWithHoles {
    Ring outer;
    std::vector<Ring> holes;
};

struct ClosestEdge {
    std::size_t index{0}; // edge from vertex `index` to `index + 1` (wrapping)
    Point2 point{0.0, 0.0};
    double distance{0.0};
};

double distance(Point2 a, Point2 b) noexcept;
bool isFinitePoint(Point2 p) noexcept;

// Shoelace. Positive when the ring winds counter-clockwise in a y-up frame.
double signedArea(const Ring& ring) noexcept;
double ringArea(const Ring& ring) noexcept;
double ringPerimeter(const Ring& ring) noexcept;
double pathLength(const std::vector<Point2>& path) noexcept;

// Outer area minus hole areas; outer perimeter plus hole perimeters.
double polygonArea(const PolygonWithHoles& poly) noexcept;
double polygonPerimeter(const PolygonWithHoles& poly) noexcept;

BoundingBox boundingBoxOf(const std::vector<Point2>& points) noexcept;

// Top-left, top-right, bottom-right, bottom-left.
Ring rectToRing(const BoundingBox& box);

// Area-weighted centroid; vertex average when the ring is degenerate.
Point2 centroid(const Ring& ring) noexcept;

Point2 closestPointOnSegment(Point2 p, Point2 a, Point2 b) noexcept;
bool findClosestEdge(const Ring& ring, Point2 p, ClosestEdge& out) noexcept;

// Even-odd test. Points exactly on the boundary may land on either side.
bool pointInRing(const Ring& ring, Point2 p) noexcept;
bool pointInPolygon(const PolygonWithHoles& poly, Point2 p) noexcept;

// >= 3 finite vertices with non-zero area.
bool isValidRing(const Ring& ring) noexcept;
bool canRemoveVertex(const Ring& ring) noexcept;

} // namespace takeoff

#endif // TAKEOFF_GEOMETRY_POLYGON_H
