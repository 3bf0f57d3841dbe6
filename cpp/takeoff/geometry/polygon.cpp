#include "takeoff/geometry/polygon.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace takeoff {

double distance(Point2 a, Point2 b) noexcept {
    return std::hypot(b.x - a.x, b.y - a.y);
}

bool isFinitePoint(Point2 p) noexcept {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

double signedArea(const Ring& ring) noexcept {
    const std::size_t n = ring.size();
    if (n < 3) return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];
        sum += a.x * b.y - b.x * a.y;
    }
    return sum * 0.5;
}

double ringArea(const Ring& ring) noexcept {
    return std::abs(signedArea(ring));
}

double ringPerimeter(const Ring& ring) noexcept {
    const std::size_t n = ring.size();
    if (n < 2) return 0.0;
    double sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        sum += distance(ring[i], ring[(i + 1) % n]);
    }
    return sum;
}

double pathLength(const std::vector<Point2>& path) noexcept {
    double sum = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        sum += distance(path[i - 1], path[i]);
    }
    return sum;
}

double polygonArea(const PolygonWithHoles& poly) noexcept {
    double area = ringArea(poly.outer);
    for (const auto& hole : poly.holes) area -= ringArea(hole);
    return area;
}

double polygonPerimeter(const PolygonWithHoles& poly) noexcept {
    double perimeter = ringPerimeter(poly.outer);
    for (const auto& hole : poly.holes) perimeter += ringPerimeter(hole);
    return perimeter;
}

BoundingBox boundingBoxOf(const std::vector<Point2>& points) noexcept {
    if (points.empty()) return BoundingBox{};
    double minX = points[0].x;
    double maxX = points[0].x;
    double minY = points[0].y;
    double maxY = points[0].y;
    for (const auto& p : points) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    BoundingBox box{};
    box.centerX = (minX + maxX) * 0.5;
    box.centerY = (minY + maxY) * 0.5;
    box.width = maxX - minX;
    box.height = maxY - minY;
    return box;
}

Ring rectToRing(const BoundingBox& box) {
    const double left = box.minX();
    const double right = box.maxX();
    const double top = box.minY();
    const double bottom = box.maxY();
    return Ring{
        Point2{left, top},
        Point2{right, top},
        Point2{right, bottom},
        Point2{left, bottom},
    };
}

Point2 centroid(const Ring& ring) noexcept {
    if (ring.empty()) return Point2{0.0, 0.0};
    const double area = signedArea(ring);
    if (std::abs(area) < 1e-4) {
        double sx = 0.0;
        double sy = 0.0;
        for (const auto& p : ring) {
            sx += p.x;
            sy += p.y;
        }
        const double n = static_cast<double>(ring.size());
        return Point2{sx / n, sy / n};
    }
    double cx = 0.0;
    double cy = 0.0;
    const std::size_t n = ring.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2& a = ring[i];
        const Point2& b = ring[(i + 1) % n];
        const double cross = a.x * b.y - b.x * a.y;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }
    const double k = 1.0 / (6.0 * area);
    return Point2{cx * k, cy * k};
}

Point2 closestPointOnSegment(Point2 p, Point2 a, Point2 b) noexcept {
    const double dx = b.x - a.x;
    const double dy = b.y - a.y;
    const double l2 = dx * dx + dy * dy;
    if (l2 == 0.0) return a;
    double t = ((p.x - a.x) * dx + (p.y - a.y) * dy) / l2;
    t = std::max(0.0, std::min(1.0, t));
    return Point2{a.x + t * dx, a.y + t * dy};
}

bool findClosestEdge(const Ring& ring, Point2 p, ClosestEdge& out) noexcept {
    const std::size_t n = ring.size();
    if (n < 2) return false;
    double best = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < n; ++i) {
        const Point2 q = closestPointOnSegment(p, ring[i], ring[(i + 1) % n]);
        const double d = distance(p, q);
        if (d < best) {
            best = d;
            out.index = i;
            out.point = q;
            out.distance = d;
        }
    }
    return true;
}

bool pointInRing(const Ring& ring, Point2 p) noexcept {
    const std::size_t n = ring.size();
    if (n < 3) return false;
    bool inside = false;
    for (std::size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2& a = ring[i];
        const Point2& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double xCross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < xCross) inside = !inside;
        }
    }
    return inside;
}

bool pointInPolygon(const PolygonWithHoles& poly, Point2 p) noexcept {
    if (!pointInRing(poly.outer, p)) return false;
    for (const auto& hole : poly.holes) {
        if (pointInRing(hole, p)) return false;
    }
    return true;
}

bool isValidRing(const Ring& ring) noexcept {
    if (ring.size() < 3) return false;
    for (const auto& p : ring) {
        if (!isFinitePoint(p)) return false;
    }
    return ringArea(ring) > 0.0;
}

bool canRemoveVertex(const Ring& ring) noexcept {
    return ring.size() > 3;
}

} // namespace takeoff
