#include "takeoff/geometry/polygon_boolean.h"
#include "takeoff/core/logging.h"
#include "clipper2/clipper.h"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>

namespace takeoff {

namespace {

using Clipper2Lib::Path64;
using Clipper2Lib::Paths64;
using Clipper2Lib::PolyPath64;

// Clipper64 rejects coordinates near the int64 limit.
constexpr double kMaxScaledCoord = 1.0e18;

static Clipper2Lib::ClipType toClipType(BooleanOp op) noexcept {
    switch (op) {
        case BooleanOp::Intersection: return Clipper2Lib::ClipType::Intersection;
        case BooleanOp::Union: return Clipper2Lib::ClipType::Union;
        case BooleanOp::Difference: return Clipper2Lib::ClipType::Difference;
        case BooleanOp::Xor: return Clipper2Lib::ClipType::Xor;
    }
    return Clipper2Lib::ClipType::Intersection;
}

static bool appendRing(const Ring& ring, double scale, Paths64& out) {
    if (ring.size() < 3) return true;
    Path64 path;
    path.reserve(ring.size());
    for (const Point2& p : ring) {
        const double x = p.x * scale;
        const double y = p.y * scale;
        if (!std::isfinite(x) || !std::isfinite(y) || std::abs(x) > kMaxScaledCoord || std::abs(y) > kMaxScaledCoord) {
            return false;
        }
        path.emplace_back(static_cast<std::int64_t>(std::llround(x)), static_cast<std::int64_t>(std::llround(y)));
    }
    out.push_back(std::move(path));
    return true;
}

static bool toPaths(const PolygonWithHoles& poly, double scale, Paths64& out) {
    if (!appendRing(poly.outer, scale, out)) return false;
    for (const auto& hole : poly.holes) {
        if (!appendRing(hole, scale, out)) return false;
    }
    return true;
}

static Ring toRing(const Path64& path, double invScale, bool counterClockwise) {
    Ring ring;
    ring.reserve(path.size());
    for (const auto& pt : path) {
        ring.push_back(Point2{static_cast<double>(pt.x) * invScale, static_cast<double>(pt.y) * invScale});
    }
    if ((signedArea(ring) > 0.0) != counterClockwise) std::reverse(ring.begin(), ring.end());
    return ring;
}

// Children of `node` are outers, their children holes, and the holes' children
// nested outers again.
static void collectPolygons(const PolyPath64& node, double invScale, std::vector<PolygonWithHoles>& out) {
    for (const auto& child : node) {
        PolygonWithHoles poly{};
        poly.outer = toRing(child->Polygon(), invScale, true);
        if (poly.outer.size() < 3) continue;
        for (const auto& hole : *child) {
            Ring ring = toRing(hole->Polygon(), invScale, false);
            if (ring.size() >= 3) poly.holes.push_back(std::move(ring));
            collectPolygons(*hole, invScale, out);
        }
        out.push_back(std::move(poly));
    }
}

} // namespace

std::vector<PolygonWithHoles> computeBoolean(
    BooleanOp op,
    const PolygonWithHoles& subject,
    const PolygonWithHoles& clip,
    const BooleanOptions& options) {
    if (!(options.scale > 0.0) || !std::isfinite(options.scale)) {
        TAKEOFF_LOG_WARN("boolean: invalid fixed-point scale %g", options.scale);
        return {};
    }

    Paths64 subjectPaths;
    Paths64 clipPaths;
    if (!toPaths(subject, options.scale, subjectPaths) || !toPaths(clip, options.scale, clipPaths)) {
        TAKEOFF_LOG_WARN("boolean: operand outside the fixed-point range at scale %g", options.scale);
        return {};
    }
    if (subjectPaths.empty()) return {};

    Clipper2Lib::PolyTree64 tree;
    Clipper2Lib::Clipper64 clipper;
    clipper.AddSubject(subjectPaths);
    if (!clipPaths.empty()) clipper.AddClip(clipPaths);
    if (!clipper.Execute(toClipType(op), Clipper2Lib::FillRule::EvenOdd, tree)) {
        TAKEOFF_LOG_WARN("boolean: clipper execution failed");
        return {};
    }

    std::vector<PolygonWithHoles> result;
    collectPolygons(tree, 1.0 / options.scale, result);
    TAKEOFF_LOG_DEBUG("boolean: %zu subject rings, %zu clip rings -> %zu polygons",
                      subjectPaths.size(), clipPaths.size(), result.size());

    std::sort(result.begin(), result.end(), [](const PolygonWithHoles& a, const PolygonWithHoles& b) {
        const double areaA = polygonArea(a);
        const double areaB = polygonArea(b);
        if (areaA != areaB) return areaA > areaB;
        const BoundingBox boxA = boundingBoxOf(a.outer);
        const BoundingBox boxB = boundingBoxOf(b.outer);
        if (boxA.minX() != boxB.minX()) return boxA.minX() < boxB.minX();
        return boxA.minY() < boxB.minY();
    });
    return result;
}

double totalArea(const std::vector<PolygonWithHoles>& polys) noexcept {
    double sum = 0.0;
    for (const auto& poly : polys) sum += polygonArea(poly);
    return sum;
}

} // namespace takeoff
