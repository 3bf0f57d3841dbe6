#include "takeoff/measure/corner_inference.h"
#include "takeoff/geometry/polygon.h"
#include "takeoff/measure/measurement.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace takeoff {

namespace {

struct WallExtent {
    const Detection* detection;
    Ring outline;
    double minX;
    double maxX;
    double centerY;
};

static void addCorner(CornerSummary& summary, CornerKind kind, const WallExtent& wall, WallSide side,
                      double scaleRatio, const CornerInferenceOptions& options) {
    InferredCorner corner{};
    corner.kind = kind;
    corner.wallId = wall.detection->id;
    corner.side = side;
    corner.x = side == WallSide::Left ? wall.minX : wall.maxX;
    corner.lengthPx = wallEdgeHeightPx(wall.outline, side, options.edgeTolerancePx);
    corner.lengthLf = pixelsToFeet(corner.lengthPx, scaleRatio);
    if (kind == CornerKind::Inside) {
        summary.insideCount++;
        summary.insideLf += corner.lengthLf;
    } else {
        summary.outsideCount++;
        summary.outsideLf += corner.lengthLf;
    }
    summary.corners.push_back(std::move(corner));
}

} // namespace

double wallEdgeHeightPx(const std::vector<Point2>& outline, WallSide side, double tolerancePx) {
    if (outline.size() < 2) return 0.0;
    const BoundingBox box = boundingBoxOf(outline);
    const double edgeX = side == WallSide::Left ? box.minX() : box.maxX();

    std::size_t onEdge = 0;
    double minY = 0.0;
    double maxY = 0.0;
    for (const auto& p : outline) {
        if (std::abs(p.x - edgeX) > tolerancePx) continue;
        if (onEdge == 0) {
            minY = p.y;
            maxY = p.y;
        } else {
            minY = std::min(minY, p.y);
            maxY = std::max(maxY, p.y);
        }
        ++onEdge;
    }
    if (onEdge >= 2) return maxY - minY;

    std::vector<Point2> sorted = outline;
    std::sort(sorted.begin(), sorted.end(), [side](const Point2& a, const Point2& b) {
        return side == WallSide::Left ? a.x < b.x : a.x > b.x;
    });
    return std::abs(sorted[1].y - sorted[0].y);
}

CornerSummary inferCorners(
    const std::vector<const Detection*>& walls,
    double scaleRatio,
    const CornerInferenceOptions& options) {
    CornerSummary summary{};

    std::vector<WallExtent> extents;
    extents.reserve(walls.size());
    for (const Detection* det : walls) {
        if (!det || det->isDeleted()) continue;
        if (!isFacadeClass(det->detectionClass) || !det->geometry.isArea()) continue;
        WallExtent wall{};
        wall.detection = det;
        wall.outline = det->geometry.asPolygon().outer;
        const BoundingBox& box = det->geometry.bounds();
        wall.minX = box.minX();
        wall.maxX = box.maxX();
        wall.centerY = box.centerY;
        extents.push_back(std::move(wall));
    }
    if (extents.empty()) return summary;

    std::stable_sort(extents.begin(), extents.end(), [](const WallExtent& a, const WallExtent& b) {
        return a.centerY < b.centerY;
    });

    std::vector<std::vector<const WallExtent*>> rows;
    for (const auto& wall : extents) {
        if (!rows.empty() && std::abs(wall.centerY - rows.back().back()->centerY) < options.rowTolerancePx) {
            rows.back().push_back(&wall);
        } else {
            rows.push_back({&wall});
        }
    }

    for (auto& row : rows) {
        std::stable_sort(row.begin(), row.end(), [](const WallExtent* a, const WallExtent* b) {
            return a->minX < b->minX;
        });

        const WallExtent* leftmost = row.front();
        const WallExtent* rightmost = row.front();
        for (const WallExtent* wall : row) {
            if (wall->maxX > rightmost->maxX) rightmost = wall;
        }
        addCorner(summary, CornerKind::Outside, *leftmost, WallSide::Left, scaleRatio, options);
        addCorner(summary, CornerKind::Outside, *rightmost, WallSide::Right, scaleRatio, options);

        for (std::size_t i = 1; i < row.size(); ++i) {
            const WallExtent* left = row[i - 1];
            const WallExtent* right = row[i];
            if (right->minX > left->maxX + options.gapThresholdPx) {
                addCorner(summary, CornerKind::Inside, *left, WallSide::Right, scaleRatio, options);
                addCorner(summary, CornerKind::Inside, *right, WallSide::Left, scaleRatio, options);
            }
        }
    }
    return summary;
}

} // namespace takeoff
