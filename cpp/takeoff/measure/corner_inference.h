#ifndef TAKEOFF_MEASURE_CORNER_INFERENCE_H
#define TAKEOFF_MEASURE_CORNER_INFERENCE_H

#include "takeoff/core/config.h"
#include "takeoff/detection/detection.h"
#include <cstdint>
#include <string>
#include <vector>

namespace takeoff {

enum class CornerKind : std::uint8_t { Inside, Outside };
enum class WallSide : std::uint8_t { Left, Right };

struct InferredCorner {
    CornerKind kind;
    std::string wallId;
    WallSide side;
    double x;
    double lengthPx;
    double lengthLf;
};

struct CornerSummary {
    std::vector<InferredCorner> corners;
    std::uint32_t insideCount = 0;
    std::uint32_t outsideCount = 0;
    double insideLf = 0.0;
    double outsideLf = 0.0;
};

// Vertical extent of a wall's left or right side edge. Uses the vertices within
// `tolerancePx` of the wall's min/max x; when only one vertex is there, the two
// vertices nearest that side.
double wallEdgeHeightPx(const std::vector<Point2>& outline, WallSide side, double tolerancePx);

// Derives corners from facade outlines on one page:
//  - walls are grouped into rows by vertical center (rowTolerancePx),
//  - in each row the leftmost wall's left edge and the rightmost wall's right edge are outside corners,
//  - neighbours (by min x) separated by more than gapThresholdPx add two inside corners.
// Only area geometries of facade classes take part; other entries are ignored.
CornerSummary inferCorners(
    const std::vector<const Detection*>& walls,
    double scaleRatio,
    const CornerInferenceOptions& options = CornerInferenceOptions{});

} // namespace takeoff

#endif // TAKEOFF_MEASURE_CORNER_INFERENCE_H
