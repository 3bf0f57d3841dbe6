#ifndef TAKEOFF_GEOMETRY_POLYGON_BOOLEAN_H
#define TAKEOFF_GEOMETRY_POLYGON_BOOLEAN_H

#include "takeoff/core/config.h"
#include "takeoff/geometry/polygon.h"
#include <cstdint>
#include <vector>

namespace takeoff {

enum class BooleanOp : std::uint8_t {
    Intersection,
    Union,
    Difference,
    Xor,
};

// Boolean of two polygons with holes under the even-odd fill rule, so ring
// orientation of the operands does not matter and self-crossing rings are
// resolved at their own crossings.
//
// Coordinates are snapped to a fixed-point grid of `options.scale` units per
// pixel for the clipping pass. Outers wind counter-clockwise (positive signed
// area), holes clockwise; islands inside holes come back as separate polygons.
// Results are ordered by descending area. Returns an empty list when either
// operand does not fit the fixed-point range.
std::vector<PolygonWithHoles> computeBoolean(
    BooleanOp op,
    const PolygonWithHoles& subject,
    const PolygonWithHoles& clip,
    const BooleanOptions& options = BooleanOptions{});

double totalArea(const std::vector<PolygonWithHoles>& polys) noexcept;

} // namespace takeoff

#endif // TAKEOFF_GEOMETRY_POLYGON_BOOLEAN_H
