#ifndef TAKEOFF_EDIT_SPLIT_OPERATOR_H
#define TAKEOFF_EDIT_SPLIT_OPERATOR_H

#include "takeoff/core/config.h"
#include "takeoff/detection/detection.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace takeoff {

enum class SplitStatus : std::uint8_t {
    Split = 0,
    // The cut does not overlap the target.
    NothingToSplit = 1,
    // Fewer than 3 vertices, non-finite points or zero filled area.
    InvalidCut = 2,
    DegenerateTarget = 3,
    // Lines, points and non-polygon markups cannot be carved.
    UnsupportedTarget = 4,
    // Pieces do not add up to the original; nothing is applied.
    AreaMismatch = 5,
    NotFound = 6,
};

const char* splitStatusName(SplitStatus status) noexcept;

constexpr double kSplitAreaTolerance = 1e-6;

struct SplitResult {
    SplitStatus status = SplitStatus::NothingToSplit;
    // The original with status Deleted; only meaningful when status == Split.
    Detection retired;
    // Carved pieces first, then the remaining pieces. Ids are left empty for the caller.
    std::vector<Detection> pieces;
    std::size_t carvedCount = 0;
    double originalAreaPx = 0.0;
    double piecesAreaPx = 0.0;
};

// Area enclosed under the even-odd rule; differs from polygonArea for self-crossing rings.
double filledArea(const PolygonWithHoles& poly, const BooleanOptions& options = BooleanOptions{});

// At least 3 finite vertices enclosing a non-zero filled area. Self-crossing rings are accepted.
bool isValidCut(const Ring& cut, const BooleanOptions& options = BooleanOptions{});

// Carves `cut` out of `original`: intersection pieces plus difference pieces, each a new
// edited detection of the same class and page with derived measurements at `scaleRatio`.
SplitResult splitDetection(
    const Detection& original,
    const Ring& cut,
    double scaleRatio,
    double nowMs,
    const BooleanOptions& options = BooleanOptions{});

} // namespace takeoff

#endif // TAKEOFF_EDIT_SPLIT_OPERATOR_H
