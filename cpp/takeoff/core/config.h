#ifndef TAKEOFF_CORE_CONFIG_H
#define TAKEOFF_CORE_CONFIG_H

#include <cstddef>
#include <functional>

namespace takeoff {

// Pages default to this ratio until calibrated. It coincides with a real 1/4" = 1'-0" scale.
constexpr double kUncalibratedScaleRatio = 48.0;

constexpr double kConfidenceHigh = 0.85;
constexpr double kConfidenceMedium = 0.70;
constexpr double kConfidenceLow = 0.50;

struct CornerInferenceOptions {
    // Walls whose vertical centers differ by less than this share a row.
    double rowTolerancePx = 50.0;
    // Horizontal gap between neighbouring walls that produces a pair of inside corners.
    double gapThresholdPx = 10.0;
    // Vertices within this distance of a wall's min/max x belong to that side edge.
    double edgeTolerancePx = 1.0;
};

struct AggregationOptions {
    double uncalibratedScaleRatio = kUncalibratedScaleRatio;
    // Job totals only combine elevation pages.
    bool elevationPagesOnly = true;
    bool inferCorners = true;
    CornerInferenceOptions corners;
};

struct BooleanOptions {
    // Fixed-point units per pixel used while clipping.
    double scale = 1000000.0;
};

struct SessionOptions {
    double draftMaxAgeMs = 60.0 * 60.0 * 1000.0;
    double autosaveIntervalMs = 30.0 * 1000.0;
    std::size_t maxHistoryEntries = 50;
    AggregationOptions aggregation;
    // Milliseconds since epoch. Defaults to the system clock when empty.
    std::function<double()> clock;
};

} // namespace takeoff

#endif // TAKEOFF_CORE_CONFIG_H
