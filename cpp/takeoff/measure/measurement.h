#ifndef TAKEOFF_MEASURE_MEASUREMENT_H
#define TAKEOFF_MEASURE_MEASUREMENT_H

#include "takeoff/detection/detection.h"
#include <cstdint>

namespace takeoff {

constexpr double kSlopeToleranceDeg = 5.0;
constexpr double kBaselineTolerancePx = 1.0;

// Class-specific quantities of one detection at one scale. Fields a class does not
// produce stay zero.
struct QuantityBreakdown {
    bool measured = false;
    MeasurementKind kind = MeasurementKind::Area;
    std::uint32_t count = 0;
    double areaSf = 0.0;
    double perimeterLf = 0.0;
    double lengthLf = 0.0;
    double headLf = 0.0;
    double jambLf = 0.0;
    double sillLf = 0.0;
    double rakeLf = 0.0;
    double levelStarterLf = 0.0;
    double realWidthFt = 0.0;
    double realHeightFt = 0.0;
};

inline bool isUsableScale(double scaleRatio) noexcept { return scaleRatio > 0.0 && scaleRatio < 1e300; }

double pixelsToFeet(double pixels, double scaleRatio) noexcept;
double pixelAreaToSquareFeet(double areaPx, double scaleRatio) noexcept;

// Horizontal extent of the vertices on the ring's lowest edge (largest image y).
// Falls back to the ring's width when fewer than two vertices sit on that line.
double levelStarterPx(const Ring& ring, double tolerancePx = kBaselineTolerancePx);

// Summed length of the edges that are neither near-horizontal nor near-vertical.
double slopedEdgeLengthPx(const Ring& ring, double toleranceDeg = kSlopeToleranceDeg);

// Rake of a gable; the two sloped sides of the box's inscribed triangle when the
// outline has no sloped edge.
double gableRakePx(const DetectionGeometry& geometry);

// Run length of a linear markup: path length for lines, long side of the box otherwise.
double linearLengthPx(const DetectionGeometry& geometry);

// Geometry-only cache: area, perimeter (or line length) and real bounds.
DetectionMeasurements deriveMeasurements(const DetectionGeometry& geometry, double scaleRatio);

QuantityBreakdown measureDetection(const Detection& detection, double scaleRatio);

// Recomputes the cached measurements in place.
void refreshDerived(Detection& detection, double scaleRatio);

// Gross facade area minus openings, never negative.
double netSidingSf(double facadeSf, double openingsSf) noexcept;

} // namespace takeoff

#endif // TAKEOFF_MEASURE_MEASUREMENT_H
