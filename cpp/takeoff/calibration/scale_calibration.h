#ifndef TAKEOFF_CALIBRATION_SCALE_CALIBRATION_H
#define TAKEOFF_CALIBRATION_SCALE_CALIBRATION_H

#include "takeoff/core/types.h"
#include "takeoff/detection/page.h"
#include <cstddef>
#include <string>

namespace takeoff {

struct ScaleNotation {
    const char* label;
    double ratio;
};

struct CalibrationResult {
    double pixelsPerFoot = 0.0;
    // Nearest standard architectural scale, when one is within tolerance.
    bool hasNotation = false;
    ScaleNotation notation{"", 0.0};
};

constexpr double kNotationTolerance = 0.30;

// Standard architectural scales, pixels per foot at the extraction resolution.
const ScaleNotation* standardScaleNotations(std::size_t& count) noexcept;

double feetInchesToFeet(double feet, double inches) noexcept;

// pixelsPerFoot = pixelDistance / realFeet. Rejects non-positive or non-finite input.
bool calibrateScale(double pixelDistance, double realFeet, CalibrationResult& out);
bool calibrateScale(double pixelDistance, double feet, double inches, CalibrationResult& out);
bool calibrateFromSegment(Point2 a, Point2 b, double realFeet, CalibrationResult& out);

// Nearest table entry by ratio, accepted when |ratio - entry| / entry < kNotationTolerance.
bool estimateScaleNotation(double pixelsPerFoot, ScaleNotation& out) noexcept;

// The only writers of Page::scaleRatio. applyCalibration accepts a successful calibration;
// restoreScaleRatio puts back a previously observed value (undo, draft recovery, reset).
bool applyCalibration(Page& page, const CalibrationResult& result);
bool restoreScaleRatio(Page& page, double scaleRatio);

// 12.5 -> 12'-6"
std::string formatFeetInches(double feet);
// 123.44 -> "123.4 SF"
std::string formatSquareFeet(double squareFeet);

} // namespace takeoff

#endif // TAKEOFF_CALIBRATION_SCALE_CALIBRATION_H
