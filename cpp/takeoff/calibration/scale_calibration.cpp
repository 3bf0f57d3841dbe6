#include "takeoff/calibration/scale_calibration.h"
#include "takeoff/core/logging.h"
#include "takeoff/geometry/polygon.h"
#include <cmath>
#include <cstdio>
#include <limits>

namespace takeoff {

namespace {

constexpr ScaleNotation kScaleNotations[] = {
    {"1\" = 1'-0\"", 12.0},
    {"3/4\" = 1'-0\"", 16.0},
    {"1/2\" = 1'-0\"", 24.0},
    {"3/8\" = 1'-0\"", 32.0},
    {"1/4\" = 1'-0\"", 48.0},
    {"3/16\" = 1'-0\"", 64.0},
    {"1/8\" = 1'-0\"", 96.0},
    {"1/16\" = 1'-0\"", 192.0},
};

} // namespace

const ScaleNotation* standardScaleNotations(std::size_t& count) noexcept {
    count = sizeof(kScaleNotations) / sizeof(kScaleNotations[0]);
    return kScaleNotations;
}

double feetInchesToFeet(double feet, double inches) noexcept {
    return feet + inches / 12.0;
}

bool calibrateScale(double pixelDistance, double realFeet, CalibrationResult& out) {
    if (!std::isfinite(pixelDistance) || !std::isfinite(realFeet) || pixelDistance <= 0.0 || realFeet <= 0.0) {
        TAKEOFF_LOG_WARN("calibration rejected: pixelDistance=%f realFeet=%f", pixelDistance, realFeet);
        return false;
    }
    CalibrationResult result{};
    result.pixelsPerFoot = pixelDistance / realFeet;
    result.hasNotation = estimateScaleNotation(result.pixelsPerFoot, result.notation);
    out = result;
    return true;
}

bool calibrateScale(double pixelDistance, double feet, double inches, CalibrationResult& out) {
    return calibrateScale(pixelDistance, feetInchesToFeet(feet, inches), out);
}

bool calibrateFromSegment(Point2 a, Point2 b, double realFeet, CalibrationResult& out) {
    if (!isFinitePoint(a) || !isFinitePoint(b)) return false;
    return calibrateScale(distance(a, b), realFeet, out);
}

bool estimateScaleNotation(double pixelsPerFoot, ScaleNotation& out) noexcept {
    if (!std::isfinite(pixelsPerFoot) || pixelsPerFoot <= 0.0) return false;
    const ScaleNotation* best = nullptr;
    double bestDiff = std::numeric_limits<double>::infinity();
    for (const auto& entry : kScaleNotations) {
        const double diff = std::abs(pixelsPerFoot - entry.ratio);
        if (diff < bestDiff) {
            bestDiff = diff;
            best = &entry;
        }
    }
    if (!best || bestDiff / best->ratio >= kNotationTolerance) return false;
    out = *best;
    return true;
}

bool applyCalibration(Page& page, const CalibrationResult& result) {
    if (!std::isfinite(result.pixelsPerFoot) || result.pixelsPerFoot <= 0.0) return false;
    TAKEOFF_LOG_DEBUG("page %s calibrated: %f -> %f px/ft", page.id_.c_str(), page.scaleRatio_, result.pixelsPerFoot);
    page.scaleRatio_ = result.pixelsPerFoot;
    return true;
}

bool restoreScaleRatio(Page& page, double scaleRatio) {
    if (!std::isfinite(scaleRatio)) return false;
    page.scaleRatio_ = scaleRatio;
    return true;
}

std::string formatFeetInches(double feet) {
    if (!std::isfinite(feet)) return "0'-0\"";
    const bool negative = feet < 0.0;
    long totalInches = std::lround(std::abs(feet) * 12.0);
    const long wholeFeet = totalInches / 12;
    const long inches = totalInches % 12;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s%ld'-%ld\"", negative ? "-" : "", wholeFeet, inches);
    return buf;
}

std::string formatSquareFeet(double squareFeet) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f SF", std::isfinite(squareFeet) ? squareFeet : 0.0);
    return buf;
}

} // namespace takeoff
