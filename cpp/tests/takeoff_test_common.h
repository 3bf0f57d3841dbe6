#pragma once

#include <gtest/gtest.h>

#include "takeoff/calibration/scale_calibration.h"
#include "takeoff/detection/detection.h"
#include "takeoff/detection/page.h"
#include "takeoff/geometry/polygon.h"

#include <functional>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace takeoff_test {

using namespace takeoff;

inline Page makePage(const std::string& id, double scaleRatio, PageType type = PageType::Elevation) {
    Page page(id, 1, 2000.0, 1500.0, type, "Front");
    if (scaleRatio != kUncalibratedScaleRatio) {
        EXPECT_TRUE(restoreScaleRatio(page, scaleRatio));
    }
    return page;
}

inline Job makeJob(std::vector<Page> pages, const std::string& id = "job-1") {
    Job job;
    job.id = id;
    job.pages = std::move(pages);
    return job;
}

inline Ring rect(double minX, double minY, double maxX, double maxY) {
    return Ring{{minX, minY}, {maxX, minY}, {maxX, maxY}, {minX, maxY}};
}

inline PolygonWithHoles square(double minX, double minY, double maxX, double maxY) {
    PolygonWithHoles poly;
    poly.outer = rect(minX, minY, maxX, maxY);
    return poly;
}

inline Detection baseDetection(const std::string& id, const std::string& pageId, DetectionClass cls) {
    Detection det;
    det.id = id;
    det.pageId = pageId;
    det.jobId = "job-1";
    det.detectionClass = cls;
    det.markupType = MarkupType::Polygon;
    det.status = DetectionStatus::Auto;
    det.confidence = 0.9;
    return det;
}

inline Detection boxDetection(const std::string& id, const std::string& pageId, DetectionClass cls,
                              double centerX, double centerY, double width, double height) {
    Detection det = baseDetection(id, pageId, cls);
    EXPECT_TRUE(DetectionGeometry::fromBoundingBox(BoundingBox{centerX, centerY, width, height}, det.geometry));
    return det;
}

inline Detection polygonDetection(const std::string& id, const std::string& pageId, DetectionClass cls, Ring ring) {
    Detection det = baseDetection(id, pageId, cls);
    EXPECT_TRUE(DetectionGeometry::fromPolygon(std::move(ring), det.geometry));
    return det;
}

inline Detection lineDetection(const std::string& id, const std::string& pageId, DetectionClass cls,
                               std::vector<Point2> path) {
    Detection det = baseDetection(id, pageId, cls);
    det.markupType = MarkupType::Line;
    EXPECT_TRUE(DetectionGeometry::fromPolyline(std::move(path), det.geometry));
    return det;
}

inline Detection pointDetection(const std::string& id, const std::string& pageId, DetectionClass cls, Point2 p) {
    Detection det = baseDetection(id, pageId, cls);
    det.markupType = MarkupType::Point;
    EXPECT_TRUE(DetectionGeometry::fromPoint(p, det.geometry));
    return det;
}

// Manually advanced millisecond clock for session options.
struct FakeClock {
    double nowMs = 1.7e12;

    std::function<double()> fn() {
        return [this]() { return nowMs; };
    }
};

} // namespace takeoff_test
