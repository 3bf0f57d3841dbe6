#ifndef TAKEOFF_DETECTION_PAGE_H
#define TAKEOFF_DETECTION_PAGE_H

#include "takeoff/core/config.h"
#include <cstdint>
#include <string>
#include <vector>

namespace takeoff {

struct CalibrationResult;

enum class PageType : std::uint8_t {
    Elevation = 0,
    FloorPlan = 1,
    RoofPlan = 2,
    Schedule = 3,
    Cover = 4,
    Detail = 5,
    Section = 6,
    SitePlan = 7,
    Other = 8,
};

const char* pageTypeKey(PageType type) noexcept;

// One drawing sheet. Everything except the scale ratio is fixed at construction;
// the scale ratio is written only through the calibration functions.
class Page {
public:
    Page() = default;
    Page(std::string id, std::uint32_t pageNumber, double pixelWidth, double pixelHeight,
         PageType type, std::string elevationName = {});

    const std::string& id() const noexcept { return id_; }
    std::uint32_t pageNumber() const noexcept { return pageNumber_; }
    double pixelWidth() const noexcept { return pixelWidth_; }
    double pixelHeight() const noexcept { return pixelHeight_; }
    PageType type() const noexcept { return type_; }
    const std::string& elevationName() const noexcept { return elevationName_; }
    double scaleRatio() const noexcept { return scaleRatio_; }

    // Non-positive ratios and the sentinel both mean "not calibrated".
    bool isCalibrated(double uncalibratedSentinel = kUncalibratedScaleRatio) const noexcept;

private:
    friend bool applyCalibration(Page& page, const CalibrationResult& result);
    friend bool restoreScaleRatio(Page& page, double scaleRatio);

    std::string id_;
    std::uint32_t pageNumber_ = 0;
    double pixelWidth_ = 0.0;
    double pixelHeight_ = 0.0;
    PageType type_ = PageType::Other;
    std::string elevationName_;
    double scaleRatio_ = kUncalibratedScaleRatio;
};

struct Job {
    std::string id;
    std::vector<Page> pages;

    Page* findPage(const std::string& pageId) noexcept;
    const Page* findPage(const std::string& pageId) const noexcept;
};

} // namespace takeoff

#endif // TAKEOFF_DETECTION_PAGE_H
