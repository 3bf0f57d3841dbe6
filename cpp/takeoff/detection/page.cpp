#include "takeoff/detection/page.h"
#include <cmath>
#include <utility>

namespace takeoff {

const char* pageTypeKey(PageType type) noexcept {
    switch (type) {
        case PageType::Elevation: return "elevation";
        case PageType::FloorPlan: return "floor_plan";
        case PageType::RoofPlan: return "roof_plan";
        case PageType::Schedule: return "schedule";
        case PageType::Cover: return "cover";
        case PageType::Detail: return "detail";
        case PageType::Section: return "section";
        case PageType::SitePlan: return "site_plan";
        case PageType::Other: return "other";
    }
    return "other";
}

Page::Page(std::string id, std::uint32_t pageNumber, double pixelWidth, double pixelHeight,
           PageType type, std::string elevationName)
    : id_(std::move(id)),
      pageNumber_(pageNumber),
      pixelWidth_(pixelWidth),
      pixelHeight_(pixelHeight),
      type_(type),
      elevationName_(std::move(elevationName)) {}

bool Page::isCalibrated(double uncalibratedSentinel) const noexcept {
    return std::isfinite(scaleRatio_) && scaleRatio_ > 0.0 && scaleRatio_ != uncalibratedSentinel;
}

Page* Job::findPage(const std::string& pageId) noexcept {
    for (auto& page : pages) {
        if (page.id() == pageId) return &page;
    }
    return nullptr;
}

const Page* Job::findPage(const std::string& pageId) const noexcept {
    for (const auto& page : pages) {
        if (page.id() == pageId) return &page;
    }
    return nullptr;
}

} // namespace takeoff
