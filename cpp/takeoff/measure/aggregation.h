#ifndef TAKEOFF_MEASURE_AGGREGATION_H
#define TAKEOFF_MEASURE_AGGREGATION_H

#include "takeoff/core/config.h"
#include "takeoff/detection/detection.h"
#include "takeoff/detection/page.h"
#include "takeoff/measure/corner_inference.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace takeoff {

struct FacadeTotals {
    std::uint32_t count = 0;
    double areaSf = 0.0;
    double perimeterLf = 0.0;
    double levelStarterLf = 0.0;
};

struct OpeningTotals {
    std::uint32_t count = 0;
    double areaSf = 0.0;
    double perimeterLf = 0.0;
    double headLf = 0.0;
    double jambLf = 0.0;
    double sillLf = 0.0;
};

struct GableTotals {
    std::uint32_t count = 0;
    double areaSf = 0.0;
    double rakeLf = 0.0;
};

struct AreaTotals {
    std::uint32_t count = 0;
    double areaSf = 0.0;
};

struct LinearTotals {
    std::uint32_t count = 0;
    double lf = 0.0;
};

struct ClassTotals {
    std::uint32_t count = 0;
    double areaSf = 0.0;
    double perimeterLf = 0.0;
    double lengthLf = 0.0;
};

struct PageTotals {
    FacadeTotals facade;
    OpeningTotals windows;
    OpeningTotals doors;
    OpeningTotals garages;
    GableTotals gables;
    AreaTotals soffit;
    AreaTotals roof;
    // Drawn corner markups plus inferred corners.
    LinearTotals insideCorners;
    LinearTotals outsideCorners;
    std::uint32_t inferredInsideCorners = 0;
    std::uint32_t inferredOutsideCorners = 0;
    LinearTotals eaves;
    LinearTotals rakes;
    LinearTotals ridges;
    LinearTotals valleys;
    LinearTotals fascia;
    LinearTotals bellyBand;
    LinearTotals gutters;
    LinearTotals trim;
    std::uint32_t downspoutCount = 0;

    // Point markups, by class.
    std::map<DetectionClass, std::uint32_t> pointCounts;
    std::uint32_t totalPointCount = 0;

    std::map<DetectionClass, ClassTotals> byClass;

    double openingsAreaSf = 0.0;
    double netSidingSf = 0.0;
};

struct PageSummary {
    std::string pageId;
    double scaleRatio = 0.0;
    PageTotals totals;
};

struct JobTotals {
    std::vector<std::string> includedPageIds;
    std::vector<PageSummary> pages;
    PageTotals combined;
};

// Totals of the non-deleted detections of `page`. Returns false (and leaves `out`
// untouched) when the page scale is not positive.
bool computePageTotals(
    const Page& page,
    const std::vector<Detection>& detections,
    PageTotals& out,
    const AggregationOptions& options = AggregationOptions{});

// Sums elevation pages whose scale is calibrated (positive and not the sentinel).
// Net siding is computed per page, then summed. Returns false when no page qualifies.
bool computeJobTotals(
    const Job& job,
    const std::vector<Detection>& detections,
    JobTotals& out,
    const AggregationOptions& options = AggregationOptions{});

void accumulateTotals(PageTotals& into, const PageTotals& from);

} // namespace takeoff

#endif // TAKEOFF_MEASURE_AGGREGATION_H
