#include "takeoff/measure/aggregation.h"
#include "takeoff/measure/measurement.h"
#include <utility>

namespace takeoff {

namespace {

static void addOpening(OpeningTotals& t, const QuantityBreakdown& q) {
    t.count++;
    t.areaSf += q.areaSf;
    t.perimeterLf += q.perimeterLf;
    t.headLf += q.headLf;
    t.jambLf += q.jambLf;
    t.sillLf += q.sillLf;
}

static void addLinear(LinearTotals& t, double lf) {
    t.count++;
    t.lf += lf;
}

static void mergeOpening(OpeningTotals& into, const OpeningTotals& from) {
    into.count += from.count;
    into.areaSf += from.areaSf;
    into.perimeterLf += from.perimeterLf;
    into.headLf += from.headLf;
    into.jambLf += from.jambLf;
    into.sillLf += from.sillLf;
}

static void mergeLinear(LinearTotals& into, const LinearTotals& from) {
    into.count += from.count;
    into.lf += from.lf;
}

static void mergeArea(AreaTotals& into, const AreaTotals& from) {
    into.count += from.count;
    into.areaSf += from.areaSf;
}

} // namespace

bool computePageTotals(
    const Page& page,
    const std::vector<Detection>& detections,
    PageTotals& out,
    const AggregationOptions& options) {
    const double scale = page.scaleRatio();
    if (!isUsableScale(scale)) return false;

    PageTotals t{};
    std::vector<const Detection*> walls;

    for (const auto& det : detections) {
        if (det.pageId != page.id() || det.isDeleted()) continue;
        const DetectionClass cls = det.detectionClass;
        const QuantityBreakdown q = measureDetection(det, scale);

        if (det.markupType == MarkupType::Point || det.geometry.kind() == GeometryKind::Point) {
            t.pointCounts[cls]++;
            t.totalPointCount++;
            t.byClass[cls].count++;
            if (cls == DetectionClass::Downspout) t.downspoutCount++;
            continue;
        }

        ClassTotals& byClass = t.byClass[cls];
        byClass.count++;
        byClass.areaSf += q.areaSf;
        byClass.perimeterLf += q.perimeterLf;
        byClass.lengthLf += q.lengthLf;

        switch (cls) {
            case DetectionClass::Siding:
            case DetectionClass::Building:
                t.facade.count++;
                t.facade.areaSf += q.areaSf;
                t.facade.perimeterLf += q.perimeterLf;
                t.facade.levelStarterLf += q.levelStarterLf;
                if (det.geometry.isArea()) walls.push_back(&det);
                break;
            case DetectionClass::Window:
                addOpening(t.windows, q);
                break;
            case DetectionClass::Door:
                addOpening(t.doors, q);
                break;
            case DetectionClass::Garage:
                addOpening(t.garages, q);
                break;
            case DetectionClass::Gable:
                t.gables.count++;
                t.gables.areaSf += q.areaSf;
                t.gables.rakeLf += q.rakeLf;
                break;
            case DetectionClass::Soffit:
                t.soffit.count++;
                t.soffit.areaSf += q.areaSf;
                break;
            case DetectionClass::Roof:
                t.roof.count++;
                t.roof.areaSf += q.areaSf;
                break;
            case DetectionClass::CornerInside:
                addLinear(t.insideCorners, q.lengthLf);
                break;
            case DetectionClass::CornerOutside:
                addLinear(t.outsideCorners, q.lengthLf);
                break;
            case DetectionClass::Eave:
                addLinear(t.eaves, q.lengthLf);
                break;
            case DetectionClass::Rake:
                addLinear(t.rakes, q.lengthLf);
                break;
            case DetectionClass::Ridge:
                addLinear(t.ridges, q.lengthLf);
                break;
            case DetectionClass::Valley:
                addLinear(t.valleys, q.lengthLf);
                break;
            case DetectionClass::Fascia:
                addLinear(t.fascia, q.lengthLf);
                break;
            case DetectionClass::BellyBand:
                addLinear(t.bellyBand, q.lengthLf);
                break;
            case DetectionClass::Gutter:
                addLinear(t.gutters, q.lengthLf);
                break;
            case DetectionClass::Trim:
                addLinear(t.trim, q.lengthLf);
                break;
            case DetectionClass::Downspout:
                t.downspoutCount++;
                break;
            default:
                break;
        }
    }

    if (options.inferCorners && !walls.empty()) {
        const CornerSummary corners = inferCorners(walls, scale, options.corners);
        t.insideCorners.count += corners.insideCount;
        t.insideCorners.lf += corners.insideLf;
        t.outsideCorners.count += corners.outsideCount;
        t.outsideCorners.lf += corners.outsideLf;
        t.inferredInsideCorners = corners.insideCount;
        t.inferredOutsideCorners = corners.outsideCount;
    }

    t.openingsAreaSf = t.windows.areaSf + t.doors.areaSf + t.garages.areaSf;
    t.netSidingSf = netSidingSf(t.facade.areaSf, t.openingsAreaSf);
    out = std::move(t);
    return true;
}

void accumulateTotals(PageTotals& into, const PageTotals& from) {
    into.facade.count += from.facade.count;
    into.facade.areaSf += from.facade.areaSf;
    into.facade.perimeterLf += from.facade.perimeterLf;
    into.facade.levelStarterLf += from.facade.levelStarterLf;
    mergeOpening(into.windows, from.windows);
    mergeOpening(into.doors, from.doors);
    mergeOpening(into.garages, from.garages);
    into.gables.count += from.gables.count;
    into.gables.areaSf += from.gables.areaSf;
    into.gables.rakeLf += from.gables.rakeLf;
    mergeArea(into.soffit, from.soffit);
    mergeArea(into.roof, from.roof);
    mergeLinear(into.insideCorners, from.insideCorners);
    mergeLinear(into.outsideCorners, from.outsideCorners);
    into.inferredInsideCorners += from.inferredInsideCorners;
    into.inferredOutsideCorners += from.inferredOutsideCorners;
    mergeLinear(into.eaves, from.eaves);
    mergeLinear(into.rakes, from.rakes);
    mergeLinear(into.ridges, from.ridges);
    mergeLinear(into.valleys, from.valleys);
    mergeLinear(into.fascia, from.fascia);
    mergeLinear(into.bellyBand, from.bellyBand);
    mergeLinear(into.gutters, from.gutters);
    mergeLinear(into.trim, from.trim);
    into.downspoutCount += from.downspoutCount;
    for (const auto& entry : from.pointCounts) into.pointCounts[entry.first] += entry.second;
    into.totalPointCount += from.totalPointCount;
    for (const auto& entry : from.byClass) {
        ClassTotals& c = into.byClass[entry.first];
        c.count += entry.second.count;
        c.areaSf += entry.second.areaSf;
        c.perimeterLf += entry.second.perimeterLf;
        c.lengthLf += entry.second.lengthLf;
    }
    into.openingsAreaSf += from.openingsAreaSf;
    into.netSidingSf += from.netSidingSf;
}

bool computeJobTotals(
    const Job& job,
    const std::vector<Detection>& detections,
    JobTotals& out,
    const AggregationOptions& options) {
    JobTotals totals{};
    for (const auto& page : job.pages) {
        if (options.elevationPagesOnly && page.type() != PageType::Elevation) continue;
        if (!page.isCalibrated(options.uncalibratedScaleRatio)) continue;
        PageSummary summary{};
        summary.pageId = page.id();
        summary.scaleRatio = page.scaleRatio();
        if (!computePageTotals(page, detections, summary.totals, options)) continue;
        accumulateTotals(totals.combined, summary.totals);
        totals.includedPageIds.push_back(page.id());
        totals.pages.push_back(std::move(summary));
    }
    if (totals.includedPageIds.empty()) return false;
    out = std::move(totals);
    return true;
}

} // namespace takeoff
