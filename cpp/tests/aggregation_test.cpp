#include "takeoff_test_common.h"

#include "takeoff/measure/aggregation.h"

using namespace takeoff;
using namespace takeoff_test;

namespace {

std::vector<Detection> elevationSet(const std::string& pageId) {
    std::vector<Detection> dets;
    dets.push_back(boxDetection(pageId + "-wall", pageId, DetectionClass::Siding, 400, 400, 640, 640));
    dets.push_back(boxDetection(pageId + "-win", pageId, DetectionClass::Window, 300, 300, 64, 128));
    dets.push_back(boxDetection(pageId + "-door", pageId, DetectionClass::Door, 500, 600, 64, 128));
    dets.push_back(lineDetection(pageId + "-gutter", pageId, DetectionClass::Gutter, {{80, 80}, {720, 80}}));
    dets.push_back(pointDetection(pageId + "-ds1", pageId, DetectionClass::Downspout, Point2{90, 400}));
    dets.push_back(pointDetection(pageId + "-ds2", pageId, DetectionClass::Downspout, Point2{710, 400}));
    Detection deleted = boxDetection(pageId + "-old", pageId, DetectionClass::Window, 200, 200, 64, 64);
    deleted.status = DetectionStatus::Deleted;
    dets.push_back(deleted);
    return dets;
}

} // namespace

TEST(AggregationTest, PageTotalsByCategory) {
    const Page page = makePage("p1", 64.0);
    PageTotals totals{};
    ASSERT_TRUE(computePageTotals(page, elevationSet("p1"), totals));

    EXPECT_EQ(totals.facade.count, 1u);
    EXPECT_NEAR(totals.facade.areaSf, 100.0, 1e-9);
    EXPECT_NEAR(totals.facade.levelStarterLf, 10.0, 1e-9);
    EXPECT_EQ(totals.windows.count, 1u);
    EXPECT_NEAR(totals.windows.sillLf, 1.0, 1e-9);
    EXPECT_EQ(totals.doors.count, 1u);
    EXPECT_NEAR(totals.doors.jambLf, 4.0, 1e-9);
    EXPECT_NEAR(totals.openingsAreaSf, 4.0, 1e-9);
    EXPECT_NEAR(totals.netSidingSf, 96.0, 1e-9);

    EXPECT_EQ(totals.gutters.count, 1u);
    EXPECT_NEAR(totals.gutters.lf, 10.0, 1e-9);
    EXPECT_EQ(totals.downspoutCount, 2u);
    EXPECT_EQ(totals.totalPointCount, 2u);
    EXPECT_EQ(totals.pointCounts.at(DetectionClass::Downspout), 2u);

    EXPECT_EQ(totals.inferredOutsideCorners, 2u);
    EXPECT_EQ(totals.outsideCorners.count, 2u);
    EXPECT_NEAR(totals.outsideCorners.lf, 20.0, 1e-9);
    EXPECT_EQ(totals.byClass.at(DetectionClass::Window).count, 1u);
}

TEST(AggregationTest, NetSidingClampedAtZero) {
    const Page page = makePage("p1", 64.0);
    const std::vector<Detection> dets{
        boxDetection("wall", "p1", DetectionClass::Siding, 100, 100, 64, 64),
        boxDetection("garage", "p1", DetectionClass::Garage, 100, 100, 128, 128),
    };
    PageTotals totals{};
    ASSERT_TRUE(computePageTotals(page, dets, totals));
    EXPECT_NEAR(totals.openingsAreaSf, 4.0, 1e-9);
    EXPECT_EQ(totals.netSidingSf, 0.0);
}

TEST(AggregationTest, CornerInferenceCanBeDisabled) {
    AggregationOptions options{};
    options.inferCorners = false;
    PageTotals totals{};
    ASSERT_TRUE(computePageTotals(makePage("p1", 64.0), elevationSet("p1"), totals, options));
    EXPECT_EQ(totals.outsideCorners.count, 0u);
    EXPECT_EQ(totals.inferredOutsideCorners, 0u);
}

TEST(AggregationTest, JobTotalsSkipUncalibratedAndNonElevationPages) {
    const Job job = makeJob({
        makePage("p1", 64.0),
        makePage("p2", kUncalibratedScaleRatio),
        makePage("p3", 64.0, PageType::FloorPlan),
        makePage("p4", 32.0),
    });
    std::vector<Detection> dets = elevationSet("p1");
    for (const auto& det : elevationSet("p2")) dets.push_back(det);
    for (const auto& det : elevationSet("p3")) dets.push_back(det);

    JobTotals totals{};
    ASSERT_TRUE(computeJobTotals(job, dets, totals));
    ASSERT_EQ(totals.includedPageIds.size(), 2u);
    EXPECT_EQ(totals.includedPageIds[0], "p1");
    EXPECT_EQ(totals.includedPageIds[1], "p4");
    EXPECT_EQ(totals.combined.facade.count, 1u);
    EXPECT_NEAR(totals.combined.netSidingSf, 96.0, 1e-9);
    EXPECT_EQ(totals.combined.downspoutCount, 2u);
}

TEST(AggregationTest, NonElevationPagesIncludedWhenAllowed) {
    const Job job = makeJob({
        makePage("p1", 64.0),
        makePage("p3", 64.0, PageType::FloorPlan),
    });
    std::vector<Detection> dets = elevationSet("p1");
    for (const auto& det : elevationSet("p3")) dets.push_back(det);

    AggregationOptions options{};
    options.elevationPagesOnly = false;
    JobTotals totals{};
    ASSERT_TRUE(computeJobTotals(job, dets, totals, options));
    ASSERT_EQ(totals.includedPageIds.size(), 2u);
    EXPECT_EQ(totals.includedPageIds[1], "p3");
    EXPECT_EQ(totals.combined.facade.count, 2u);
}

TEST(AggregationTest, JobWithoutCalibratedElevationsHasNoTotals) {
    const Job job = makeJob({makePage("p1", kUncalibratedScaleRatio)});
    JobTotals totals{};
    EXPECT_FALSE(computeJobTotals(job, elevationSet("p1"), totals));
    EXPECT_TRUE(totals.includedPageIds.empty());
}

TEST(AggregationTest, AccumulateSumsPages) {
    PageTotals a{};
    ASSERT_TRUE(computePageTotals(makePage("p1", 64.0), elevationSet("p1"), a));
    PageTotals sum{};
    accumulateTotals(sum, a);
    accumulateTotals(sum, a);
    EXPECT_NEAR(sum.facade.areaSf, 200.0, 1e-9);
    EXPECT_EQ(sum.pointCounts.at(DetectionClass::Downspout), 4u);
    EXPECT_NEAR(sum.netSidingSf, 192.0, 1e-9);
}

TEST(AggregationTest, BoxDrawnCountClassAddsNoArea) {
    const Page page = makePage("p1", 64.0);
    const std::vector<Detection> dets{
        boxDetection("vent", "p1", DetectionClass::Vent, 100, 100, 64, 64),
    };
    PageTotals totals{};
    ASSERT_TRUE(computePageTotals(page, dets, totals));
    const ClassTotals& vents = totals.byClass.at(DetectionClass::Vent);
    EXPECT_EQ(vents.count, 1u);
    EXPECT_EQ(vents.areaSf, 0.0);
    EXPECT_EQ(vents.perimeterLf, 0.0);
}
