#include "takeoff_test_common.h"

#include "takeoff/measure/corner_inference.h"

using namespace takeoff;
using namespace takeoff_test;

namespace {

std::vector<const Detection*> pointers(const std::vector<Detection>& detections) {
    std::vector<const Detection*> out;
    for (const auto& det : detections) out.push_back(&det);
    return out;
}

} // namespace

TEST(CornerInferenceTest, TwoWallsWithGap) {
    const std::vector<Detection> walls{
        boxDetection("left", "p1", DetectionClass::Siding, 100, 200, 100, 200),
        boxDetection("right", "p1", DetectionClass::Siding, 300, 200, 100, 200),
    };
    const CornerSummary summary = inferCorners(pointers(walls), 20.0);
    EXPECT_EQ(summary.outsideCount, 2u);
    EXPECT_EQ(summary.insideCount, 2u);
    EXPECT_NEAR(summary.outsideLf, 20.0, 1e-12);
    EXPECT_NEAR(summary.insideLf, 20.0, 1e-12);
    ASSERT_EQ(summary.corners.size(), 4u);
    EXPECT_EQ(summary.corners[0].wallId, "left");
    EXPECT_EQ(summary.corners[0].side, WallSide::Left);
    EXPECT_EQ(summary.corners[1].wallId, "right");
    EXPECT_EQ(summary.corners[1].side, WallSide::Right);
}

TEST(CornerInferenceTest, AbuttingWallsAddNoInsideCorners) {
    const std::vector<Detection> walls{
        boxDetection("a", "p1", DetectionClass::Siding, 100, 200, 100, 200),
        boxDetection("b", "p1", DetectionClass::Siding, 205, 200, 100, 200),
    };
    const CornerSummary summary = inferCorners(pointers(walls), 20.0);
    EXPECT_EQ(summary.outsideCount, 2u);
    EXPECT_EQ(summary.insideCount, 0u);
}

TEST(CornerInferenceTest, SeparateRowsEachGetOutsideCorners) {
    const std::vector<Detection> walls{
        boxDetection("upper", "p1", DetectionClass::Siding, 100, 100, 100, 100),
        boxDetection("lower", "p1", DetectionClass::Building, 100, 400, 100, 100),
    };
    const CornerSummary summary = inferCorners(pointers(walls), 10.0);
    EXPECT_EQ(summary.outsideCount, 4u);
    EXPECT_EQ(summary.insideCount, 0u);
    EXPECT_NEAR(summary.outsideLf, 40.0, 1e-12);
}

TEST(CornerInferenceTest, IgnoresNonFacadeAndDeleted) {
    std::vector<Detection> walls{
        boxDetection("wall", "p1", DetectionClass::Siding, 100, 200, 100, 200),
        boxDetection("window", "p1", DetectionClass::Window, 400, 200, 50, 50),
        boxDetection("gone", "p1", DetectionClass::Siding, 600, 200, 100, 200),
    };
    walls[2].status = DetectionStatus::Deleted;
    const CornerSummary summary = inferCorners(pointers(walls), 20.0);
    EXPECT_EQ(summary.outsideCount, 2u);
    EXPECT_EQ(summary.insideCount, 0u);
    EXPECT_TRUE(inferCorners({}, 20.0).corners.empty());
}

TEST(CornerInferenceTest, EdgeHeightOfSlopedWall) {
    // Left side runs 100..400, right side 0..400.
    const Ring outline{{0, 100}, {300, 0}, {300, 400}, {0, 400}};
    EXPECT_NEAR(wallEdgeHeightPx(outline, WallSide::Left, 1.0), 300.0, 1e-12);
    EXPECT_NEAR(wallEdgeHeightPx(outline, WallSide::Right, 1.0), 400.0, 1e-12);
}
