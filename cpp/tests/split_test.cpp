#include "takeoff_test_common.h"

#include "takeoff/edit/split_operator.h"

#include <cmath>
#include <random>

using namespace takeoff;
using namespace takeoff_test;

namespace {

constexpr double kNow = 1.7e12;

Detection makeTarget() {
    Detection det = boxDetection("abcdef123456", "p1", DetectionClass::Siding, 50, 50, 100, 100);
    det.materialId = "lap-siding";
    det.colorOverrideRGBA = 0xFF0000FFu;
    return det;
}

Detection holedTarget() {
    Detection det = baseDetection("holed-1", "p1", DetectionClass::Siding);
    DetectionGeometry geometry;
    EXPECT_TRUE(DetectionGeometry::fromPolygonWithHoles(rect(0, 0, 200, 200), {rect(60, 60, 140, 140)}, geometry));
    det.geometry = geometry;
    return det;
}

bool selfCrossing(const Ring& ring) {
    PolygonWithHoles poly;
    poly.outer = ring;
    return std::abs(filledArea(poly) - ringArea(ring)) > 1e-6;
}

double piecesArea(const SplitResult& result) {
    double sum = 0.0;
    for (const auto& piece : result.pieces) sum += polygonArea(piece.geometry.asPolygon());
    return sum;
}

} // namespace

TEST(SplitTest, InteriorCutCarvesHole) {
    const Detection target = makeTarget();
    const SplitResult result = splitDetection(target, rect(25, 25, 75, 75), 10.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    ASSERT_EQ(result.pieces.size(), 2u);
    EXPECT_EQ(result.carvedCount, 1u);

    const Detection& carved = result.pieces[0];
    EXPECT_EQ(carved.notes, "Carved from abcdef12");
    EXPECT_NEAR(carved.measurements.areaSf, 25.0, 1e-9);

    const Detection& remaining = result.pieces[1];
    EXPECT_EQ(remaining.notes, "Remaining from abcdef12 (with hole)");
    EXPECT_EQ(remaining.geometry.kind(), GeometryKind::PolygonWithHoles);
    EXPECT_NEAR(remaining.measurements.areaSf, 75.0, 1e-9);

    EXPECT_NEAR(piecesArea(result), 10000.0, 10000.0 * kSplitAreaTolerance);
    EXPECT_EQ(result.retired.status, DetectionStatus::Deleted);
    EXPECT_EQ(result.retired.id, target.id);
}

TEST(SplitTest, PiecesInheritFromOriginal) {
    const Detection target = makeTarget();
    const SplitResult result = splitDetection(target, rect(-10, -10, 50, 110), 10.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    ASSERT_EQ(result.pieces.size(), 2u);
    for (const auto& piece : result.pieces) {
        EXPECT_TRUE(piece.id.empty());
        EXPECT_EQ(piece.pageId, "p1");
        EXPECT_EQ(piece.detectionClass, DetectionClass::Siding);
        EXPECT_EQ(piece.status, DetectionStatus::Edited);
        EXPECT_EQ(piece.confidence, 1.0);
        EXPECT_EQ(piece.markupType, MarkupType::Polygon);
        EXPECT_EQ(piece.materialId, "lap-siding");
        EXPECT_EQ(piece.colorOverrideRGBA, target.colorOverrideRGBA);
        EXPECT_EQ(piece.sourceDetectionId, target.id);
        EXPECT_EQ(piece.createdAtMs, kNow);
    }
    EXPECT_EQ(result.pieces[1].notes, "Remaining from abcdef12");
    EXPECT_NEAR(result.pieces[0].measurements.areaSf, 50.0, 1e-9);
    EXPECT_NEAR(result.pieces[1].measurements.areaSf, 50.0, 1e-9);
}

TEST(SplitTest, BarCutLeavesTwoRemainingPieces) {
    const SplitResult result = splitDetection(makeTarget(), rect(40, -10, 60, 110), 10.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    EXPECT_EQ(result.carvedCount, 1u);
    ASSERT_EQ(result.pieces.size(), 3u);
    EXPECT_NEAR(polygonArea(result.pieces[0].geometry.asPolygon()), 2000.0, 1e-9);
    EXPECT_NEAR(polygonArea(result.pieces[1].geometry.asPolygon()), 4000.0, 1e-9);
    EXPECT_NEAR(polygonArea(result.pieces[2].geometry.asPolygon()), 4000.0, 1e-9);
    EXPECT_NEAR(result.piecesAreaPx, result.originalAreaPx, result.originalAreaPx * kSplitAreaTolerance);
}

TEST(SplitTest, AreaConservedForIrregularCut) {
    Detection target = polygonDetection("poly-1", "p1", DetectionClass::Siding,
                                        Ring{{0, 0}, {200, 0}, {200, 120}, {100, 180}, {0, 120}});
    const Ring cut{{50, -30}, {260, 60}, {150, 250}, {30, 90}};
    const SplitResult result = splitDetection(target, cut, 24.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    const double original = polygonArea(target.geometry.asPolygon());
    EXPECT_NEAR(piecesArea(result), original, original * 1e-6);
}

TEST(SplitTest, DisjointCutIsNothingToSplit) {
    const SplitResult result = splitDetection(makeTarget(), rect(500, 500, 600, 600), 10.0, kNow);
    EXPECT_EQ(result.status, SplitStatus::NothingToSplit);
    EXPECT_TRUE(result.pieces.empty());
}

TEST(SplitTest, RejectsInvalidInput) {
    EXPECT_EQ(splitDetection(makeTarget(), Ring{{0, 0}, {10, 10}}, 10.0, kNow).status, SplitStatus::InvalidCut);
    EXPECT_FALSE(isValidCut(Ring{{0, 0}, {10, 0}, {20, 0}}));

    const Detection line = lineDetection("l1", "p1", DetectionClass::Gutter, {{0, 0}, {100, 0}});
    EXPECT_EQ(splitDetection(line, rect(0, -5, 50, 5), 10.0, kNow).status, SplitStatus::UnsupportedTarget);
}

TEST(SplitTest, SelfCrossingCutIsAccepted) {
    // Bow tie whose lobes cross at the center of the target.
    const Ring bowTie{{-10, -10}, {110, 110}, {110, -10}, {-10, 110}};
    EXPECT_NEAR(signedArea(bowTie), 0.0, 1e-9);
    EXPECT_TRUE(isValidCut(bowTie));

    Detection target = boxDetection("abcdef123456", "p1", DetectionClass::Siding, 50, 50, 100, 100);
    const SplitResult result = splitDetection(target, bowTie, 10.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    EXPECT_GE(result.carvedCount, 1u);
    EXPECT_GT(result.pieces.size(), result.carvedCount);
    EXPECT_NEAR(piecesArea(result), 10000.0, 10000.0 * kSplitAreaTolerance);
}

TEST(SplitTest, CutCoveringTargetCarvesItWhole) {
    const Detection target = makeTarget();
    const SplitResult result = splitDetection(target, rect(-50, -50, 500, 500), 10.0, kNow);
    ASSERT_EQ(result.status, SplitStatus::Split);
    ASSERT_EQ(result.pieces.size(), 1u);
    EXPECT_EQ(result.carvedCount, 1u);
    EXPECT_NEAR(polygonArea(result.pieces[0].geometry.asPolygon()), 10000.0, 1e-9);
}

TEST(SplitTest, RandomCutsConserveArea) {
    const std::vector<Detection> targets = {
        polygonDetection("l-shape", "p1", DetectionClass::Siding,
                         Ring{{0, 0}, {200, 0}, {200, 80}, {80, 80}, {80, 200}, {0, 200}}),
        holedTarget(),
        makeTarget(),
    };

    std::mt19937 rng(20240611u);
    std::uniform_int_distribution<int> coord(-40, 240);
    std::size_t splits = 0;
    std::size_t crossingSplits = 0;
    for (const Detection& target : targets) {
        const double original = polygonArea(target.geometry.asPolygon());
        for (int i = 0; i < 400; ++i) {
            Ring cut;
            const int n = 3 + (i % 4);
            for (int k = 0; k < n; ++k) cut.push_back(Point2{double(coord(rng)), double(coord(rng))});

            const SplitResult result = splitDetection(target, cut, 24.0, kNow);
            ASSERT_NE(result.status, SplitStatus::AreaMismatch) << target.id << " cut #" << i;
            if (result.status != SplitStatus::Split) continue;
            ++splits;
            if (selfCrossing(cut)) ++crossingSplits;
            EXPECT_NEAR(piecesArea(result), original, original * kSplitAreaTolerance) << target.id << " cut #" << i;
            for (const auto& piece : result.pieces) {
                EXPECT_GT(piece.measurements.areaSf, 0.0);
            }
        }
    }
    EXPECT_GT(splits, 0u);
    EXPECT_GT(crossingSplits, 0u);
}
