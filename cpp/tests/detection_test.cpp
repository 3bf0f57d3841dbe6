#include "takeoff_test_common.h"

#include "takeoff/detection/detection_class.h"
#include "takeoff/detection/detection_store.h"

using namespace takeoff;
using namespace takeoff_test;

TEST(DetectionClassTest, NormalizesAliases) {
    EXPECT_EQ(normalizeClass("window"), DetectionClass::Window);
    EXPECT_EQ(normalizeClass("  Garage Door "), DetectionClass::Garage);
    EXPECT_EQ(normalizeClass("exterior_wall"), DetectionClass::Siding);
    EXPECT_EQ(normalizeClass("Inside-Corner"), DetectionClass::CornerInside);
    EXPECT_EQ(normalizeClass("gutters"), DetectionClass::Gutter);
    EXPECT_EQ(normalizeClass("BELLY_BAND"), DetectionClass::BellyBand);
    EXPECT_EQ(normalizeClass("belly band"), DetectionClass::BellyBand);
    EXPECT_EQ(normalizeClass("hose bibb"), DetectionClass::HoseBib);
    EXPECT_EQ(normalizeClass("satellite dish"), DetectionClass::Unclassified);
    EXPECT_EQ(normalizeClass(""), DetectionClass::Unclassified);
}

TEST(DetectionClassTest, PolicyTable) {
    for (std::uint8_t i = 0; i < kDetectionClassCount; ++i) {
        const auto cls = static_cast<DetectionClass>(i);
        EXPECT_EQ(classPolicy(cls).cls, cls);
        DetectionClass parsed = DetectionClass::Unclassified;
        ASSERT_TRUE(parseClassKey(classKey(cls), parsed)) << classKey(cls);
        EXPECT_EQ(parsed, cls);
    }
    EXPECT_STREQ(classLabel(DetectionClass::BellyBand), "Belly Band");
    EXPECT_EQ(measurementKind(DetectionClass::Siding), MeasurementKind::Area);
    EXPECT_EQ(measurementKind(DetectionClass::Gutter), MeasurementKind::Linear);
    EXPECT_EQ(measurementKind(DetectionClass::Outlet), MeasurementKind::Count);
    EXPECT_TRUE(isFacadeClass(DetectionClass::Building));
    EXPECT_TRUE(isOpeningClass(DetectionClass::Garage));
    EXPECT_FALSE(isOpeningClass(DetectionClass::Shutter));

    DetectionClass out = DetectionClass::Window;
    EXPECT_FALSE(parseClassKey("not_a_class", out));
    EXPECT_EQ(out, DetectionClass::Window);
}

TEST(DetectionGeometryTest, FactoriesRejectDegenerateInput) {
    DetectionGeometry g;
    EXPECT_FALSE(DetectionGeometry::fromBoundingBox(BoundingBox{0, 0, 0, 10}, g));
    EXPECT_FALSE(DetectionGeometry::fromPolygon(Ring{{0, 0}, {1, 1}}, g));
    EXPECT_FALSE(DetectionGeometry::fromPolyline({{3, 3}, {3, 3}}, g));
    EXPECT_FALSE(DetectionGeometry::fromPolygonWithHoles(rect(0, 0, 10, 10), {rect(0, 0, 10, 10)}, g));

    ASSERT_TRUE(DetectionGeometry::fromPolygonWithHoles(rect(0, 0, 10, 10), {}, g));
    EXPECT_EQ(g.kind(), GeometryKind::Polygon);
    ASSERT_TRUE(DetectionGeometry::fromPolygonWithHoles(rect(0, 0, 10, 10), {rect(2, 2, 4, 4)}, g));
    EXPECT_EQ(g.kind(), GeometryKind::PolygonWithHoles);
    EXPECT_EQ(g.ringCount(), 2u);
    EXPECT_EQ(g.bounds(), (BoundingBox{5, 5, 10, 10}));
}

TEST(DetectionGeometryTest, EditsProduceNewGeometry) {
    DetectionGeometry poly;
    ASSERT_TRUE(DetectionGeometry::fromPolygon(rect(0, 0, 10, 10), poly));

    DetectionGeometry moved;
    ASSERT_TRUE(poly.translated(5, -5, moved));
    EXPECT_EQ(moved.bounds(), (BoundingBox{10, 0, 10, 10}));
    EXPECT_EQ(poly.bounds(), (BoundingBox{5, 5, 10, 10}));

    DetectionGeometry scaled;
    ASSERT_TRUE(poly.resized(BoundingBox{10, 10, 20, 20}, scaled));
    EXPECT_EQ(scaled.outer()[2], (Point2{20, 20}));

    DetectionGeometry inserted;
    ASSERT_TRUE(poly.withVertexInserted(0, 0, Point2{5, -2}, inserted));
    EXPECT_EQ(inserted.outer().size(), 5u);
    EXPECT_EQ(inserted.outer()[1], (Point2{5, -2}));

    DetectionGeometry removed;
    ASSERT_TRUE(inserted.withVertexRemoved(0, 1, removed));
    EXPECT_EQ(removed, poly);

    DetectionGeometry triangle;
    ASSERT_TRUE(DetectionGeometry::fromPolygon(Ring{{0, 0}, {10, 0}, {0, 10}}, triangle));
    EXPECT_FALSE(triangle.withVertexRemoved(0, 0, removed));

    // Collapsing a vertex onto its neighbour's line leaves zero area.
    EXPECT_FALSE(triangle.withVertexMoved(0, 2, Point2{5, 0}, removed));
}

TEST(DetectionStoreTest, UpsertKeepsSlotAndVisibleFilters) {
    DetectionStore store;
    store.upsert(boxDetection("a", "p1", DetectionClass::Window, 10, 10, 5, 5));
    store.upsert(boxDetection("b", "p1", DetectionClass::Door, 20, 20, 5, 5));
    store.upsert(boxDetection("c", "p2", DetectionClass::Door, 20, 20, 5, 5));
    ASSERT_EQ(store.size(), 3u);

    Detection replacement = boxDetection("a", "p1", DetectionClass::Garage, 10, 10, 5, 5);
    replacement.confidence = 0.4;
    store.upsert(replacement);
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(store.all()[0].detectionClass, DetectionClass::Garage);

    EXPECT_EQ(store.visible("p1").size(), 2u);
    EXPECT_EQ(store.visible("p1", kConfidenceLow).size(), 1u);

    Detection deleted = *store.find("b");
    deleted.status = DetectionStatus::Deleted;
    store.upsert(deleted);
    EXPECT_EQ(store.visible("p1").size(), 1u);

    EXPECT_TRUE(store.erase("a"));
    EXPECT_FALSE(store.erase("a"));
    EXPECT_EQ(store.find("a"), nullptr);
    ASSERT_NE(store.find("c"), nullptr);
    EXPECT_EQ(store.find("c")->pageId, "p2");
}
