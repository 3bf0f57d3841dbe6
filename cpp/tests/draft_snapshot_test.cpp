#include "takeoff_test_common.h"

#include "takeoff/persistence/draft_internal.h"
#include "takeoff/persistence/draft_snapshot.h"

#include <cstring>
#include <thread>

using namespace takeoff;
using namespace takeoff_test;

namespace {

DraftData sampleDraft() {
    DraftData data{};
    data.jobId = "job-1";
    data.timestampMs = 1.7e12;
    data.nextLocalId = 7;
    data.pageScales = {{"p1", 64.0}, {"p2", kUncalibratedScaleRatio}};

    Detection box = boxDetection("a", "p1", DetectionClass::Window, 100, 100, 64, 128);
    box.originalBounds = BoundingBox{90, 100, 64, 128};
    box.materialCostOverride = 12.5;
    box.colorOverrideRGBA = 0x11223344u;
    box.notes = "moved";
    box.status = DetectionStatus::Edited;
    data.detections.push_back(box);

    Detection holed = baseDetection("b", "p1", DetectionClass::Siding);
    EXPECT_TRUE(DetectionGeometry::fromPolygonWithHoles(rect(0, 0, 100, 100), {rect(25, 25, 75, 75)}, holed.geometry));
    holed.sourceDetectionId = "orig";
    holed.laborCostOverride = 3.0;
    holed.measurements.measured = true;
    holed.measurements.areaSf = 1.83;
    data.detections.push_back(holed);

    data.detections.push_back(lineDetection("c", "p2", DetectionClass::Gutter, {{0, 0}, {50, 0}, {50, 20}}));
    data.detections.push_back(pointDetection("d", "p2", DetectionClass::HoseBib, Point2{4, 5}));
    return data;
}

} // namespace

TEST(DraftSnapshotTest, RestoresEveryField) {
    const DraftData data = sampleDraft();
    const std::vector<std::uint8_t> bytes = buildDraftBytes(data);

    DraftData parsed{};
    ASSERT_EQ(parseDraft(bytes.data(), bytes.size(), parsed), EngineError::Ok);
    EXPECT_EQ(parsed.jobId, "job-1");
    EXPECT_EQ(parsed.timestampMs, data.timestampMs);
    EXPECT_EQ(parsed.nextLocalId, 7u);
    ASSERT_EQ(parsed.pageScales.size(), 2u);
    EXPECT_EQ(parsed.pageScales[1].scaleRatio, kUncalibratedScaleRatio);
    ASSERT_EQ(parsed.detections.size(), 4u);

    const Detection& a = parsed.detections[0];
    EXPECT_EQ(a.geometry, data.detections[0].geometry);
    ASSERT_TRUE(a.originalBounds.has_value());
    EXPECT_EQ(*a.originalBounds, (BoundingBox{90, 100, 64, 128}));
    EXPECT_EQ(a.materialCostOverride, std::optional<double>(12.5));
    EXPECT_FALSE(a.laborCostOverride.has_value());
    EXPECT_EQ(a.colorOverrideRGBA, std::optional<std::uint32_t>(0x11223344u));
    EXPECT_EQ(a.status, DetectionStatus::Edited);
    EXPECT_EQ(a.notes, "moved");

    const Detection& b = parsed.detections[1];
    EXPECT_EQ(b.geometry.kind(), GeometryKind::PolygonWithHoles);
    EXPECT_EQ(b.geometry, data.detections[1].geometry);
    EXPECT_EQ(b.sourceDetectionId, "orig");
    EXPECT_TRUE(b.measurements.measured);
    EXPECT_EQ(b.measurements.areaSf, 1.83);

    EXPECT_EQ(parsed.detections[2].geometry.kind(), GeometryKind::Polyline);
    EXPECT_EQ(parsed.detections[2].markupType, MarkupType::Line);
    EXPECT_EQ(parsed.detections[3].geometry.kind(), GeometryKind::Point);
    EXPECT_EQ(parsed.detections[3].detectionClass, DetectionClass::HoseBib);
}

TEST(DraftSnapshotTest, BuildIsDeterministic) {
    const DraftData data = sampleDraft();
    EXPECT_EQ(buildDraftBytes(data), buildDraftBytes(data));
}

TEST(DraftSnapshotTest, RejectsBadHeader) {
    std::vector<std::uint8_t> bytes = buildDraftBytes(sampleDraft());
    DraftData parsed{};

    EXPECT_EQ(parseDraft(bytes.data(), 8, parsed), EngineError::BufferTruncated);
    EXPECT_EQ(parseDraft(nullptr, 0, parsed), EngineError::BufferTruncated);

    std::vector<std::uint8_t> badMagic = bytes;
    badMagic[0] ^= 0xFF;
    EXPECT_EQ(parseDraft(badMagic.data(), badMagic.size(), parsed), EngineError::InvalidMagic);

    std::vector<std::uint8_t> badVersion = bytes;
    badVersion[4] = 99;
    EXPECT_EQ(parseDraft(badVersion.data(), badVersion.size(), parsed), EngineError::UnsupportedVersion);
}

TEST(DraftSnapshotTest, DetectsCorruptionAndTruncation) {
    const std::vector<std::uint8_t> bytes = buildDraftBytes(sampleDraft());
    DraftData parsed{};

    std::vector<std::uint8_t> flipped = bytes;
    flipped[flipped.size() - 3] ^= 0x5A;
    EXPECT_NE(parseDraft(flipped.data(), flipped.size(), parsed), EngineError::Ok);

    EXPECT_EQ(parseDraft(bytes.data(), bytes.size() - 10, parsed), EngineError::BufferTruncated);
}

TEST(DraftSnapshotTest, Crc32MatchesCheckValueAcrossThreads) {
    const char* check = "123456789";
    const auto* bytes = reinterpret_cast<const std::uint8_t*>(check);
    const std::size_t len = std::strlen(check);

    std::vector<std::uint32_t> results(4, 0);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < results.size(); ++i) {
        workers.emplace_back([&, i] { results[i] = draft::detail::crc32(bytes, len); });
    }
    for (auto& worker : workers) worker.join();

    for (std::uint32_t crc : results) EXPECT_EQ(crc, 0xCBF43926u);
}
