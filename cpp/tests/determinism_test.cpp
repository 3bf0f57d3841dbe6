// The session digest is the identity used for undo/redo and dirty tracking:
// identical edit sequences must land on identical digests regardless of the
// order detections arrive in, and a recovered draft must reproduce the state it captured.

#include "takeoff_test_common.h"

#include "takeoff/session/edit_session.h"

#include <algorithm>

using namespace takeoff;
using namespace takeoff_test;

namespace {

Job detJob() {
    return makeJob({makePage("p1", 32.0), makePage("p2", kUncalibratedScaleRatio)});
}

std::vector<Detection> detSet() {
    return {
        boxDetection("a", "p1", DetectionClass::Siding, 500, 500, 600, 400),
        boxDetection("b", "p1", DetectionClass::Window, 400, 450, 60, 100),
        polygonDetection("c", "p1", DetectionClass::Gable, Ring{{200, 300}, {500, 100}, {800, 300}}),
        lineDetection("d", "p2", DetectionClass::Fascia, {{0, 0}, {250, 0}}),
        pointDetection("e", "p2", DetectionClass::LightFixture, Point2{40, 40}),
    };
}

void runScript(EditSession& session, FakeClock& clock) {
    auto tick = [&]() { clock.nowMs += 250.0; };
    ASSERT_TRUE(session.moveDetection("b", 12, -4));
    tick();
    ASSERT_TRUE(session.resizeDetection("a", BoundingBox{500, 500, 640, 420}));
    tick();
    ASSERT_TRUE(session.reclassify("c", DetectionClass::Soffit));
    tick();
    ASSERT_TRUE(session.createDetection(boxDetection("", "p1", DetectionClass::Shutter, 300, 450, 20, 100)));
    tick();
    ASSERT_EQ(session.splitDetection("a", rect(600, 350, 700, 450)).status, SplitStatus::Split);
    tick();
    CalibrationResult calibration{};
    ASSERT_TRUE(calibrateScale(600.0, 10.0, calibration));
    ASSERT_TRUE(session.calibratePage("p2", calibration));
    tick();
    ASSERT_TRUE(session.deleteDetection("e"));
}

} // namespace

TEST(DeterminismTest, SameScriptSameDigest) {
    FakeClock clock1;
    FakeClock clock2;
    MemoryDraftStore drafts1;
    MemoryDraftStore drafts2;
    SessionOptions opts1{};
    opts1.clock = clock1.fn();
    SessionOptions opts2{};
    opts2.clock = clock2.fn();

    std::vector<Detection> reversed = detSet();
    std::reverse(reversed.begin(), reversed.end());

    EditSession s1(detJob(), detSet(), &drafts1, opts1);
    EditSession s2(detJob(), reversed, &drafts2, opts2);
    EXPECT_EQ(s1.digest(), s2.digest());

    runScript(s1, clock1);
    runScript(s2, clock2);
    EXPECT_EQ(s1.digest(), s2.digest());

    JobTotals t1{};
    JobTotals t2{};
    ASSERT_TRUE(s1.jobTotals(t1));
    ASSERT_TRUE(s2.jobTotals(t2));
    EXPECT_EQ(t1.combined.facade.areaSf, t2.combined.facade.areaSf);
    EXPECT_EQ(t1.combined.netSidingSf, t2.combined.netSidingSf);
}

TEST(DeterminismTest, DigestChangesWithAnyEdit) {
    FakeClock clock;
    MemoryDraftStore drafts;
    SessionOptions opts{};
    opts.clock = clock.fn();
    EditSession session(detJob(), detSet(), &drafts, opts);

    const std::uint64_t initial = session.digest();
    ASSERT_TRUE(session.setNotes("b", "x"));
    const std::uint64_t withNotes = session.digest();
    EXPECT_NE(withNotes, initial);
    ASSERT_TRUE(session.setNotes("b", ""));
    EXPECT_NE(session.digest(), withNotes);
}

TEST(DeterminismTest, UndoAllReturnsToLoadedDigest) {
    FakeClock clock;
    MemoryDraftStore drafts;
    SessionOptions opts{};
    opts.clock = clock.fn();
    EditSession session(detJob(), detSet(), &drafts, opts);
    const std::uint64_t initial = session.digest();

    runScript(session, clock);
    const std::uint64_t edited = session.digest();
    while (session.undo()) {}
    EXPECT_EQ(session.digest(), initial);
    while (session.redo()) {}
    EXPECT_EQ(session.digest(), edited);
}

TEST(DeterminismTest, DraftRecoveryReproducesState) {
    FakeClock clock;
    MemoryDraftStore drafts;
    SessionOptions opts{};
    opts.clock = clock.fn();

    EditSession session(detJob(), detSet(), &drafts, opts);
    runScript(session, clock);
    ASSERT_TRUE(session.saveDraft());

    EditSession recovered(detJob(), detSet(), &drafts, opts);
    ASSERT_TRUE(recovered.hasRecoverableDraft());
    ASSERT_TRUE(recovered.restoreDraft());
    EXPECT_EQ(recovered.digest(), session.digest());
    EXPECT_DOUBLE_EQ(recovered.job().findPage("p2")->scaleRatio(), 60.0);
}
