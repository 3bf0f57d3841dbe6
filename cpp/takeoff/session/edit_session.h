#ifndef TAKEOFF_SESSION_EDIT_SESSION_H
#define TAKEOFF_SESSION_EDIT_SESSION_H

#include "takeoff/calibration/scale_calibration.h"
#include "takeoff/core/config.h"
#include "takeoff/detection/detection_store.h"
#include "takeoff/detection/page.h"
#include "takeoff/edit/split_operator.h"
#include "takeoff/history/history_manager.h"
#include "takeoff/measure/aggregation.h"
#include "takeoff/persistence/draft_snapshot.h"
#include "takeoff/persistence/draft_store.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace takeoff {

enum class SessionState : std::uint8_t {
    Clean = 0,
    Dirty = 1,
    Validating = 2,
    Error = 3,
};

const char* sessionStateName(SessionState state) noexcept;

// Outcome reported by whoever persisted a commit.
struct CommitResult {
    bool transportOk = true;
    std::string message;
    // Detections the backend refused; any entry fails the whole commit.
    std::vector<std::string> failedIds;

    bool ok() const noexcept { return transportOk && failedIds.empty(); }
};

// Full detection set handed to the commit endpoint, deleted detections included.
struct CommitTicket {
    std::uint32_t sequence = 0;
    std::uint64_t editGeneration = 0;
    std::string jobId;
    std::vector<Detection> detections;
    std::vector<PageScaleRecord> pageScales;
};

enum class CommitStatus : std::uint8_t {
    // Baseline updated, history and draft cleared, session Clean.
    Committed = 0,
    // Baseline updated but edits made while validating are still pending.
    CommittedWithNewerEdits = 1,
    Failed = 2,
    // The ticket was superseded by a newer beginCommit; ignored.
    Stale = 3,
};

class CommitSink {
public:
    virtual ~CommitSink() = default;
    virtual CommitResult persist(const std::string& jobId, const std::vector<Detection>& detections) = 0;
};

// Local-first editing of one job's detections.
//
// Every mutation goes through the history transaction, refreshes derived
// measurements and moves the session to Dirty. Nothing leaves the process
// until a commit is completed; a rolling draft in the DraftStore covers crashes.
// Single writer: one session per job.
class EditSession {
public:
    EditSession(Job job, std::vector<Detection> detections, DraftStore* draftStore,
                SessionOptions options = SessionOptions{});

    EditSession(const EditSession&) = delete;
    EditSession& operator=(const EditSession&) = delete;

    // ---- state ---------------------------------------------------------------
    SessionState state() const noexcept { return state_; }
    bool hasUnsavedChanges() const;
    const std::string& lastError() const noexcept { return lastError_; }
    const std::vector<std::string>& lastFailedIds() const noexcept { return lastFailedIds_; }

    const Job& job() const noexcept { return job_; }
    const std::vector<Detection>& detections() const noexcept { return store_.all(); }
    const Detection* findDetection(const std::string& id) const noexcept { return store_.find(id); }
    std::vector<const Detection*> visibleDetections(const std::string& pageId, double minConfidence = 0.0) const;

    // Order-independent FNV digest of detections and page scales.
    std::uint64_t digest() const;

    // ---- mutations -------------------------------------------------------------
    // Return false (and change nothing) for unknown or deleted ids and degenerate results.
    bool moveDetection(const std::string& id, double dx, double dy);
    bool resizeDetection(const std::string& id, const BoundingBox& bounds);
    bool moveVertex(const std::string& id, std::size_t ring, std::size_t vertex, Point2 p);
    bool insertVertex(const std::string& id, std::size_t ring, std::size_t afterVertex, Point2 p);
    // Inserts on the outer-ring edge closest to `p`.
    bool insertVertexNear(const std::string& id, Point2 p);
    bool removeVertex(const std::string& id, std::size_t ring, std::size_t vertex);
    bool replaceGeometry(const std::string& id, const DetectionGeometry& geometry);
    bool reclassify(const std::string& id, DetectionClass cls);
    bool verify(const std::string& id);
    bool deleteDetection(const std::string& id);
    bool restoreDetection(const std::string& id);
    // Assigns a local id ("local-<n>"), status Edited and confidence 1.0.
    bool createDetection(Detection detection, std::string* newId = nullptr);
    SplitResult splitDetection(const std::string& id, const Ring& cut, std::vector<std::string>* newIds = nullptr);

    bool setNotes(const std::string& id, const std::string& notes);
    bool setMaterial(const std::string& id, const std::string& materialId);
    bool setCostOverrides(const std::string& id, std::optional<double> materialCost, std::optional<double> laborCost);
    bool setColorOverride(const std::string& id, std::optional<std::uint32_t> rgba);

    // Writes the page scale and re-measures every detection on the page in one undoable entry.
    bool calibratePage(const std::string& pageId, const CalibrationResult& calibration);

    // ---- history ---------------------------------------------------------------
    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    bool undo();
    bool redo();
    std::size_t historySize() const noexcept { return history_.getHistorySize(); }

    // ---- aggregation -----------------------------------------------------------
    bool pageTotals(const std::string& pageId, PageTotals& out) const;
    bool jobTotals(JobTotals& out) const;

    // ---- commit ----------------------------------------------------------------
    CommitTicket beginCommit();
    CommitStatus completeCommit(const CommitTicket& ticket, const CommitResult& result);
    // beginCommit, sink.persist, completeCommit.
    CommitStatus commit(CommitSink& sink);
    bool isCommitInFlight() const noexcept { return inFlightSequence_ != 0; }

    // Back to the last committed state; clears history and the draft.
    void reset();

    // ---- drafts ----------------------------------------------------------------
    bool saveDraft();
    // Saves when there are unsaved changes and the autosave interval elapsed since the last write.
    bool autosaveIfDue();
    bool hasRecoverableDraft() const noexcept { return pendingDraft_.has_value(); }
    double draftTimestamp() const noexcept { return pendingDraft_ ? pendingDraft_->timestampMs : 0.0; }
    // Applies the recoverable draft as one undoable entry. Only before any edit.
    bool restoreDraft();
    bool discardDraft();

private:
    double now() const;
    double scaleForPage(const std::string& pageId) const;
    std::string allocateId();
    std::vector<PageScaleRecord> capturePageScales() const;
    void applyPageScales(const std::vector<PageScaleRecord>& scales);
    std::uint64_t digestOf(const std::vector<Detection>& detections, const std::vector<PageScaleRecord>& scales) const;

    // Copies the detection, lets `edit` change it, then records the change. The
    // copy's status is set to `status` unless it is left empty.
    bool mutateDetection(const std::string& id, EditKind kind,
                         const std::function<bool(Detection&)>& edit,
                         std::optional<DetectionStatus> status);
    bool mutateGeometry(const std::string& id, EditKind kind,
                        const std::function<bool(const DetectionGeometry&, DetectionGeometry&)>& edit);
    void markEdited();
    void settleStateAfterHistory();
    void loadRecoverableDraft();
    void removeStoredDraft();

    Job job_;
    DetectionStore store_;
    DraftStore* draftStore_;
    SessionOptions options_;
    HistoryManager history_;

    SessionState state_ = SessionState::Clean;
    std::uint32_t nextLocalId_ = 1;
    std::uint64_t editGeneration_ = 0;

    std::vector<Detection> committedDetections_;
    std::vector<PageScaleRecord> committedScales_;
    std::uint32_t committedNextLocalId_ = 1;
    std::uint64_t committedDigest_ = 0;

    std::uint32_t commitSequence_ = 0;
    std::uint32_t inFlightSequence_ = 0;
    std::string lastError_;
    std::vector<std::string> lastFailedIds_;

    double lastDraftWriteMs_ = 0.0;
    std::optional<DraftData> pendingDraft_;
};

} // namespace takeoff

#endif // TAKEOFF_SESSION_EDIT_SESSION_H
