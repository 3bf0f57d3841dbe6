#include "takeoff/session/edit_session.h"
#include "takeoff/core/logging.h"
#include "takeoff/measure/measurement.h"
#include <algorithm>
#include <set>
#include <utility>

namespace takeoff {

bool EditSession::saveDraft() {
    if (!draftStore_) return false;

    DraftData data{};
    data.jobId = job_.id;
    data.timestampMs = now();
    data.nextLocalId = nextLocalId_;
    data.pageScales = capturePageScales();
    data.detections = store_.all();

    const EngineError err = draftStore_->save(job_.id, buildDraftBytes(data));
    if (err != EngineError::Ok) {
        TAKEOFF_LOG_WARN("draft: save for job %s failed: %s", job_.id.c_str(), engineErrorName(err));
        return false;
    }
    lastDraftWriteMs_ = data.timestampMs;
    return true;
}

bool EditSession::autosaveIfDue() {
    if (!draftStore_ || !hasUnsavedChanges()) return false;
    if (now() - lastDraftWriteMs_ < options_.autosaveIntervalMs) return false;
    return saveDraft();
}

void EditSession::removeStoredDraft() {
    if (!draftStore_ || !draftStore_->contains(job_.id)) return;
    const EngineError err = draftStore_->remove(job_.id);
    if (err != EngineError::Ok) {
        TAKEOFF_LOG_WARN("draft: remove for job %s failed: %s", job_.id.c_str(), engineErrorName(err));
    }
}

void EditSession::loadRecoverableDraft() {
    if (!draftStore_ || !draftStore_->contains(job_.id)) return;

    std::vector<std::uint8_t> bytes;
    EngineError err = draftStore_->load(job_.id, bytes);
    if (err != EngineError::Ok) {
        TAKEOFF_LOG_WARN("draft: load for job %s failed: %s", job_.id.c_str(), engineErrorName(err));
        return;
    }

    DraftData data{};
    err = parseDraft(bytes.data(), bytes.size(), data);
    if (err != EngineError::Ok) {
        TAKEOFF_LOG_WARN("draft: discarding unreadable draft for job %s: %s", job_.id.c_str(), engineErrorName(err));
        removeStoredDraft();
        return;
    }
    if (data.jobId != job_.id) {
        TAKEOFF_LOG_WARN("draft: discarding draft of job %s found under job %s", data.jobId.c_str(), job_.id.c_str());
        removeStoredDraft();
        return;
    }
    if (now() - data.timestampMs > options_.draftMaxAgeMs) {
        TAKEOFF_LOG_DEBUG("draft: discarding expired draft for job %s", job_.id.c_str());
        removeStoredDraft();
        return;
    }
    pendingDraft_ = std::move(data);
}

bool EditSession::restoreDraft() {
    if (!pendingDraft_) return false;
    if (history_.getHistorySize() != 0 || state_ != SessionState::Clean) return false;

    DraftData data = std::move(*pendingDraft_);
    pendingDraft_.reset();

    if (!history_.beginEntry(nextLocalId_, EditKind::RestoreDraft)) return false;
    for (const auto& record : data.pageScales) history_.markScaleChange(record.pageId);

    std::set<std::string> ids;
    for (const auto& det : store_.all()) ids.insert(det.id);
    for (const auto& det : data.detections) ids.insert(det.id);
    for (const auto& id : ids) history_.markDetectionChange(id);

    applyPageScales(data.pageScales);
    for (auto& det : data.detections) {
        det.jobId = job_.id;
        refreshDerived(det, scaleForPage(det.pageId));
    }
    store_.assign(std::move(data.detections));
    nextLocalId_ = std::max(nextLocalId_, data.nextLocalId);

    if (!history_.commitEntry(nextLocalId_)) {
        TAKEOFF_LOG_DEBUG("draft: restored draft matches the loaded state for job %s", job_.id.c_str());
        return true;
    }
    TAKEOFF_LOG_DEBUG("draft: restored %zu detections for job %s", store_.size(), job_.id.c_str());
    markEdited();
    lastDraftWriteMs_ = now();
    return true;
}

bool EditSession::discardDraft() {
    const bool stored = draftStore_ && draftStore_->contains(job_.id);
    if (!pendingDraft_ && !stored) return false;
    pendingDraft_.reset();
    removeStoredDraft();
    return true;
}

} // namespace takeoff
