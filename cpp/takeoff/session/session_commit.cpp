#include "takeoff/session/edit_session.h"
#include "takeoff/core/logging.h"
#include <utility>

namespace takeoff {

CommitTicket EditSession::beginCommit() {
    CommitTicket ticket{};
    ticket.sequence = ++commitSequence_;
    ticket.editGeneration = editGeneration_;
    ticket.jobId = job_.id;
    ticket.detections = store_.all();
    ticket.pageScales = capturePageScales();

    // A newer ticket supersedes any commit still awaiting its result.
    inFlightSequence_ = ticket.sequence;
    state_ = SessionState::Validating;
    TAKEOFF_LOG_DEBUG("commit #%u: %zu detections for job %s",
                      ticket.sequence, ticket.detections.size(), ticket.jobId.c_str());
    return ticket;
}

CommitStatus EditSession::completeCommit(const CommitTicket& ticket, const CommitResult& result) {
    if (ticket.sequence == 0 || ticket.sequence != inFlightSequence_) {
        TAKEOFF_LOG_DEBUG("commit #%u: stale result ignored", ticket.sequence);
        return CommitStatus::Stale;
    }
    inFlightSequence_ = 0;

    if (!result.ok()) {
        if (!result.message.empty()) {
            lastError_ = result.message;
        } else if (!result.transportOk) {
            lastError_ = "commit transport failed";
        } else {
            lastError_ = "commit rejected for " + std::to_string(result.failedIds.size()) + " detection(s)";
        }
        lastFailedIds_ = result.failedIds;
        state_ = SessionState::Error;
        TAKEOFF_LOG_WARN("commit #%u failed: %s", ticket.sequence, lastError_.c_str());
        return CommitStatus::Failed;
    }

    lastError_.clear();
    lastFailedIds_.clear();
    committedDetections_ = ticket.detections;
    committedScales_ = ticket.pageScales;
    committedDigest_ = digestOf(committedDetections_, committedScales_);

    if (ticket.editGeneration == editGeneration_) {
        committedNextLocalId_ = nextLocalId_;
        history_.clear();
        pendingDraft_.reset();
        removeStoredDraft();
        state_ = SessionState::Clean;
        return CommitStatus::Committed;
    }

    // Edits landed while the commit was validating; they stay pending.
    state_ = digest() == committedDigest_ ? SessionState::Clean : SessionState::Dirty;
    return CommitStatus::CommittedWithNewerEdits;
}

CommitStatus EditSession::commit(CommitSink& sink) {
    const CommitTicket ticket = beginCommit();
    const CommitResult result = sink.persist(ticket.jobId, ticket.detections);
    return completeCommit(ticket, result);
}

void EditSession::reset() {
    if (history_.isTransactionActive()) history_.discardEntry();
    store_.assign(committedDetections_);
    applyPageScales(committedScales_);
    nextLocalId_ = committedNextLocalId_;
    history_.clear();
    pendingDraft_.reset();
    removeStoredDraft();

    lastError_.clear();
    lastFailedIds_.clear();
    editGeneration_++;
    state_ = isCommitInFlight() ? SessionState::Validating : SessionState::Clean;
}

} // namespace takeoff
