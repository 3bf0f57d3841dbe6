#include "takeoff/session/edit_session.h"
#include "takeoff/core/logging.h"
#include "takeoff/core/util.h"
#include "takeoff/geometry/polygon.h"
#include "takeoff/measure/measurement.h"
#include <cmath>
#include <utility>

namespace takeoff {

const char* sessionStateName(SessionState state) noexcept {
    switch (state) {
        case SessionState::Clean: return "clean";
        case SessionState::Dirty: return "dirty";
        case SessionState::Validating: return "validating";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

namespace {

// Box-only geometry becomes its rectangle so vertices can be edited.
bool editableGeometry(const DetectionGeometry& geometry, DetectionGeometry& out) {
    if (geometry.kind() == GeometryKind::BoundingBoxOnly) {
        return DetectionGeometry::fromPolygon(rectToRing(geometry.bounds()), out);
    }
    out = geometry;
    return true;
}

MarkupType markupFor(const DetectionGeometry& geometry, MarkupType fallback) {
    switch (geometry.kind()) {
        case GeometryKind::Polyline: return MarkupType::Line;
        case GeometryKind::Point: return MarkupType::Point;
        case GeometryKind::Polygon:
        case GeometryKind::PolygonWithHoles: return MarkupType::Polygon;
        case GeometryKind::BoundingBoxOnly: break;
    }
    return fallback;
}

bool hasUsableGeometry(const DetectionGeometry& geometry) {
    if (geometry.kind() != GeometryKind::BoundingBoxOnly) return true;
    const BoundingBox& box = geometry.bounds();
    return box.width > 0.0 && box.height > 0.0;
}

} // namespace

EditSession::EditSession(Job job, std::vector<Detection> detections, DraftStore* draftStore,
                         SessionOptions options)
    : job_(std::move(job)),
      store_(),
      draftStore_(draftStore),
      options_(std::move(options)),
      history_(store_, job_, options_.maxHistoryEntries) {
    for (auto& det : detections) {
        if (det.jobId.empty()) det.jobId = job_.id;
        refreshDerived(det, scaleForPage(det.pageId));
    }
    store_.assign(std::move(detections));

    committedDetections_ = store_.all();
    committedScales_ = capturePageScales();
    committedNextLocalId_ = nextLocalId_;
    committedDigest_ = digest();
    lastDraftWriteMs_ = now();

    loadRecoverableDraft();
}

double EditSession::now() const {
    return options_.clock ? options_.clock() : wallClockNowMs();
}

double EditSession::scaleForPage(const std::string& pageId) const {
    const Page* page = job_.findPage(pageId);
    return page ? page->scaleRatio() : 0.0;
}

std::string EditSession::allocateId() {
    std::string id;
    do {
        id = "local-" + std::to_string(nextLocalId_++);
    } while (store_.contains(id));
    return id;
}

std::vector<PageScaleRecord> EditSession::capturePageScales() const {
    std::vector<PageScaleRecord> scales;
    scales.reserve(job_.pages.size());
    for (const auto& page : job_.pages) {
        scales.push_back(PageScaleRecord{page.id(), page.scaleRatio()});
    }
    return scales;
}

void EditSession::applyPageScales(const std::vector<PageScaleRecord>& scales) {
    for (const auto& record : scales) {
        Page* page = job_.findPage(record.pageId);
        if (!page) {
            TAKEOFF_LOG_WARN("session: scale for unknown page %s ignored", record.pageId.c_str());
            continue;
        }
        if (!restoreScaleRatio(*page, record.scaleRatio)) {
            TAKEOFF_LOG_WARN("session: invalid scale %f for page %s", record.scaleRatio, record.pageId.c_str());
        }
    }
}

bool EditSession::hasUnsavedChanges() const {
    return digest() != committedDigest_;
}

std::vector<const Detection*> EditSession::visibleDetections(const std::string& pageId, double minConfidence) const {
    return store_.visible(pageId, minConfidence);
}

void EditSession::markEdited() {
    editGeneration_++;
    state_ = SessionState::Dirty;
}

void EditSession::settleStateAfterHistory() {
    if (digest() != committedDigest_) {
        state_ = SessionState::Dirty;
    } else {
        state_ = isCommitInFlight() ? SessionState::Validating : SessionState::Clean;
    }
}

// ---- mutations ---------------------------------------------------------------

bool EditSession::mutateDetection(const std::string& id, EditKind kind,
                                  const std::function<bool(Detection&)>& edit,
                                  std::optional<DetectionStatus> status) {
    const Detection* current = store_.find(id);
    if (!current) return false;
    if (current->isDeleted() && kind != EditKind::Restore) return false;

    Detection updated = *current;
    if (!edit(updated)) return false;
    if (status) updated.status = *status;
    updated.editedAtMs = now();
    refreshDerived(updated, scaleForPage(updated.pageId));

    if (!history_.beginEntry(nextLocalId_, kind)) {
        TAKEOFF_LOG_WARN("session: %s rejected, transaction already open", editKindName(kind));
        return false;
    }
    history_.markDetectionChange(id);
    store_.upsert(updated);
    if (!history_.commitEntry(nextLocalId_)) {
        TAKEOFF_LOG_DEBUG("session: %s on %s recorded no change", editKindName(kind), id.c_str());
        return true;
    }
    markEdited();
    return true;
}

bool EditSession::mutateGeometry(const std::string& id, EditKind kind,
                                 const std::function<bool(const DetectionGeometry&, DetectionGeometry&)>& edit) {
    return mutateDetection(id, kind, [&](Detection& det) {
        DetectionGeometry next;
        if (!edit(det.geometry, next)) return false;
        if ((kind == EditKind::Move || kind == EditKind::Resize) && !det.originalBounds) {
            det.originalBounds = det.geometry.bounds();
        }
        det.geometry = std::move(next);
        det.markupType = markupFor(det.geometry, det.markupType);
        return true;
    }, DetectionStatus::Edited);
}

bool EditSession::moveDetection(const std::string& id, double dx, double dy) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) return false;
    return mutateGeometry(id, EditKind::Move, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        return g.translated(dx, dy, out);
    });
}

bool EditSession::resizeDetection(const std::string& id, const BoundingBox& bounds) {
    return mutateGeometry(id, EditKind::Resize, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        return g.resized(bounds, out);
    });
}

bool EditSession::moveVertex(const std::string& id, std::size_t ring, std::size_t vertex, Point2 p) {
    return mutateGeometry(id, EditKind::VertexMove, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        DetectionGeometry base;
        return editableGeometry(g, base) && base.withVertexMoved(ring, vertex, p, out);
    });
}

bool EditSession::insertVertex(const std::string& id, std::size_t ring, std::size_t afterVertex, Point2 p) {
    return mutateGeometry(id, EditKind::VertexInsert, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        DetectionGeometry base;
        return editableGeometry(g, base) && base.withVertexInserted(ring, afterVertex, p, out);
    });
}

bool EditSession::insertVertexNear(const std::string& id, Point2 p) {
    return mutateGeometry(id, EditKind::VertexInsert, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        if (!g.isArea()) return false;
        DetectionGeometry base;
        if (!editableGeometry(g, base)) return false;
        ClosestEdge edge{};
        if (!findClosestEdge(base.outer(), p, edge)) return false;
        return base.withVertexInserted(0, edge.index, edge.point, out);
    });
}

bool EditSession::removeVertex(const std::string& id, std::size_t ring, std::size_t vertex) {
    return mutateGeometry(id, EditKind::VertexRemove, [&](const DetectionGeometry& g, DetectionGeometry& out) {
        DetectionGeometry base;
        return editableGeometry(g, base) && base.withVertexRemoved(ring, vertex, out);
    });
}

bool EditSession::replaceGeometry(const std::string& id, const DetectionGeometry& geometry) {
    if (!hasUsableGeometry(geometry)) return false;
    return mutateGeometry(id, EditKind::ReplaceGeometry, [&](const DetectionGeometry&, DetectionGeometry& out) {
        out = geometry;
        return true;
    });
}

bool EditSession::reclassify(const std::string& id, DetectionClass cls) {
    return mutateDetection(id, EditKind::Reclassify, [&](Detection& det) {
        det.detectionClass = cls;
        return true;
    }, DetectionStatus::Edited);
}

bool EditSession::verify(const std::string& id) {
    return mutateDetection(id, EditKind::Verify, [](Detection&) { return true; }, DetectionStatus::Verified);
}

bool EditSession::deleteDetection(const std::string& id) {
    return mutateDetection(id, EditKind::Delete, [](Detection&) { return true; }, DetectionStatus::Deleted);
}

bool EditSession::restoreDetection(const std::string& id) {
    return mutateDetection(id, EditKind::Restore, [](Detection& det) {
        return det.isDeleted();
    }, DetectionStatus::Edited);
}

bool EditSession::createDetection(Detection detection, std::string* newId) {
    if (!job_.findPage(detection.pageId)) return false;
    if (!hasUsableGeometry(detection.geometry)) return false;

    if (!history_.beginEntry(nextLocalId_, EditKind::Create)) return false;
    const double timestamp = now();
    detection.id = allocateId();
    detection.jobId = job_.id;
    detection.status = DetectionStatus::Edited;
    detection.confidence = 1.0;
    detection.createdAtMs = timestamp;
    detection.editedAtMs = timestamp;
    detection.markupType = markupFor(detection.geometry, detection.markupType);
    refreshDerived(detection, scaleForPage(detection.pageId));

    history_.markDetectionChange(detection.id);
    store_.upsert(detection);
    if (!history_.commitEntry(nextLocalId_)) {
        TAKEOFF_LOG_WARN("session: create of %s recorded no change", detection.id.c_str());
    }
    markEdited();
    if (newId) *newId = detection.id;
    return true;
}

SplitResult EditSession::splitDetection(const std::string& id, const Ring& cut, std::vector<std::string>* newIds) {
    const Detection* original = store_.find(id);
    if (!original || original->isDeleted()) {
        SplitResult missing{};
        missing.status = SplitStatus::NotFound;
        return missing;
    }

    SplitResult result = takeoff::splitDetection(*original, cut, scaleForPage(original->pageId), now());
    if (result.status != SplitStatus::Split) {
        TAKEOFF_LOG_DEBUG("session: split of %s: %s", id.c_str(), splitStatusName(result.status));
        return result;
    }

    if (!history_.beginEntry(nextLocalId_, EditKind::Split)) {
        result.status = SplitStatus::NotFound;
        return result;
    }
    history_.markDetectionChange(id);
    store_.upsert(result.retired);
    for (auto& piece : result.pieces) {
        piece.id = allocateId();
        piece.jobId = job_.id;
        history_.markDetectionChange(piece.id);
        store_.upsert(piece);
        if (newIds) newIds->push_back(piece.id);
    }
    if (!history_.commitEntry(nextLocalId_)) {
        TAKEOFF_LOG_WARN("session: split of %s recorded no change", id.c_str());
    }
    markEdited();
    return result;
}

bool EditSession::setNotes(const std::string& id, const std::string& notes) {
    return mutateDetection(id, EditKind::Properties, [&](Detection& det) {
        det.notes = notes;
        return true;
    }, std::nullopt);
}

bool EditSession::setMaterial(const std::string& id, const std::string& materialId) {
    return mutateDetection(id, EditKind::Properties, [&](Detection& det) {
        det.materialId = materialId;
        return true;
    }, std::nullopt);
}

bool EditSession::setCostOverrides(const std::string& id, std::optional<double> materialCost,
                                   std::optional<double> laborCost) {
    if (materialCost && (!std::isfinite(*materialCost) || *materialCost < 0.0)) return false;
    if (laborCost && (!std::isfinite(*laborCost) || *laborCost < 0.0)) return false;
    return mutateDetection(id, EditKind::Properties, [&](Detection& det) {
        det.materialCostOverride = materialCost;
        det.laborCostOverride = laborCost;
        return true;
    }, std::nullopt);
}

bool EditSession::setColorOverride(const std::string& id, std::optional<std::uint32_t> rgba) {
    return mutateDetection(id, EditKind::Properties, [&](Detection& det) {
        det.colorOverrideRGBA = rgba;
        return true;
    }, std::nullopt);
}

bool EditSession::calibratePage(const std::string& pageId, const CalibrationResult& calibration) {
    Page* page = job_.findPage(pageId);
    if (!page) return false;
    if (!std::isfinite(calibration.pixelsPerFoot) || calibration.pixelsPerFoot <= 0.0) return false;

    std::vector<std::string> affected;
    for (const auto& det : store_.all()) {
        if (det.pageId == pageId) affected.push_back(det.id);
    }

    if (!history_.beginEntry(nextLocalId_, EditKind::Calibrate)) return false;
    history_.markScaleChange(pageId);
    for (const auto& id : affected) history_.markDetectionChange(id);

    if (!applyCalibration(*page, calibration)) {
        history_.discardEntry();
        return false;
    }
    const double scale = page->scaleRatio();
    for (const auto& id : affected) {
        const Detection* current = store_.find(id);
        if (!current) continue;
        Detection updated = *current;
        refreshDerived(updated, scale);
        store_.upsert(updated);
    }
    if (!history_.commitEntry(nextLocalId_)) {
        TAKEOFF_LOG_DEBUG("session: page %s already at %f px/ft", pageId.c_str(), scale);
        return true;
    }
    TAKEOFF_LOG_DEBUG("session: page %s calibrated to %f px/ft", pageId.c_str(), scale);
    markEdited();
    return true;
}

// ---- history -------------------------------------------------------------------

bool EditSession::undo() {
    std::uint32_t nextId = nextLocalId_;
    if (!history_.undo(nextId)) return false;
    nextLocalId_ = nextId;
    editGeneration_++;
    settleStateAfterHistory();
    return true;
}

bool EditSession::redo() {
    std::uint32_t nextId = nextLocalId_;
    if (!history_.redo(nextId)) return false;
    nextLocalId_ = nextId;
    editGeneration_++;
    settleStateAfterHistory();
    return true;
}

// ---- aggregation ---------------------------------------------------------------

bool EditSession::pageTotals(const std::string& pageId, PageTotals& out) const {
    const Page* page = job_.findPage(pageId);
    if (!page) return false;
    return computePageTotals(*page, store_.all(), out, options_.aggregation);
}

bool EditSession::jobTotals(JobTotals& out) const {
    return computeJobTotals(job_, store_.all(), out, options_.aggregation);
}

} // namespace takeoff
