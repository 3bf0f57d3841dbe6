#include "takeoff/history/history_manager.h"
#include "takeoff/calibration/scale_calibration.h"
#include "takeoff/core/logging.h"
#include <algorithm>
#include <utility>

namespace takeoff {

const char* editKindName(EditKind kind) noexcept {
    switch (kind) {
        case EditKind::Move: return "Move";
        case EditKind::Resize: return "Resize";
        case EditKind::VertexMove: return "VertexMove";
        case EditKind::VertexInsert: return "VertexInsert";
        case EditKind::VertexRemove: return "VertexRemove";
        case EditKind::ReplaceGeometry: return "ReplaceGeometry";
        case EditKind::Reclassify: return "Reclassify";
        case EditKind::Verify: return "Verify";
        case EditKind::Delete: return "Delete";
        case EditKind::Restore: return "Restore";
        case EditKind::Create: return "Create";
        case EditKind::Split: return "Split";
        case EditKind::Properties: return "Properties";
        case EditKind::Calibrate: return "Calibrate";
        case EditKind::RestoreDraft: return "RestoreDraft";
    }
    return "Unknown";
}

HistoryManager::HistoryManager(DetectionStore& store, Job& job, std::size_t maxEntries)
    : store_(store), job_(job), maxEntries_(maxEntries == 0 ? 1 : maxEntries) {}

void HistoryManager::clear() {
    history_.clear();
    cursor_ = 0;
    transaction_.active = false;
    transaction_.entry = HistoryEntry{};
    transaction_.detectionIndex.clear();
}

bool HistoryManager::canUndo() const noexcept {
    return cursor_ > 0;
}

bool HistoryManager::canRedo() const noexcept {
    return cursor_ < history_.size();
}

const HistoryEntry* HistoryManager::peekUndo() const noexcept {
    if (cursor_ == 0) return nullptr;
    return &history_[cursor_ - 1];
}

bool HistoryManager::beginEntry(std::uint32_t nextId, EditKind kind) {
    if (suppressed_ || transaction_.active) return false;
    transaction_.active = true;
    transaction_.entry = HistoryEntry{};
    transaction_.entry.kind = kind;
    transaction_.entry.nextIdBefore = nextId;
    transaction_.entry.nextIdAfter = nextId;
    transaction_.detectionIndex.clear();
    return true;
}

void HistoryManager::discardEntry() {
    transaction_.active = false;
    transaction_.entry = HistoryEntry{};
    transaction_.detectionIndex.clear();
}

void HistoryManager::pushHistoryEntry(HistoryEntry&& entry) {
    if (suppressed_) return;
    if (cursor_ < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_), history_.end());
    }
    history_.push_back(std::move(entry));
    if (history_.size() > maxEntries_) {
        const std::size_t overflow = history_.size() - maxEntries_;
        history_.erase(history_.begin(), history_.begin() + static_cast<std::ptrdiff_t>(overflow));
        TAKEOFF_LOG_DEBUG("history: dropped %zu oldest entries", overflow);
    }
    cursor_ = history_.size();
}

void HistoryManager::markDetectionChange(const std::string& id) {
    if (!transaction_.active || suppressed_) return;
    auto& entry = transaction_.entry;
    auto [it, inserted] = transaction_.detectionIndex.emplace(id, entry.detections.size());
    if (!inserted) return;

    HistoryEntry::DetectionChange change{};
    change.id = id;
    change.existedBefore = captureDetection(id, change.before);
    change.existedAfter = false;
    entry.detections.push_back(std::move(change));
}

void HistoryManager::markScaleChange(const std::string& pageId) {
    if (!transaction_.active || suppressed_) return;
    auto& entry = transaction_.entry;
    for (const auto& change : entry.scales) {
        if (change.pageId == pageId) return;
    }
    const Page* page = job_.findPage(pageId);
    if (!page) return;
    entry.scales.push_back(PageScaleChange{pageId, page->scaleRatio(), page->scaleRatio()});
}

bool HistoryManager::captureDetection(const std::string& id, Detection& out) const {
    const Detection* det = store_.find(id);
    if (!det) return false;
    out = *det;
    return true;
}

void HistoryManager::finalizeHistoryEntry(HistoryEntry& entry, std::uint32_t nextId) {
    entry.nextIdAfter = nextId;
    for (auto& change : entry.detections) {
        change.existedAfter = captureDetection(change.id, change.after);
    }
    for (auto& change : entry.scales) {
        const Page* page = job_.findPage(change.pageId);
        if (page) change.after = page->scaleRatio();
    }
}

bool HistoryManager::commitEntry(std::uint32_t nextId) {
    if (!transaction_.active) return false;
    HistoryEntry entry = std::move(transaction_.entry);
    transaction_.active = false;
    transaction_.detectionIndex.clear();

    finalizeHistoryEntry(entry, nextId);

    entry.detections.erase(
        std::remove_if(entry.detections.begin(), entry.detections.end(), [](const HistoryEntry::DetectionChange& c) {
            if (c.existedBefore != c.existedAfter) return false;
            return !c.existedBefore || c.before == c.after;
        }),
        entry.detections.end());
    entry.scales.erase(
        std::remove_if(entry.scales.begin(), entry.scales.end(), [](const PageScaleChange& c) {
            return c.before == c.after;
        }),
        entry.scales.end());

    if (entry.detections.empty() && entry.scales.empty()) {
        return false;
    }

    pushHistoryEntry(std::move(entry));
    return true;
}

bool HistoryManager::undo(std::uint32_t& nextId) {
    if (cursor_ == 0) return false;
    cursor_--;
    const auto& entry = history_[cursor_];
    applyHistoryEntry(entry, false);
    nextId = entry.nextIdBefore;
    return true;
}

bool HistoryManager::redo(std::uint32_t& nextId) {
    if (cursor_ >= history_.size()) return false;
    const auto& entry = history_[cursor_];
    cursor_++;
    applyHistoryEntry(entry, true);
    nextId = entry.nextIdAfter;
    return true;
}

void HistoryManager::applyHistoryEntry(const HistoryEntry& entry, bool useAfter) {
    bool wasSuppressed = suppressed_;
    suppressed_ = true;

    for (const auto& change : entry.scales) {
        Page* page = job_.findPage(change.pageId);
        if (!page) continue;
        restoreScaleRatio(*page, useAfter ? change.after : change.before);
    }

    for (const auto& change : entry.detections) {
        const bool exists = useAfter ? change.existedAfter : change.existedBefore;
        if (!exists) {
            store_.erase(change.id);
            continue;
        }
        store_.upsert(useAfter ? change.after : change.before);
    }

    suppressed_ = wasSuppressed;
}

} // namespace takeoff
