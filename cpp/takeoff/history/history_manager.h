#pragma once

#include "takeoff/detection/detection_store.h"
#include "takeoff/detection/page.h"
#include "takeoff/history/history_types.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace takeoff {

// Transaction log of before/after detection snapshots and page scales.
//
// A mutation runs beginEntry, markDetectionChange / markScaleChange for everything it
// is about to touch, applies itself to the store, then commitEntry captures the after
// state. Undo re-applies the before snapshots, redo the after snapshots.
// Snapshots that come out unchanged are dropped; an entry left empty is not recorded.
class HistoryManager {
public:
    HistoryManager(DetectionStore& store, Job& job, std::size_t maxEntries);

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;

    // Return false when there is nothing to apply; `nextId` receives the restored id counter.
    bool undo(std::uint32_t& nextId);
    bool redo(std::uint32_t& nextId);

    // Transaction management
    bool beginEntry(std::uint32_t nextId, EditKind kind);
    void discardEntry();
    bool commitEntry(std::uint32_t nextId);

    // Change markers
    void markDetectionChange(const std::string& id);
    void markScaleChange(const std::string& pageId);

    // State management
    void clear();
    bool isTransactionActive() const { return transaction_.active; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    const HistoryEntry* peekUndo() const noexcept;

private:
    void pushHistoryEntry(HistoryEntry&& entry);
    bool captureDetection(const std::string& id, Detection& out) const;
    void finalizeHistoryEntry(HistoryEntry& entry, std::uint32_t nextId);
    void applyHistoryEntry(const HistoryEntry& entry, bool useAfter);

    DetectionStore& store_;
    Job& job_;
    std::size_t maxEntries_;

    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;
    bool suppressed_ = false;
    HistoryTransaction transaction_;
};

} // namespace takeoff
