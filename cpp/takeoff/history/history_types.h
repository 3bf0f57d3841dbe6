#pragma once

#include "takeoff/detection/detection.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace takeoff {

enum class EditKind : std::uint8_t {
    Move = 0,
    Resize = 1,
    VertexMove = 2,
    VertexInsert = 3,
    VertexRemove = 4,
    ReplaceGeometry = 5,
    Reclassify = 6,
    Verify = 7,
    Delete = 8,
    Restore = 9,
    Create = 10,
    Split = 11,
    Properties = 12,
    Calibrate = 13,
    RestoreDraft = 14,
};

const char* editKindName(EditKind kind) noexcept;

struct PageScaleChange {
    std::string pageId;
    double before;
    double after;
};

// A single entry in the undo/redo stack
struct HistoryEntry {
    EditKind kind = EditKind::Move;

    struct DetectionChange {
        std::string id;
        bool existedBefore;
        bool existedAfter;
        Detection before;
        Detection after;
    };
    std::vector<DetectionChange> detections;
    std::vector<PageScaleChange> scales;

    std::uint32_t nextIdBefore = 0;
    std::uint32_t nextIdAfter = 0;
};

// Transaction state for accumulating a HistoryEntry
struct HistoryTransaction {
    bool active = false;
    HistoryEntry entry;
    std::unordered_map<std::string, std::size_t> detectionIndex;
};

} // namespace takeoff
