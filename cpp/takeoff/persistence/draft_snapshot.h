#ifndef TAKEOFF_PERSISTENCE_DRAFT_SNAPSHOT_H
#define TAKEOFF_PERSISTENCE_DRAFT_SNAPSHOT_H

#include "takeoff/core/types.h"
#include "takeoff/detection/detection.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace takeoff {

struct PageScaleRecord {
    std::string pageId;
    double scaleRatio;
};

// Everything needed to bring an edit session back: the full detection set,
// the page scales and the local id counter.
struct DraftData {
    std::string jobId;
    double timestampMs{0.0};
    std::uint32_t nextLocalId{1};
    std::vector<PageScaleRecord> pageScales;
    std::vector<Detection> detections;
    std::uint32_t version{0};
};

// Parse TDRF draft bytes into a DraftData structure.
// Returns EngineError::Ok on success; `out` is unspecified otherwise.
EngineError parseDraft(const std::uint8_t* src, std::size_t byteCount, DraftData& out);

// Build bytes for a TDRF draft from DraftData.
std::vector<std::uint8_t> buildDraftBytes(const DraftData& data);

} // namespace takeoff

#endif // TAKEOFF_PERSISTENCE_DRAFT_SNAPSHOT_H
