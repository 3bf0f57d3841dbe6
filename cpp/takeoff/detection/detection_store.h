#ifndef TAKEOFF_DETECTION_DETECTION_STORE_H
#define TAKEOFF_DETECTION_DETECTION_STORE_H

#include "takeoff/detection/detection.h"
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace takeoff {

// Detections of one job in insertion order, indexed by id.
class DetectionStore {
public:
    DetectionStore() = default;
    explicit DetectionStore(std::vector<Detection> detections);

    void clear();
    void assign(std::vector<Detection> detections);

    // Inserts or replaces by id. Replacement keeps the existing slot.
    void upsert(const Detection& detection);
    bool erase(const std::string& id);

    Detection* find(const std::string& id) noexcept;
    const Detection* find(const std::string& id) const noexcept;
    bool contains(const std::string& id) const noexcept { return index_.count(id) != 0; }

    const std::vector<Detection>& all() const noexcept { return detections_; }
    std::size_t size() const noexcept { return detections_.size(); }

    // Non-deleted detections of a page at or above `minConfidence`.
    std::vector<const Detection*> visible(const std::string& pageId, double minConfidence = 0.0) const;

private:
    void rebuildIndex();

    std::vector<Detection> detections_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace takeoff

#endif // TAKEOFF_DETECTION_DETECTION_STORE_H
