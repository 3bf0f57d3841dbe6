#include "takeoff/detection/detection_store.h"
#include <utility>

namespace takeoff {

DetectionStore::DetectionStore(std::vector<Detection> detections) {
    assign(std::move(detections));
}

void DetectionStore::clear() {
    detections_.clear();
    index_.clear();
}

void DetectionStore::assign(std::vector<Detection> detections) {
    detections_ = std::move(detections);
    rebuildIndex();
}

void DetectionStore::upsert(const Detection& detection) {
    const auto it = index_.find(detection.id);
    if (it != index_.end()) {
        detections_[it->second] = detection;
        return;
    }
    index_.emplace(detection.id, detections_.size());
    detections_.push_back(detection);
}

bool DetectionStore::erase(const std::string& id) {
    const auto it = index_.find(id);
    if (it == index_.end()) return false;
    detections_.erase(detections_.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuildIndex();
    return true;
}

Detection* DetectionStore::find(const std::string& id) noexcept {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &detections_[it->second];
}

const Detection* DetectionStore::find(const std::string& id) const noexcept {
    const auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &detections_[it->second];
}

std::vector<const Detection*> DetectionStore::visible(const std::string& pageId, double minConfidence) const {
    std::vector<const Detection*> out;
    for (const auto& det : detections_) {
        if (det.isDeleted() || det.pageId != pageId) continue;
        if (det.confidence < minConfidence) continue;
        out.push_back(&det);
    }
    return out;
}

void DetectionStore::rebuildIndex() {
    index_.clear();
    index_.reserve(detections_.size());
    for (std::size_t i = 0; i < detections_.size(); ++i) {
        index_[detections_[i].id] = i;
    }
}

} // namespace takeoff
