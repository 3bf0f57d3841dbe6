#include "takeoff/persistence/draft_store.h"
#include "takeoff/core/logging.h"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>

namespace takeoff {

std::string draftKey(const std::string& jobId) {
    return "detection-drafts-" + jobId;
}

EngineError MemoryDraftStore::save(const std::string& jobId, const std::vector<std::uint8_t>& bytes) {
    drafts_[draftKey(jobId)] = bytes;
    return EngineError::Ok;
}

EngineError MemoryDraftStore::load(const std::string& jobId, std::vector<std::uint8_t>& out) const {
    const auto it = drafts_.find(draftKey(jobId));
    if (it == drafts_.end()) return EngineError::NotFound;
    out = it->second;
    return EngineError::Ok;
}

EngineError MemoryDraftStore::remove(const std::string& jobId) {
    drafts_.erase(draftKey(jobId));
    return EngineError::Ok;
}

bool MemoryDraftStore::contains(const std::string& jobId) const {
    return drafts_.count(draftKey(jobId)) != 0;
}

FileDraftStore::FileDraftStore(std::string directory) : directory_(std::move(directory)) {
    if (directory_.empty()) directory_ = ".";
}

std::string FileDraftStore::pathFor(const std::string& jobId) const {
    std::string path = directory_;
    if (path.back() != '/') path.push_back('/');
    return path + draftKey(jobId) + ".tdrf";
}

EngineError FileDraftStore::save(const std::string& jobId, const std::vector<std::uint8_t>& bytes) {
    const std::string path = pathFor(jobId);
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            TAKEOFF_LOG_WARN("draft store: cannot open %s", tmpPath.c_str());
            return EngineError::IoError;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            TAKEOFF_LOG_WARN("draft store: short write to %s", tmpPath.c_str());
            std::remove(tmpPath.c_str());
            return EngineError::IoError;
        }
    }
    if (std::rename(tmpPath.c_str(), path.c_str()) != 0) {
        TAKEOFF_LOG_WARN("draft store: cannot rename %s", tmpPath.c_str());
        std::remove(tmpPath.c_str());
        return EngineError::IoError;
    }
    return EngineError::Ok;
}

EngineError FileDraftStore::load(const std::string& jobId, std::vector<std::uint8_t>& out) const {
    std::ifstream file(pathFor(jobId), std::ios::binary);
    if (!file) return EngineError::NotFound;
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) return EngineError::IoError;
    out = std::move(bytes);
    return EngineError::Ok;
}

EngineError FileDraftStore::remove(const std::string& jobId) {
    const std::string path = pathFor(jobId);
    if (!contains(jobId)) return EngineError::Ok;
    if (std::remove(path.c_str()) != 0) return EngineError::IoError;
    return EngineError::Ok;
}

bool FileDraftStore::contains(const std::string& jobId) const {
    std::ifstream file(pathFor(jobId), std::ios::binary);
    return static_cast<bool>(file);
}

} // namespace takeoff
