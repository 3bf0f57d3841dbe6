#ifndef TAKEOFF_PERSISTENCE_DRAFT_STORE_H
#define TAKEOFF_PERSISTENCE_DRAFT_STORE_H

#include "takeoff/core/types.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace takeoff {

// "detection-drafts-<jobId>"
std::string draftKey(const std::string& jobId);

// Recoverable local store for unsaved edit drafts, keyed by job id.
class DraftStore {
public:
    virtual ~DraftStore() = default;

    virtual EngineError save(const std::string& jobId, const std::vector<std::uint8_t>& bytes) = 0;
    // EngineError::NotFound when there is no draft for the job.
    virtual EngineError load(const std::string& jobId, std::vector<std::uint8_t>& out) const = 0;
    // Removing a missing draft is not an error.
    virtual EngineError remove(const std::string& jobId) = 0;
    virtual bool contains(const std::string& jobId) const = 0;
};

class MemoryDraftStore : public DraftStore {
public:
    EngineError save(const std::string& jobId, const std::vector<std::uint8_t>& bytes) override;
    EngineError load(const std::string& jobId, std::vector<std::uint8_t>& out) const override;
    EngineError remove(const std::string& jobId) override;
    bool contains(const std::string& jobId) const override;

    std::size_t size() const noexcept { return drafts_.size(); }

private:
    std::map<std::string, std::vector<std::uint8_t>> drafts_;
};

// One file per job under `directory`; writes go to a temporary file that is then renamed.
class FileDraftStore : public DraftStore {
public:
    explicit FileDraftStore(std::string directory);

    EngineError save(const std::string& jobId, const std::vector<std::uint8_t>& bytes) override;
    EngineError load(const std::string& jobId, std::vector<std::uint8_t>& out) const override;
    EngineError remove(const std::string& jobId) override;
    bool contains(const std::string& jobId) const override;

    std::string pathFor(const std::string& jobId) const;

private:
    std::string directory_;
};

} // namespace takeoff

#endif // TAKEOFF_PERSISTENCE_DRAFT_STORE_H
