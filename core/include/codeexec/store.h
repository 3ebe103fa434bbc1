#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "codeexec/job.h"

namespace codeexec {

// Durable job-record store. put() is a full replace keyed by job_id, never a
// conditional update: duplicate terminal writes are expected.
class IRecordStore {
public:
    virtual ~IRecordStore() = default;
    // Empty string on success.
    virtual std::string put(const JobRecord& rec) = 0;
    virtual std::optional<JobRecord> get(const std::string& job_id) = 0;
};

// One JSON document per record: <root>/<table>/<job_id>.json
class FileRecordStore : public IRecordStore {
public:
    FileRecordStore(std::filesystem::path root, std::string table, bool fsync_writes = false);

    std::string put(const JobRecord& rec) override;
    // Records whose ttl has passed read as absent.
    std::optional<JobRecord> get(const std::string& job_id) override;

    // Delete expired records. Returns the number removed.
    size_t sweep_expired(int64_t now_epoch_sec);

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path path_for(const std::string& job_id) const;

    std::filesystem::path dir_;
    bool fsync_{false};
};

} // namespace codeexec
