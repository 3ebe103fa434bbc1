#include "codeexec/store.h"
#include "codeexec/log.h"
#include "codeexec/util.h"

namespace codeexec {

FileRecordStore::FileRecordStore(std::filesystem::path root, std::string table, bool fsync_writes)
    : dir_(std::move(root) / table), fsync_(fsync_writes) {}

std::filesystem::path FileRecordStore::path_for(const std::string& job_id) const {
    return dir_ / (job_id + ".json");
}

std::string FileRecordStore::put(const JobRecord& rec) {
    std::string id_err = check_job_id(rec.job_id);
    if (!id_err.empty()) return "invalid key: " + id_err;
    return write_atomic_file(path_for(rec.job_id), record_to_json(rec) + "\n", fsync_);
}

std::optional<JobRecord> FileRecordStore::get(const std::string& job_id) {
    if (!check_job_id(job_id).empty()) return std::nullopt;
    std::string body;
    if (!read_file(path_for(job_id), &body)) return std::nullopt;
    JobRecord rec;
    std::string err;
    if (!record_from_json(body, &rec, &err)) {
        log_warn("store", "unreadable record " + job_id + ": " + err);
        return std::nullopt;
    }
    if (rec.ttl > 0 && rec.ttl <= now_sec()) return std::nullopt;
    return rec;
}

size_t FileRecordStore::sweep_expired(int64_t now_epoch_sec) {
    size_t removed = 0;
    std::error_code ec;
    if (!std::filesystem::exists(dir_, ec)) return 0;
    for (auto it = std::filesystem::directory_iterator(dir_, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        const auto& de = *it;
        std::error_code fec;
        if (!de.is_regular_file(fec) || de.path().extension() != ".json") continue;
        std::string body;
        if (!read_file(de.path(), &body)) continue;
        JobRecord rec;
        if (!record_from_json(body, &rec, nullptr)) continue;
        if (rec.ttl > 0 && rec.ttl <= now_epoch_sec) {
            std::error_code rec_ec;
            if (std::filesystem::remove(de.path(), rec_ec)) removed++;
        }
    }
    if (ec) log_warn("store", "sweep of " + dir_.string() + " incomplete: " + ec.message());
    return removed;
}

} // namespace codeexec
