#include "job.hpp"
#include <mutex>

const char* jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:    return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
    }
    return "unknown";
}

void JobRegistry::publish(const VideoJob& job) {
    auto snap = std::make_shared<const VideoJob>(job);
    std::unique_lock<std::shared_mutex> lock(mtx_);
    jobs_[job.id] = std::move(snap);
}

std::shared_ptr<const VideoJob> JobRegistry::snapshot(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = jobs_.find(id);
    return it == jobs_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<const VideoJob>> JobRegistry::all() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    std::vector<std::shared_ptr<const VideoJob>> out;
    out.reserve(jobs_.size());
    for (const auto& kv : jobs_) out.push_back(kv.second);
    return out;
}
