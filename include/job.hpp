#pragma once
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

enum class JobStatus { Pending, Processing, Completed, Failed };

const char* jobStatusName(JobStatus status);

struct VideoJob {
    std::string id;                   // the input path
    std::string inputPath;
    std::string colorizedOutputPath;  // <out>/<stem>_color.mp4
    std::string finalOutputPath;      // <out>/<stem>_final.mp4

    JobStatus status = JobStatus::Pending;
    int progressPercent = 0;
    std::string errorMessage;

    long framesProcessed = 0;
    bool skipped = false;             // completed by an earlier run

    bool terminal() const {
        return status == JobStatus::Completed || status == JobStatus::Failed;
    }
};

// Job id -> immutable snapshot. Each job is published by the single worker
// that owns it; any number of observers may read concurrently.
class JobRegistry {
public:
    void publish(const VideoJob& job);

    // nullptr for an unknown id
    std::shared_ptr<const VideoJob> snapshot(const std::string& id) const;
    std::vector<std::shared_ptr<const VideoJob>> all() const;

private:
    mutable std::shared_mutex mtx_;
    std::map<std::string, std::shared_ptr<const VideoJob>> jobs_;
};
