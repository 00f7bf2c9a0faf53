#pragma once
#include "config.hpp"
#include "job.hpp"
#include "video_io.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Produces the colorized frame stream for a job (decoder + model).
using SourceFactory = std::function<std::unique_ptr<FrameSource>(const VideoJob& job)>;
// Produces a writer for one output stream at `path`.
using SinkFactory = std::function<std::unique_ptr<FrameSink>(const std::string& path,
                                                             const VideoInfo& info)>;

struct BatchOptions {
    std::string outputDir = "colorized_videos";
    SourceFactory makeSource;
    SinkFactory makeSink;
    JobRegistry* registry = nullptr;           // optional observer feed
    const std::atomic<bool>* cancel = nullptr;
};

struct BatchSummary {
    int completed = 0;      // includes skipped
    int skipped = 0;
    int failed = 0;
    std::vector<VideoJob> jobs;
};

// Video files under inputDir, sorted. Previous outputs (*_color.*, *_final.*)
// are left out.
std::vector<std::string> discoverVideos(const std::string& inputDir, bool recursive);

// true for files named like <stem>_color.<ext> or <stem>_final.<ext>
bool isPreviousOutput(const std::string& path);

VideoJob makeJob(const std::string& inputPath, const std::string& outputDir);

// Processes one job to a terminal state. Never throws for per-video errors;
// they end up in job.errorMessage.
void processVideo(VideoJob& job, const PipelineConfig& cfg, const BatchOptions& opts);

// Validates cfg (throws PipelineError(ConfigError) before touching any
// video), then runs every input through processVideo on up to cfg.workers
// threads. A failing video does not stop the others. Inputs whose outputs
// would collide with an earlier input's are failed without being opened.
// Throws PipelineError(EncodeFailure) if the output directory can't be made.
BatchSummary runBatch(const std::vector<std::string>& inputs,
                      const PipelineConfig& cfg,
                      const BatchOptions& opts);
