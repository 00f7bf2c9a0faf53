#include "batch.hpp"
#include "errors.hpp"
#include "sequencer.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <map>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace {

// Per-video scratch directory, removed on every exit path.
class ScopedWorkspace {
public:
    explicit ScopedWorkspace(fs::path dir) : dir_(std::move(dir)) {
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    ~ScopedWorkspace() {
        std::error_code ec;
        fs::remove_all(dir_, ec);
        if (ec) spdlog::warn("could not remove workspace {}: {}", dir_.string(), ec.message());
    }

    ScopedWorkspace(const ScopedWorkspace&) = delete;
    ScopedWorkspace& operator=(const ScopedWorkspace&) = delete;

    std::string file(const fs::path& name) const { return (dir_ / name).string(); }

private:
    fs::path dir_;
};

void publish(const BatchOptions& opts, const VideoJob& job) {
    if (opts.registry) opts.registry->publish(job);
}

void fail(VideoJob& job, const BatchOptions& opts, const std::string& msg) {
    job.status = JobStatus::Failed;
    job.errorMessage = msg;
    publish(opts, job);
    spdlog::error("{} failed: {}", job.inputPath, msg);
}

}

std::vector<std::string> discoverVideos(const std::string& inputDir, bool recursive) {
    std::vector<std::string> videos;
    for (const auto& path : utils::glob((fs::path(inputDir) / "*").string(), recursive)) {
        if (!fs::is_regular_file(path) || !utils::hasVideoExtension(path)) continue;
        if (isPreviousOutput(path)) {
            spdlog::info("skipping {}: looks like a colorized output", path);
            continue;
        }
        videos.push_back(path);
    }
    return videos;
}

bool isPreviousOutput(const std::string& path) {
    std::string stem = fs::path(path).stem().string();
    auto endsWith = [&](const std::string& suffix) {
        return stem.size() > suffix.size() &&
               stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return endsWith("_color") || endsWith("_final");
}

VideoJob makeJob(const std::string& inputPath, const std::string& outputDir) {
    std::string stem = fs::path(inputPath).stem().string();

    VideoJob job;
    job.id = inputPath;
    job.inputPath = inputPath;
    job.colorizedOutputPath = (fs::path(outputDir) / (stem + "_color.mp4")).string();
    job.finalOutputPath = (fs::path(outputDir) / (stem + "_final.mp4")).string();
    return job;
}

void processVideo(VideoJob& job, const PipelineConfig& cfg, const BatchOptions& opts) {
    try {
        // the final file only ever appears after a successful run
        if (fs::exists(job.finalOutputPath)) {
            job.status = JobStatus::Completed;
            job.skipped = true;
            job.progressPercent = 100;
            publish(opts, job);
            spdlog::info("skipping {}: {} already exists", job.inputPath, job.finalOutputPath);
            return;
        }

        if (opts.cancel && opts.cancel->load()) {
            fail(job, opts, errorKindName(ErrorKind::Cancelled));
            return;
        }

        job.status = JobStatus::Processing;
        job.progressPercent = 0;
        job.errorMessage.clear();
        publish(opts, job);
        spdlog::info("processing {} -> {}", job.inputPath, job.finalOutputPath);

        // output names are unique within a batch, so is the workspace
        std::string stem = fs::path(job.inputPath).stem().string();
        ScopedWorkspace ws(fs::path(job.finalOutputPath).parent_path() / (".work_" + stem));

        fs::path colorName = fs::path(job.colorizedOutputPath).filename();
        fs::path finalName = fs::path(job.finalOutputPath).filename();

        {
            std::unique_ptr<FrameSource> source = opts.makeSource(job);
            VideoInfo info = source->info();
            std::unique_ptr<FrameSink> rawSink = opts.makeSink(ws.file(colorName), info);
            std::unique_ptr<FrameSink> finalSink = opts.makeSink(ws.file(finalName), info);

            auto onProgress = [&](int percent, long frames) {
                job.progressPercent = percent;
                job.framesProcessed = frames;
                publish(opts, job);
                if (percent % 10 == 0)
                    spdlog::info("{}: {}% ({} frames)", job.inputPath, percent, frames);
            };

            job.framesProcessed = runSequence(*source, *rawSink, *finalSink, cfg,
                                              onProgress, opts.cancel);
            rawSink->close();
            finalSink->close();
        }

        // color first, final last: final marks the video as done
        fs::rename(ws.file(colorName), job.colorizedOutputPath);
        fs::rename(ws.file(finalName), job.finalOutputPath);

        job.status = JobStatus::Completed;
        job.progressPercent = 100;
        publish(opts, job);
        spdlog::info("completed {} ({} frames)", job.inputPath, job.framesProcessed);
    } catch (const PipelineError& e) {
        fail(job, opts, e.what());
    } catch (const cv::Exception& e) {
        fail(job, opts, std::string("opencv: ") + e.what());
    } catch (const std::exception& e) {
        // filesystem errors on this video's paths (name too long, permissions)
        fail(job, opts, e.what());
    }
}

BatchSummary runBatch(const std::vector<std::string>& inputs,
                      const PipelineConfig& cfg,
                      const BatchOptions& opts) {
    validateConfig(cfg);

    BatchSummary summary;
    for (const auto& in : inputs) {
        if (isPreviousOutput(in)) {
            spdlog::info("skipping {}: looks like a colorized output", in);
            continue;
        }
        summary.jobs.push_back(makeJob(in, opts.outputDir));
    }
    if (summary.jobs.empty()) {
        spdlog::warn("no input videos");
        return summary;
    }

    std::error_code ec;
    fs::create_directories(opts.outputDir, ec);
    if (ec)
        throw PipelineError(ErrorKind::EncodeFailure,
                            "cannot create output directory " + opts.outputDir + ": " + ec.message());
    for (const auto& job : summary.jobs) publish(opts, job);

    // inputs sharing a stem (a/clip.mp4, b/clip.mp4) would write the same
    // outputs; the first one wins
    std::map<std::string, std::string> owners;
    for (auto& job : summary.jobs) {
        auto inserted = owners.emplace(job.finalOutputPath, job.inputPath);
        if (!inserted.second)
            fail(job, opts, "output " + job.finalOutputPath + " is already produced by " +
                            inserted.first->second);
    }

    spdlog::info("found {} video(s) to process", summary.jobs.size());

    size_t workers = std::min<size_t>((size_t)cfg.workers, summary.jobs.size());
    if (workers <= 1) {
        for (auto& job : summary.jobs)
            if (!job.terminal()) processVideo(job, cfg, opts);
    } else {
        // each job is touched by exactly one worker
        std::atomic<size_t> next{0};
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t w = 0; w < workers; w++) {
            threads.emplace_back([&]() {
                for (size_t i = next++; i < summary.jobs.size(); i = next++)
                    if (!summary.jobs[i].terminal()) processVideo(summary.jobs[i], cfg, opts);
            });
        }
        for (auto& t : threads) t.join();
    }

    for (const auto& job : summary.jobs) {
        if (job.status == JobStatus::Completed) {
            summary.completed++;
            if (job.skipped) summary.skipped++;
        } else {
            summary.failed++;
        }
    }
    spdlog::info("batch done: {} completed ({} skipped), {} failed",
                 summary.completed, summary.skipped, summary.failed);
    return summary;
}
