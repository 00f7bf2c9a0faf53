#pragma once
#include "config.hpp"
#include "pipeline.hpp"
#include "video_io.hpp"
#include <atomic>
#include <functional>

// percent is monotonic in [0,100]
using ProgressFn = std::function<void(int percent, long framesDone)>;

// Pulls every frame from `source` in order, post-processes it and writes
// the raw frame to rawSink and the final frame to finalSink. The
// per-video PipelineState lives and dies inside this call.
// Returns the number of frames processed.
// Throws PipelineError (DecodeFailure when the source yields nothing,
// Cancelled when *cancel is set between frames) or whatever a stage throws.
long runSequence(FrameSource& source,
                 FrameSink& rawSink,
                 FrameSink& finalSink,
                 const PipelineConfig& cfg,
                 const ProgressFn& onProgress = nullptr,
                 const std::atomic<bool>* cancel = nullptr);
