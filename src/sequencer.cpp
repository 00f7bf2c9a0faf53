#include "sequencer.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

long runSequence(FrameSource& source,
                 FrameSink& rawSink,
                 FrameSink& finalSink,
                 const PipelineConfig& cfg,
                 const ProgressFn& onProgress,
                 const std::atomic<bool>* cancel) {
    PipelineState state;
    const long total = source.info().frameCount;
    int lastPercent = 0;

    cv::Mat raw;
    while (true) {
        if (cancel && cancel->load())
            throw PipelineError(ErrorKind::Cancelled,
                                "aborted after " + std::to_string(state.frameIndex) + " frames");

        if (!source.read(raw)) break;

        cv::Mat final = processFrame(raw, cfg, state);
        rawSink.write(raw);
        finalSink.write(final);

        if (total > 0) {
            int percent = (int)std::min<long>(100, state.frameIndex * 100 / total);
            if (percent > lastPercent) {
                lastPercent = percent;
                if (onProgress) onProgress(percent, state.frameIndex);
            }
        }
        spdlog::debug("frame {} done", state.frameIndex);
    }

    if (state.frameIndex == 0)
        throw PipelineError(ErrorKind::DecodeFailure, "no frames could be read");

    if (lastPercent < 100 && onProgress) onProgress(100, state.frameIndex);
    return state.frameIndex;
}
