#include "pipeline.hpp"
#include "blend.hpp"
#include "contrast.hpp"
#include "errors.hpp"
#include "saturation.hpp"
#include "utils.hpp"
#include <filesystem>
#include <string>

static void checkFrameSize(const cv::Mat& raw, PipelineState& state) {
    if (raw.empty())
        throw PipelineError(ErrorKind::ModelFailure,
                            "empty frame at index " + std::to_string(state.frameIndex));
    CV_Assert(raw.type() == CV_8UC3);

    if (state.frameSize.empty()) {
        state.frameSize = raw.size();
        return;
    }
    if (raw.size() != state.frameSize) {
        throw PipelineError(ErrorKind::DimensionMismatch,
            "frame " + std::to_string(state.frameIndex) + " is " +
            std::to_string(raw.cols) + "x" + std::to_string(raw.rows) + ", expected " +
            std::to_string(state.frameSize.width) + "x" + std::to_string(state.frameSize.height));
    }
}

static void dumpStages(const std::string& dir,
                       const cv::Mat& raw,
                       const cv::Mat& matched,
                       const cv::Mat& saturated,
                       const cv::Mat& contrasted,
                       const cv::Mat& final) {
    std::filesystem::create_directories(dir);

    cv::imwrite(dir + "/raw.png", raw);
    cv::imwrite(dir + "/matched.png", matched);
    cv::imwrite(dir + "/saturated.png", saturated);
    cv::imwrite(dir + "/contrasted.png", contrasted);
    cv::imwrite(dir + "/final.png", final);

    cv::Mat left = raw.clone();
    cv::Mat right = final.clone();
    utils::putTextInfo(left, "colorized", 0);
    utils::putTextInfo(right, "final", 0);

    cv::Mat comparison;
    cv::hconcat(left, right, comparison);
    cv::imwrite(dir + "/comparison.png", comparison);
}

cv::Mat processFrame(const cv::Mat& raw, const PipelineConfig& cfg, PipelineState& state) {
    checkFrameSize(raw, state);

    // 1. pull colors toward the previous frame
    cv::Mat matched = matchHistograms(raw, state.matcher);

    // 2. cap saturation
    cv::Mat saturated = scaleSaturation(matched, cfg.saturationScale);

    // 3. restore local contrast
    cv::Mat contrasted = enhanceContrast(saturated, cfg.claheClipLimit, cfg.tileGridSize);

    // 4. blend against the unmodified model output
    cv::Mat final = blendFrames(contrasted, raw, cfg.blendFactor);

    // 5. reference for the next frame
    if (cfg.matchReference == MatchReference::Processed)
        state.matcher.referenceFrame = final.clone();
    else
        state.matcher.referenceFrame = raw.clone();

    if (!state.debugDir.empty())
        dumpStages(state.debugDir, raw, matched, saturated, contrasted, final);

    state.frameIndex++;
    return final;
}
