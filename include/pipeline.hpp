#pragma once
#include <opencv2/opencv.hpp>
#include "config.hpp"
#include "histogram_match.hpp"
#include <string>

// Per-video state. Exactly one sequencer owns an instance for the lifetime
// of one video; it is destroyed when the video completes or fails.
struct PipelineState {
    MatcherState matcher;
    cv::Size frameSize;        // fixed by the first frame
    long frameIndex = 0;       // frames processed so far

    std::string debugDir;      // when set, every stage is written here
};

// Runs one colorized frame through
//   histogram match -> saturation -> contrast -> blend with raw
// and commits the reference for the next frame. Returns the final frame.
cv::Mat processFrame(const cv::Mat& raw, const PipelineConfig& cfg, PipelineState& state);
