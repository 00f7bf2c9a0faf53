#pragma once
#include <opencv2/opencv.hpp>

// Cross-frame state of the histogram matcher. One instance per video,
// owned by the sequencer processing it and never shared.
struct MatcherState {
    cv::Mat referenceFrame;   // empty until the first frame has been seen

    bool hasReference() const { return !referenceFrame.empty(); }
    void reset() { referenceFrame.release(); }
};

// Remap the LAB channel distributions of `current` onto those of
// state.referenceFrame. On the first frame (no reference yet) the frame is
// returned unchanged and becomes the reference.
cv::Mat matchHistograms(const cv::Mat& current, MatcherState& state);

// 256-entry CV_8U lookup table mapping each intensity of `currentChannel`
// to the intensity of `referenceChannel` with the closest CDF value.
// Both inputs are single channel CV_8U. The mapping is non-decreasing.
cv::Mat buildMatchLut(const cv::Mat& currentChannel, const cv::Mat& referenceChannel);
