#pragma once
#include <opencv2/opencv.hpp>

// processed*blendFactor + raw*(1-blendFactor).
// blendFactor 0 reproduces raw exactly, 1 reproduces processed exactly.
cv::Mat blendFrames(const cv::Mat& processed, const cv::Mat& raw, double blendFactor);
