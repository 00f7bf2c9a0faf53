#pragma once
#include <opencv2/opencv.hpp>

// All frames are CV_8UC3. LAB and HSV use OpenCV's 8-bit conventions
// (L,a,b scaled to 0..255; H in 0..180, S and V in 0..255).

cv::Mat toLab(const cv::Mat& bgr);
cv::Mat labToBgr(const cv::Mat& lab);

cv::Mat toHsv(const cv::Mat& bgr);
cv::Mat hsvToBgr(const cv::Mat& hsv);

// multiply one channel by factor, saturating to [0,255]
cv::Mat scaleChannel(const cv::Mat& frame, int channelIndex, double factor);

// out = weightA*A + (1-weightA)*B, saturating to [0,255].
// Throws PipelineError(DimensionMismatch) when A and B differ in size or type.
cv::Mat weightedSum(const cv::Mat& a, const cv::Mat& b, double weightA);

void requireSameSize(const cv::Mat& a, const cv::Mat& b, const char* what);
