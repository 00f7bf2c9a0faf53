#pragma once
#include <opencv2/opencv.hpp>

// HSV saturation scaled by factor, clamped to [0,255]
cv::Mat scaleSaturation(const cv::Mat& bgr, double factor);
