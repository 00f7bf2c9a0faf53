#pragma once
#include <opencv2/opencv.hpp>

// Tile-based contrast limited adaptive histogram equalization applied
// independently to the L, a and b channels.
//   clipLimit: bound on local histogram amplification (> 0)
//   tileGrid:  number of tiles across and down (default 8x8)
cv::Mat enhanceContrast(const cv::Mat& bgr, double clipLimit,
                        const cv::Size& tileGrid = cv::Size(8, 8));
