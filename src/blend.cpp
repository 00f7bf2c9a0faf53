#include "blend.hpp"
#include "color_ops.hpp"

cv::Mat blendFrames(const cv::Mat& processed, const cv::Mat& raw, double blendFactor) {
    return weightedSum(processed, raw, blendFactor);
}
