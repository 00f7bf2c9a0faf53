#include "saturation.hpp"
#include "color_ops.hpp"

cv::Mat scaleSaturation(const cv::Mat& bgr, double factor) {
    cv::Mat hsv = toHsv(bgr);
    hsv = scaleChannel(hsv, 1, factor);
    return hsvToBgr(hsv);
}
