#include "contrast.hpp"
#include "color_ops.hpp"
#include <vector>

cv::Mat enhanceContrast(const cv::Mat& bgr, double clipLimit, const cv::Size& tileGrid) {
    CV_Assert(clipLimit > 0.0 && tileGrid.width > 0 && tileGrid.height > 0);

    std::vector<cv::Mat> lab;
    cv::split(toLab(bgr), lab);

    // one instance per call, cv::CLAHE keeps scratch buffers internally
    cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(clipLimit, tileGrid);
    std::vector<cv::Mat> equalized(3);
    for (int c = 0; c < 3; c++)
        clahe->apply(lab[c], equalized[c]);

    cv::Mat out;
    cv::merge(equalized, out);
    return labToBgr(out);
}
