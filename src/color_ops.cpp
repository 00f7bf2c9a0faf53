#include "color_ops.hpp"
#include "errors.hpp"
#include <string>
#include <vector>

static void requireBgr8(const cv::Mat& m) {
    CV_Assert(!m.empty() && m.type() == CV_8UC3);
}

cv::Mat toLab(const cv::Mat& bgr) {
    requireBgr8(bgr);
    cv::Mat lab;
    cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
    return lab;
}

cv::Mat labToBgr(const cv::Mat& lab) {
    requireBgr8(lab);
    cv::Mat bgr;
    cv::cvtColor(lab, bgr, cv::COLOR_Lab2BGR);
    return bgr;
}

cv::Mat toHsv(const cv::Mat& bgr) {
    requireBgr8(bgr);
    cv::Mat hsv;
    cv::cvtColor(bgr, hsv, cv::COLOR_BGR2HSV);
    return hsv;
}

cv::Mat hsvToBgr(const cv::Mat& hsv) {
    requireBgr8(hsv);
    cv::Mat bgr;
    cv::cvtColor(hsv, bgr, cv::COLOR_HSV2BGR);
    return bgr;
}

cv::Mat scaleChannel(const cv::Mat& frame, int channelIndex, double factor) {
    requireBgr8(frame);
    CV_Assert(channelIndex >= 0 && channelIndex < 3);

    std::vector<cv::Mat> ch;
    cv::split(frame, ch);
    // convertTo saturates to 0..255 for 8U
    ch[channelIndex].convertTo(ch[channelIndex], CV_8U, factor);

    cv::Mat out;
    cv::merge(ch, out);
    return out;
}

void requireSameSize(const cv::Mat& a, const cv::Mat& b, const char* what) {
    if (a.size() != b.size() || a.type() != b.type()) {
        throw PipelineError(ErrorKind::DimensionMismatch,
            std::string(what) + ": " +
            std::to_string(a.cols) + "x" + std::to_string(a.rows) + " vs " +
            std::to_string(b.cols) + "x" + std::to_string(b.rows));
    }
}

cv::Mat weightedSum(const cv::Mat& a, const cv::Mat& b, double weightA) {
    requireSameSize(a, b, "weightedSum");

    // exact at the ends, no float round trip
    if (weightA >= 1.0) return a.clone();
    if (weightA <= 0.0) return b.clone();

    cv::Mat out;
    cv::addWeighted(a, weightA, b, 1.0 - weightA, 0.0, out);
    return out;
}
