#include "histogram_match.hpp"
#include "color_ops.hpp"
#include <array>
#include <cmath>
#include <vector>

using Counts = std::array<int, 256>;
using Cdf = std::array<double, 256>;

static void channelCdf(const cv::Mat& ch, Counts& counts, Cdf& cdf) {
    CV_Assert(ch.type() == CV_8UC1 && !ch.empty());

    counts.fill(0);
    for (int y = 0; y < ch.rows; y++) {
        const uchar* row = ch.ptr<uchar>(y);
        for (int x = 0; x < ch.cols; x++)
            counts[row[x]]++;
    }

    double total = (double)ch.total();
    double running = 0.0;
    for (int i = 0; i < 256; i++) {
        running += counts[i];
        cdf[i] = running / total;
    }
}

static cv::Mat lutFromCdfs(const Cdf& cdfCur, const Counts& refCounts, const Cdf& cdfRef) {
    // candidate targets are the intensities that occur in the reference;
    // their CDF values are strictly increasing
    std::vector<int> present;
    present.reserve(256);
    for (int v = 0; v < 256; v++)
        if (refCounts[v] > 0) present.push_back(v);

    cv::Mat lut(1, 256, CV_8U);
    size_t k = 0;
    for (int i = 0; i < 256; i++) {
        double c = cdfCur[i];
        while (k + 1 < present.size() &&
               std::abs(cdfRef[present[k + 1]] - c) < std::abs(cdfRef[present[k]] - c))
            k++;
        lut.at<uchar>(i) = (uchar)present[k];
    }
    return lut;
}

static bool isIdentityOn(const cv::Mat& lut, const Counts& counts) {
    for (int i = 0; i < 256; i++)
        if (counts[i] > 0 && lut.at<uchar>(i) != i) return false;
    return true;
}

cv::Mat buildMatchLut(const cv::Mat& currentChannel, const cv::Mat& referenceChannel) {
    Counts curCounts, refCounts;
    Cdf cdfCur, cdfRef;
    channelCdf(currentChannel, curCounts, cdfCur);
    channelCdf(referenceChannel, refCounts, cdfRef);
    return lutFromCdfs(cdfCur, refCounts, cdfRef);
}

cv::Mat matchHistograms(const cv::Mat& current, MatcherState& state) {
    if (!state.hasReference()) {
        state.referenceFrame = current.clone();
        return current.clone();
    }

    requireSameSize(current, state.referenceFrame, "histogram reference");

    std::vector<cv::Mat> curLab, refLab;
    cv::split(toLab(current), curLab);
    cv::split(toLab(state.referenceFrame), refLab);

    std::array<cv::Mat, 3> luts;
    std::array<bool, 3> identity{};

    // channels are independent
    cv::parallel_for_(cv::Range(0, 3), [&](const cv::Range& r) {
        for (int c = r.start; c < r.end; c++) {
            Counts curCounts, refCounts;
            Cdf cdfCur, cdfRef;
            channelCdf(curLab[c], curCounts, cdfCur);
            channelCdf(refLab[c], refCounts, cdfRef);
            luts[c] = lutFromCdfs(cdfCur, refCounts, cdfRef);
            identity[c] = isIdentityOn(luts[c], curCounts);
        }
    });

    // nothing to remap: skip the lossy LAB round trip, so a frame matched
    // against an identical reference comes back bit-exact
    if (identity[0] && identity[1] && identity[2])
        return current.clone();

    for (int c = 0; c < 3; c++)
        cv::LUT(curLab[c], luts[c], curLab[c]);

    cv::Mat matchedLab;
    cv::merge(curLab, matchedLab);
    return labToBgr(matchedLab);
}
