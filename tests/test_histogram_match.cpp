#include <gtest/gtest.h>
#include "errors.hpp"
#include "histogram_match.hpp"
#include "test_frames.hpp"
#include <cmath>

using namespace testing_frames;

TEST(HistogramMatch, FirstFrameIsReturnedUnchangedAndBecomesReference) {
    MatcherState state;
    ASSERT_FALSE(state.hasReference());

    cv::Mat frame = makeTestFrame();
    cv::Mat out = matchHistograms(frame, state);

    EXPECT_TRUE(identical(out, frame));
    ASSERT_TRUE(state.hasReference());
    EXPECT_TRUE(identical(state.referenceFrame, frame));
}

TEST(HistogramMatch, MatchingAgainstItselfIsBitExact) {
    cv::Mat frame = makeTestFrame();
    MatcherState state;
    state.referenceFrame = frame.clone();

    EXPECT_TRUE(identical(matchHistograms(frame, state), frame));
}

TEST(HistogramMatch, MatchDoesNotMoveTheReference) {
    cv::Mat ref = makeTestFrame();
    MatcherState state;
    state.referenceFrame = ref.clone();

    matchHistograms(darker(ref, 0.5), state);
    EXPECT_TRUE(identical(state.referenceFrame, ref));
}

TEST(HistogramMatch, LutMapsShiftedDistributionOntoReference) {
    cv::Mat cur(10, 50, CV_8UC1);
    cv::Mat ref(10, 50, CV_8UC1);
    for (int y = 0; y < 10; y++) {
        for (int x = 0; x < 50; x++) {
            cur.at<uchar>(y, x) = (uchar)(50 + x);
            ref.at<uchar>(y, x) = (uchar)(150 + x);
        }
    }

    cv::Mat lut = buildMatchLut(cur, ref);
    ASSERT_EQ(lut.total(), 256u);
    for (int i = 50; i < 100; i++)
        EXPECT_EQ(lut.at<uchar>(i), i + 100) << "intensity " << i;
}

TEST(HistogramMatch, LutIsMonotonic) {
    cv::Mat cur = makeRandomFrame(64, 48, 11).reshape(1);
    cv::Mat ref = makeRandomFrame(64, 48, 12).reshape(1);
    cv::Mat refSkewed;
    cv::multiply(ref, ref, refSkewed, 1.0 / 255.0);

    cv::Mat lut = buildMatchLut(cur, refSkewed);
    for (int i = 1; i < 256; i++)
        EXPECT_LE(lut.at<uchar>(i - 1), lut.at<uchar>(i)) << "at " << i;
}

TEST(HistogramMatch, LutOnlyTargetsIntensitiesPresentInReference) {
    cv::Mat cur(16, 16, CV_8UC1);
    for (int i = 0; i < 256; i++) cur.at<uchar>(i / 16, i % 16) = (uchar)i;

    cv::Mat ref(16, 16, CV_8UC1, cv::Scalar(0));
    ref.rowRange(8, 16).setTo(255);

    cv::Mat lut = buildMatchLut(cur, ref);
    for (int i = 0; i < 256; i++) {
        uchar v = lut.at<uchar>(i);
        EXPECT_TRUE(v == 0 || v == 255) << "intensity " << i << " -> " << (int)v;
    }
    EXPECT_EQ(lut.at<uchar>(0), 0);
    EXPECT_EQ(lut.at<uchar>(255), 255);
}

TEST(HistogramMatch, DarkerFrameIsPulledTowardReference) {
    cv::Mat ref = makeTestFrame();
    cv::Mat dim = darker(ref, 0.6);

    MatcherState state;
    state.referenceFrame = ref.clone();
    cv::Mat out = matchHistograms(dim, state);

    double before = std::abs(meanLightness(dim) - meanLightness(ref));
    double after = std::abs(meanLightness(out) - meanLightness(ref));
    EXPECT_GT(before, 20.0);
    EXPECT_LT(after, 3.0);
}

TEST(HistogramMatch, ReferenceOfDifferentSizeIsRejected) {
    MatcherState state;
    state.referenceFrame = makeTestFrame(64, 64);

    try {
        matchHistograms(makeTestFrame(64, 48), state);
        FAIL() << "expected PipelineError";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DimensionMismatch);
    }
}

TEST(HistogramMatch, ResetForgetsReference) {
    MatcherState state;
    matchHistograms(makeTestFrame(), state);
    ASSERT_TRUE(state.hasReference());
    state.reset();
    EXPECT_FALSE(state.hasReference());
}
