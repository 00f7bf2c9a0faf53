#pragma once
#include <opencv2/opencv.hpp>
#include <opencv2/dnn.hpp>
#include "video_io.hpp"
#include <memory>
#include <string>

// External colorization model: one BGR frame in, one BGR frame out.
class Colorizer {
public:
    virtual ~Colorizer() = default;
    virtual cv::Mat colorize(const cv::Mat& bgr, int renderFactor) = 0;
};

// For input that is already colorized and only needs post-processing.
class IdentityColorizer : public Colorizer {
public:
    cv::Mat colorize(const cv::Mat& bgr, int renderFactor) override;
};

struct DnnModelPaths {
    std::string prototxt;
    std::string caffemodel;
    std::string hullPoints;    // FileStorage file with a 313x2 matrix "pts_in_hull"
};

// Zhang et al. colorization network run through cv::dnn.
// The network sees a square L image of side 16*renderFactor; the predicted
// ab channels are resized to the frame and merged with the frame's own L.
// Not thread-safe: use one instance per worker.
class DnnColorizer : public Colorizer {
public:
    bool load(const DnnModelPaths& paths);
    cv::Mat colorize(const cv::Mat& bgr, int renderFactor) override;

private:
    cv::dnn::Net net_;
    cv::Mat hull_;
};

// Decodes frames from `decoder` and colorizes each one on read.
class ColorizingSource : public FrameSource {
public:
    ColorizingSource(std::unique_ptr<FrameSource> decoder,
                     std::unique_ptr<Colorizer> colorizer,
                     int renderFactor);

    VideoInfo info() const override { return decoder_->info(); }
    bool read(cv::Mat& frame) override;

private:
    std::unique_ptr<FrameSource> decoder_;
    std::unique_ptr<Colorizer> colorizer_;
    int renderFactor_;
    cv::Mat gray_;
};
