#pragma once
#include <opencv2/opencv.hpp>
#include <string>

struct VideoInfo {
    int width = 0;
    int height = 0;
    double fps = 0.0;
    long frameCount = 0;     // 0 when the container does not say
};

// Finite, in-order sequence of BGR frames for one video.
class FrameSource {
public:
    virtual ~FrameSource() = default;
    virtual VideoInfo info() const = 0;
    // false at end of stream
    virtual bool read(cv::Mat& frame) = 0;
};

class FrameSink {
public:
    virtual ~FrameSink() = default;
    virtual void write(const cv::Mat& frame) = 0;
    virtual void close() = 0;
};

class VideoFileSource : public FrameSource {
public:
    // throws PipelineError(DecodeFailure) if the file cannot be opened
    explicit VideoFileSource(const std::string& path);

    VideoInfo info() const override { return info_; }
    bool read(cv::Mat& frame) override;

private:
    std::string path_;
    cv::VideoCapture cap_;
    VideoInfo info_;
};

// Opens the writer on the first frame, sized to that frame.
class VideoFileSink : public FrameSink {
public:
    VideoFileSink(const std::string& path, int fourcc, double fps);
    ~VideoFileSink() override;

    void write(const cv::Mat& frame) override;
    void close() override;

private:
    std::string path_;
    int fourcc_;
    double fps_;
    cv::VideoWriter writer_;
};
