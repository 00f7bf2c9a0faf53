#include "video_io.hpp"
#include "errors.hpp"

VideoFileSource::VideoFileSource(const std::string& path) : path_(path) {
    if (!cap_.open(path))
        throw PipelineError(ErrorKind::DecodeFailure, "could not open input video: " + path);

    info_.fps = cap_.get(cv::CAP_PROP_FPS);
    info_.width = (int)cap_.get(cv::CAP_PROP_FRAME_WIDTH);
    info_.height = (int)cap_.get(cv::CAP_PROP_FRAME_HEIGHT);
    info_.frameCount = (long)cap_.get(cv::CAP_PROP_FRAME_COUNT);
    if (info_.frameCount < 0) info_.frameCount = 0;
}

bool VideoFileSource::read(cv::Mat& frame) {
    if (!cap_.read(frame) || frame.empty()) return false;

    // some backends hand out single channel frames for B/W material
    if (frame.channels() == 1)
        cv::cvtColor(frame, frame, cv::COLOR_GRAY2BGR);
    return true;
}

VideoFileSink::VideoFileSink(const std::string& path, int fourcc, double fps)
    : path_(path), fourcc_(fourcc), fps_(fps > 0.0 ? fps : 25.0) {}

VideoFileSink::~VideoFileSink() {
    writer_.release();
}

void VideoFileSink::write(const cv::Mat& frame) {
    if (!writer_.isOpened()) {
        writer_.open(path_, fourcc_, fps_, frame.size(), true);
        if (!writer_.isOpened())
            throw PipelineError(ErrorKind::EncodeFailure, "could not open VideoWriter: " + path_);
    }
    writer_.write(frame);
}

void VideoFileSink::close() {
    writer_.release();
}
