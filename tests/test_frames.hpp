#pragma once
#include <opencv2/opencv.hpp>
#include "video_io.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace testing_frames {

// smooth colorful content with many distinct values per channel
inline cv::Mat makeTestFrame(int w = 256, int h = 256) {
    cv::Mat f(h, w, CV_8UC3);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            f.at<cv::Vec3b>(y, x) = cv::Vec3b(
                (uchar)(40 + (x * 150) / w),
                (uchar)(60 + (y * 120) / h),
                (uchar)(80 + ((x + y) * 100) / (w + h)));
        }
    }
    return f;
}

// mid-tone, low chroma: what colorized black-and-white footage looks like
inline cv::Mat makeNearGrayFrame(int w = 128, int h = 96) {
    cv::Mat f(h, w, CV_8UC3);
    for (int y = 0; y < h; y++) {
        for (int x = 0; x < w; x++) {
            int g = 70 + (x * 7 + y * 13) % 120;
            int db = (x % 5) - 2;
            int dr = (y % 7) - 3;
            f.at<cv::Vec3b>(y, x) = cv::Vec3b((uchar)(g + 2 * db), (uchar)g, (uchar)(g + 2 * dr));
        }
    }
    return f;
}

inline cv::Mat makeRandomFrame(int w, int h, uint64_t seed) {
    cv::Mat f(h, w, CV_8UC3);
    cv::RNG rng(seed);
    rng.fill(f, cv::RNG::UNIFORM, 0, 256);
    return f;
}

inline cv::Mat darker(const cv::Mat& f, double factor) {
    cv::Mat out;
    f.convertTo(out, CV_8U, factor);
    return out;
}

inline double maxAbsDiff(const cv::Mat& a, const cv::Mat& b) {
    return cv::norm(a, b, cv::NORM_INF);
}

inline double meanAbsDiff(const cv::Mat& a, const cv::Mat& b) {
    cv::Mat d;
    cv::absdiff(a, b, d);
    cv::Scalar m = cv::mean(d);
    return (m[0] + m[1] + m[2]) / 3.0;
}

inline bool identical(const cv::Mat& a, const cv::Mat& b) {
    return a.size() == b.size() && a.type() == b.type() && cv::norm(a, b, cv::NORM_INF) == 0;
}

inline double meanLightness(const cv::Mat& bgr) {
    cv::Mat lab;
    cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);
    return cv::mean(lab)[0];
}

// In-memory decoder/model output.
class VectorSource : public FrameSource {
public:
    explicit VectorSource(std::vector<cv::Mat> frames, long advertised = -1)
        : frames_(std::move(frames)) {
        info_.frameCount = advertised < 0 ? (long)frames_.size() : advertised;
        info_.fps = 25.0;
        if (!frames_.empty()) {
            info_.width = frames_[0].cols;
            info_.height = frames_[0].rows;
        }
    }

    VideoInfo info() const override { return info_; }

    bool read(cv::Mat& frame) override {
        if (next_ >= frames_.size()) return false;
        frame = frames_[next_++].clone();
        return true;
    }

private:
    std::vector<cv::Mat> frames_;
    size_t next_ = 0;
    VideoInfo info_;
};

// Keeps frames in memory; close() leaves a small file at `path` so the
// batch controller has something to move into place.
class MemorySink : public FrameSink {
public:
    explicit MemorySink(std::string path = "") : path_(std::move(path)) {}

    void write(const cv::Mat& frame) override { frames.push_back(frame.clone()); }

    void close() override {
        if (path_.empty()) return;
        std::ofstream out(path_);
        out << frames.size() << "\n";
    }

    std::vector<cv::Mat> frames;

private:
    std::string path_;
};

// Fresh directory under the system temp dir, removed afterwards.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("colorize_" + tag + "_" + std::to_string(stamp));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const std::filesystem::path& path() const { return path_; }
    std::string str(const std::string& name = "") const {
        return name.empty() ? path_.string() : (path_ / name).string();
    }

    void touch(const std::string& name) const {
        std::filesystem::path p = path_ / name;
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p.string()) << "x";
    }

private:
    std::filesystem::path path_;
};

}
