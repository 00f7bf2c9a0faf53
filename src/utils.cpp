#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace utils {

std::vector<std::string> glob(const std::string& pattern, bool recursive) {
    std::vector<std::string> files;
    cv::glob(pattern, files, recursive);
    std::sort(files.begin(), files.end());
    return files;
}

bool hasVideoExtension(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return ext == ".mp4" || ext == ".avi" || ext == ".mov" || ext == ".mkv";
}

void putTextInfo(cv::Mat& img, const std::string& text, int line, double scale) {
    int thickness = 2;
    int baseline = 0;
    cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, scale, thickness, &baseline);
    cv::Point org(10, 10 + (line + 1) * (ts.height + baseline + 6));

    // dark outline so the label reads on bright frames too
    cv::putText(img, text, org, cv::FONT_HERSHEY_SIMPLEX, scale, {0,0,0}, thickness + 2);
    cv::putText(img, text, org, cv::FONT_HERSHEY_SIMPLEX, scale, {255,255,255}, thickness);
}

}
