#include "colorizer.hpp"
#include "errors.hpp"
#include <vector>

cv::Mat IdentityColorizer::colorize(const cv::Mat& bgr, int) {
    return bgr.clone();
}

bool DnnColorizer::load(const DnnModelPaths& paths) {
    cv::FileStorage fs(paths.hullPoints, cv::FileStorage::READ);
    if (!fs.isOpened()) return false;

    cv::Mat pts;
    fs["pts_in_hull"] >> pts;
    if (pts.rows != 313 || pts.cols != 2) return false;

    try {
        net_ = cv::dnn::readNetFromCaffe(paths.prototxt, paths.caffemodel);
    } catch (const cv::Exception&) {
        return false;
    }
    if (net_.empty()) return false;

    // cluster centres as a 2x313x1x1 blob for the ab decoding layer
    cv::Mat hullT;
    pts.convertTo(hullT, CV_32F);
    hullT = hullT.t();
    int sz[] = {2, 313, 1, 1};
    hull_ = hullT.reshape(1, 4, sz).clone();

    net_.getLayer(net_.getLayerId("class8_ab"))->blobs.push_back(hull_);
    net_.getLayer(net_.getLayerId("conv8_313_rh"))->blobs.push_back(cv::Mat(1, 313, CV_32F, cv::Scalar(2.606)));
    return true;
}

cv::Mat DnnColorizer::colorize(const cv::Mat& bgr, int renderFactor) {
    if (net_.empty())
        throw PipelineError(ErrorKind::ModelFailure, "colorization model not loaded");

    cv::Mat img, lab;
    bgr.convertTo(img, CV_32F, 1.0 / 255);
    cv::cvtColor(img, lab, cv::COLOR_BGR2Lab);

    cv::Mat L, input;
    cv::extractChannel(lab, L, 0);
    int side = 16 * renderFactor;
    cv::resize(L, input, cv::Size(side, side));
    input -= 50;

    net_.setInput(cv::dnn::blobFromImage(input));
    cv::Mat result = net_.forward();
    if (result.empty() || result.dims != 4 || result.size[1] != 2)
        throw PipelineError(ErrorKind::ModelFailure, "unexpected network output");

    cv::Size outSize(result.size[3], result.size[2]);
    cv::Mat a(outSize, CV_32F, result.ptr(0, 0));
    cv::Mat b(outSize, CV_32F, result.ptr(0, 1));
    cv::resize(a, a, bgr.size());
    cv::resize(b, b, bgr.size());

    std::vector<cv::Mat> chn{L, a, b};
    cv::merge(chn, lab);

    cv::Mat color;
    cv::cvtColor(lab, color, cv::COLOR_Lab2BGR);
    color.convertTo(color, CV_8U, 255.0);
    return color;
}

ColorizingSource::ColorizingSource(std::unique_ptr<FrameSource> decoder,
                                   std::unique_ptr<Colorizer> colorizer,
                                   int renderFactor)
    : decoder_(std::move(decoder)),
      colorizer_(std::move(colorizer)),
      renderFactor_(renderFactor) {}

bool ColorizingSource::read(cv::Mat& frame) {
    if (!decoder_->read(gray_)) return false;

    frame = colorizer_->colorize(gray_, renderFactor_);
    if (frame.empty())
        throw PipelineError(ErrorKind::ModelFailure, "colorizer returned no frame");
    return true;
}
