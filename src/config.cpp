#include "config.hpp"
#include "errors.hpp"
#include <sstream>

static void configError(const std::string& msg) {
    throw PipelineError(ErrorKind::ConfigError, msg);
}

const char* matchReferenceName(MatchReference ref) {
    return ref == MatchReference::Raw ? "raw" : "processed";
}

bool parseMatchReference(const std::string& text, MatchReference& ref) {
    if (text == "processed") { ref = MatchReference::Processed; return true; }
    if (text == "raw")       { ref = MatchReference::Raw;       return true; }
    return false;
}

int codecFourcc(const std::string& codec) {
    if (codec.size() != 4) configError("codec must be a 4 character FourCC, got '" + codec + "'");
    return cv::VideoWriter::fourcc(codec[0], codec[1], codec[2], codec[3]);
}

bool saveConfig(const std::string& path, const PipelineConfig& cfg) {
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) return false;
    fs << "render_factor" << cfg.renderFactor;
    fs << "saturation_scale" << cfg.saturationScale;
    fs << "clahe_clip_limit" << cfg.claheClipLimit;
    fs << "blend_factor" << cfg.blendFactor;
    fs << "tile_grid_width" << cfg.tileGridSize.width;
    fs << "tile_grid_height" << cfg.tileGridSize.height;
    fs << "match_reference" << std::string(matchReferenceName(cfg.matchReference));
    fs << "codec" << cfg.codec;
    fs << "workers" << cfg.workers;
    return true;
}

bool loadConfig(const std::string& path, PipelineConfig& cfg) {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) return false;

    auto readInt = [&](const char* key, int& v) {
        cv::FileNode n = fs[key];
        if (!n.empty()) n >> v;
    };
    auto readDouble = [&](const char* key, double& v) {
        cv::FileNode n = fs[key];
        if (!n.empty()) n >> v;
    };

    readInt("render_factor", cfg.renderFactor);
    readDouble("saturation_scale", cfg.saturationScale);
    readDouble("clahe_clip_limit", cfg.claheClipLimit);
    readDouble("blend_factor", cfg.blendFactor);
    readInt("tile_grid_width", cfg.tileGridSize.width);
    readInt("tile_grid_height", cfg.tileGridSize.height);
    readInt("workers", cfg.workers);

    cv::FileNode ref = fs["match_reference"];
    if (!ref.empty()) {
        std::string text;
        ref >> text;
        if (!parseMatchReference(text, cfg.matchReference))
            configError("match_reference must be 'processed' or 'raw', got '" + text + "'");
    }

    cv::FileNode codec = fs["codec"];
    if (!codec.empty()) codec >> cfg.codec;

    return true;
}

void validateConfig(const PipelineConfig& cfg) {
    std::ostringstream err;
    if (cfg.renderFactor <= 0)
        err << "render_factor must be positive, got " << cfg.renderFactor;
    else if (!(cfg.saturationScale > 0.0))
        err << "saturation_scale must be > 0, got " << cfg.saturationScale;
    else if (!(cfg.claheClipLimit > 0.0))
        err << "clahe_clip_limit must be > 0, got " << cfg.claheClipLimit;
    else if (!(cfg.blendFactor >= 0.0 && cfg.blendFactor <= 1.0))
        err << "blend_factor must be in [0,1], got " << cfg.blendFactor;
    else if (cfg.tileGridSize.width <= 0 || cfg.tileGridSize.height <= 0)
        err << "tile grid must be positive, got "
            << cfg.tileGridSize.width << "x" << cfg.tileGridSize.height;
    else if (cfg.workers < 1)
        err << "workers must be at least 1, got " << cfg.workers;

    if (!err.str().empty()) configError(err.str());

    codecFourcc(cfg.codec);
}
